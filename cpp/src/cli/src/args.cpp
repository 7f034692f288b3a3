#include "args.hpp"

#include <format>

#include "stash/auxiliary/err_str.hpp"


namespace {

    struct RawArgs {
        std::vector<std::string> positionals_;
        std::optional<std::string> config_path_;
        bool json_ = false;
        bool help_ = false;
    };


    std::expected<RawArgs, std::string> split_args(
        const std::vector<std::string>& args
    ) {
        RawArgs out;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];

            if (arg == "-h" || arg == "--help") {
                out.help_ = true;
            } else if (arg == "--json") {
                out.json_ = true;
            } else if (arg == "--config") {
                if (i + 1 >= args.size())
                    return std::unexpected("Missing value for --config");
                out.config_path_ = args[++i];
            } else if (arg.starts_with("--")) {
                return std::unexpected("Unknown option: " + arg);
            } else {
                out.positionals_.push_back(arg);
            }
        }

        return out;
    }

    stash::ErrStr check_arg_count(
        const std::string& command,
        const size_t count,
        const size_t min_count,
        const size_t max_count
    ) {
        if (count < min_count) {
            return std::unexpected(
                std::format("Too few arguments for '{}'", command)
            );
        }
        if (count > max_count) {
            return std::unexpected(
                std::format("Too many arguments for '{}'", command)
            );
        }
        return {};
    }

    std::expected<stash::ChunkType, std::string> parse_chunk_type(
        const std::string& text
    ) {
        const auto type = stash::ChunkType::parse(text);
        if (!type) {
            return std::unexpected(
                std::format(
                    "Invalid chunk type '{}': {}",
                    text,
                    stash::to_str(type.error())
                )
            );
        }
        return *type;
    }

    std::optional<stash::Path> optional_path(
        const std::vector<std::string>& p, const size_t index
    ) {
        if (index < p.size())
            return stash::fromstr(p[index]);
        return std::nullopt;
    }

    std::expected<stash::Command, std::string> build_command(
        const RawArgs& raw
    ) {
        const auto& p = raw.positionals_;
        if (raw.help_)
            return stash::HelpArgs{};
        if (p.empty())
            return std::unexpected("No command given");

        const auto& name = p[0];
        const auto argc = p.size() - 1;

        if (raw.json_ && name != "print")
            return std::unexpected("--json is only valid for 'print'");

        if (name == "encode") {
            if (auto res = ::check_arg_count(name, argc, 3, 4); !res)
                return std::unexpected(res.error());
            const auto type = ::parse_chunk_type(p[2]);
            if (!type)
                return std::unexpected(type.error());

            return stash::EncodeArgs{
                stash::fromstr(p[1]), *type, p[3], ::optional_path(p, 4)
            };
        } else if (name == "decode") {
            if (auto res = ::check_arg_count(name, argc, 2, 2); !res)
                return std::unexpected(res.error());
            const auto type = ::parse_chunk_type(p[2]);
            if (!type)
                return std::unexpected(type.error());

            return stash::DecodeArgs{ stash::fromstr(p[1]), *type };
        } else if (name == "remove") {
            if (auto res = ::check_arg_count(name, argc, 2, 3); !res)
                return std::unexpected(res.error());
            const auto type = ::parse_chunk_type(p[2]);
            if (!type)
                return std::unexpected(type.error());

            return stash::RemoveArgs{
                stash::fromstr(p[1]), *type, ::optional_path(p, 3)
            };
        } else if (name == "identify-text") {
            if (auto res = ::check_arg_count(name, argc, 1, 1); !res)
                return std::unexpected(res.error());

            return stash::IdentifyTextArgs{ stash::fromstr(p[1]) };
        } else if (name == "print") {
            if (auto res = ::check_arg_count(name, argc, 1, 1); !res)
                return std::unexpected(res.error());

            return stash::PrintArgs{ stash::fromstr(p[1]), raw.json_ };
        }

        return std::unexpected("Unknown command: " + name);
    }

}  // namespace


namespace stash {

    std::expected<AppArgs, std::string> parse_args(
        const std::vector<std::string>& args
    ) {
        const auto raw = ::split_args(args);
        if (!raw)
            return std::unexpected(raw.error());

        auto command = ::build_command(*raw);
        if (!command)
            return std::unexpected(command.error());

        AppArgs out{ std::move(*command), std::nullopt };
        if (raw->config_path_)
            out.config_path_ = stash::fromstr(*raw->config_path_);
        return out;
    }

    std::string usage_str(const std::string& program_name) {
        return std::format(
            "Usage: {0} [--config <path>] <command> ...\n"
            "\n"
            "Commands:\n"
            "  encode <file> <chunk_type> <message> [output]\n"
            "      Add a message to a PNG file\n"
            "  decode <file> <chunk_type>\n"
            "      Print the message of the first chunk of a type\n"
            "  remove <file> <chunk_type> [output]\n"
            "      Remove the first chunk of a type\n"
            "  identify-text <file>\n"
            "      List the chunks whose data is UTF-8 text\n"
            "  print <file> [--json]\n"
            "      Show the image header and every chunk\n"
            "\n"
            "Without [output], the result is written as configured by "
            "'overwrite_input'.",
            program_name
        );
    }

}  // namespace stash
