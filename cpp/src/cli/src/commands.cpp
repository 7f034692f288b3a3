#include "commands.hpp"

#include <algorithm>
#include <format>
#include <print>

#include "stash/image/png.hpp"


namespace {

    template <typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };


    stash::Path output_path_for(
        const std::optional<stash::Path>& output_path,
        const stash::Path& input_path,
        const stash::CliConfigs& configs
    ) {
        if (output_path)
            return *output_path;
        return configs.resolve_output_path(input_path);
    }

    stash::ErrStr save_doc(const stash::Path& path, const stash::PngDoc& doc) {
        std::println("Writing out file to {}", stash::tostr(path));
        return stash::write_png_doc(path, doc);
    }

    std::string property_flags_str(const stash::ChunkType& type) {
        return std::format(
            "{}, {}, {}",
            type.is_critical() ? "critical" : "ancillary",
            type.is_public() ? "public" : "private",
            type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy"
        );
    }

}  // namespace


// Helpers
namespace stash {

    std::vector<TextChunkInfo> collect_text_chunks(
        const PngDoc& doc, const size_t min_length
    ) {
        std::vector<TextChunkInfo> out;

        const auto& chunks = doc.chunks();
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            if (chunk.length() == 0 || chunk.length() < min_length)
                continue;

            auto text = chunk.text();
            if (!text)
                continue;

            out.push_back({ i, chunk.type().to_str(), std::move(*text) });
        }

        return out;
    }

    std::expected<std::string, std::string> decode_message(
        const PngDoc& doc, const ChunkType& type
    ) {
        const auto type_str = type.to_str();

        const auto chunk = doc.find_chunk(type_str);
        if (!chunk)
            return std::unexpected(stash::to_str(ChunkNotFound{ type_str }));

        auto text = chunk->text();
        if (!text) {
            return std::unexpected(
                std::format(
                    "Failed to decode message from {}: {}",
                    type_str,
                    stash::to_str(text.error())
                )
            );
        }

        return std::move(*text);
    }

    nlohmann::json describe_png(const PngDoc& doc, const CliConfigs& configs) {
        auto output = nlohmann::json::object();

        {
            const auto bytes = doc.serialize();
            const auto meta = stash::read_png_meta(bytes.data(), bytes.size());
            if (meta) {
                auto header = nlohmann::json::object();
                header["width"] = meta->width;
                header["height"] = meta->height;
                header["bit_depth"] = meta->bit_depth;
                header["color_type"] = stash::color_type_str(meta->color_type);
                output["header"] = header;
            } else {
                output["header"] = nullptr;
                output["header_error"] = meta.error();
            }
            output["file_size"] = bytes.size();
        }

        auto chunks = nlohmann::json::array();
        const auto preview_size = static_cast<size_t>(
            configs.print_preview_bytes_
        );
        for (const auto& chunk : doc.chunks()) {
            const auto& type = chunk.type();

            auto entry = nlohmann::json::object();
            entry["type"] = type.to_str();
            entry["length"] = chunk.length();
            entry["crc"] = std::format("0x{:08X}", chunk.crc());
            entry["critical"] = type.is_critical();
            entry["public"] = type.is_public();
            entry["reserved_bit_valid"] = type.is_reserved_bit_valid();
            entry["safe_to_copy"] = type.is_safe_to_copy();
            entry["preview"] = stash::hex_preview(chunk.data(), preview_size);
            chunks.push_back(entry);
        }
        output["chunks"] = chunks;

        return output;
    }

    std::string hex_preview(
        const std::vector<uint8_t>& data, const size_t max_bytes
    ) {
        std::string out;

        const auto count = std::min(data.size(), max_bytes);
        for (size_t i = 0; i < count; ++i) {
            if (i > 0)
                out += ' ';
            out += std::format("{:02X}", data[i]);
        }
        if (data.size() > count)
            out += out.empty() ? "..." : " ...";

        return out;
    }

}  // namespace stash


// Commands
namespace stash {

    ErrStr execute_encode(const EncodeArgs& args, const CliConfigs& configs) {
        auto doc = stash::read_png_doc(args.file_path_);
        if (!doc)
            return std::unexpected("Failed to load PNG: " + doc.error());

        doc->append_chunk(
            Chunk{ args.chunk_type_,
                   std::vector<uint8_t>(
                       args.message_.begin(), args.message_.end()
                   ) }
        );

        const auto out_path = ::output_path_for(
            args.output_path_, args.file_path_, configs
        );
        return ::save_doc(out_path, *doc);
    }

    ErrStr execute_decode(const DecodeArgs& args, const CliConfigs& configs) {
        const auto doc = stash::read_png_doc(args.file_path_);
        if (!doc)
            return std::unexpected("Failed to load PNG: " + doc.error());

        const auto message = stash::decode_message(*doc, args.chunk_type_);
        if (!message)
            return std::unexpected(message.error());

        std::println("{}", *message);
        return {};
    }

    ErrStr execute_remove(const RemoveArgs& args, const CliConfigs& configs) {
        auto doc = stash::read_png_doc(args.file_path_);
        if (!doc)
            return std::unexpected("Failed to load PNG: " + doc.error());

        const auto removed = doc->remove_chunk(args.chunk_type_.to_str());
        if (!removed)
            return std::unexpected(stash::to_str(removed.error()));

        std::println("Removed chunk {}", removed->to_str());

        const auto out_path = ::output_path_for(
            args.output_path_, args.file_path_, configs
        );
        return ::save_doc(out_path, *doc);
    }

    ErrStr execute_identify_text(
        const IdentifyTextArgs& args, const CliConfigs& configs
    ) {
        const auto doc = stash::read_png_doc(args.file_path_);
        if (!doc)
            return std::unexpected("Failed to load PNG: " + doc.error());

        const auto min_length = static_cast<size_t>(
            configs.identify_text_min_length_
        );
        for (const auto& info : stash::collect_text_chunks(*doc, min_length))
            std::println("{} - {} - {}", info.index_, info.type_, info.text_);

        return {};
    }

    ErrStr execute_print(const PrintArgs& args, const CliConfigs& configs) {
        const auto doc = stash::read_png_doc(args.file_path_);
        if (!doc)
            return std::unexpected("Failed to load PNG: " + doc.error());

        const auto desc = stash::describe_png(*doc, configs);
        if (args.json_) {
            std::println("{}", desc.dump(configs.json_indent_));
            return {};
        }

        std::println("File: {}", stash::tostr(args.file_path_));
        std::println("Size: {} bytes", desc.at("file_size").get<size_t>());

        const auto& header = desc.at("header");
        if (header.is_null()) {
            std::println(
                "Header: unavailable ({})",
                desc.at("header_error").get<std::string>()
            );
        } else {
            std::println(
                "Header: {}x{}, {} bit, {}",
                header.at("width").get<uint32_t>(),
                header.at("height").get<uint32_t>(),
                header.at("bit_depth").get<int>(),
                header.at("color_type").get<std::string>()
            );
        }

        const auto& chunks = doc->chunks();
        std::println("Chunks: {}", chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            std::println(
                "  #{} {} [{}]",
                i,
                chunk.to_str(),
                ::property_flags_str(chunk.type())
            );

            const auto preview = desc.at("chunks")
                                     .at(i)
                                     .at("preview")
                                     .get<std::string>();
            if (!preview.empty())
                std::println("      {}", preview);
        }

        return {};
    }

    ErrStr execute_command(const Command& command, const CliConfigs& configs) {
        return std::visit(
            ::Overloaded{
                [](const HelpArgs&) -> ErrStr {
                    std::println("{}", stash::usage_str("pngstash"));
                    return {};
                },
                [&](const EncodeArgs& a) { return execute_encode(a, configs); },
                [&](const DecodeArgs& a) { return execute_decode(a, configs); },
                [&](const RemoveArgs& a) { return execute_remove(a, configs); },
                [&](const IdentifyTextArgs& a) {
                    return execute_identify_text(a, configs);
                },
                [&](const PrintArgs& a) { return execute_print(a, configs); },
            },
            command
        );
    }

}  // namespace stash
