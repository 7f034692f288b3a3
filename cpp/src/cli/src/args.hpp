#pragma once

#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "stash/auxiliary/path.hpp"
#include "stash/image/chunk_type.hpp"


namespace stash {

    struct HelpArgs {};

    struct EncodeArgs {
        Path file_path_;
        ChunkType chunk_type_;
        std::string message_;
        std::optional<Path> output_path_;
    };

    struct DecodeArgs {
        Path file_path_;
        ChunkType chunk_type_;
    };

    // Only the first chunk of the type is removed
    struct RemoveArgs {
        Path file_path_;
        ChunkType chunk_type_;
        std::optional<Path> output_path_;
    };

    struct IdentifyTextArgs {
        Path file_path_;
    };

    struct PrintArgs {
        Path file_path_;
        bool json_ = false;
    };

    using Command = std::variant<
        HelpArgs,
        EncodeArgs,
        DecodeArgs,
        RemoveArgs,
        IdentifyTextArgs,
        PrintArgs>;


    struct AppArgs {
        Command command_;
        std::optional<Path> config_path_;
    };


    // `args` excludes the program name
    std::expected<AppArgs, std::string> parse_args(
        const std::vector<std::string>& args
    );

    std::string usage_str(const std::string& program_name);

}  // namespace stash
