#pragma once

#include <expected>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "args.hpp"
#include "stash/auxiliary/cli_configs.hpp"
#include "stash/auxiliary/err_str.hpp"
#include "stash/image/png_doc.hpp"


namespace stash {

    struct TextChunkInfo {
        size_t index_;
        std::string type_;
        std::string text_;
    };

    // Chunks whose data is valid UTF-8 of at least `min_length` bytes
    std::vector<TextChunkInfo> collect_text_chunks(
        const PngDoc& doc, size_t min_length
    );

    std::expected<std::string, std::string> decode_message(
        const PngDoc& doc, const ChunkType& type
    );

    nlohmann::json describe_png(const PngDoc& doc, const CliConfigs& configs);

    std::string hex_preview(const std::vector<uint8_t>& data, size_t max_bytes);


    ErrStr execute_encode(const EncodeArgs& args, const CliConfigs& configs);
    ErrStr execute_decode(const DecodeArgs& args, const CliConfigs& configs);
    ErrStr execute_remove(const RemoveArgs& args, const CliConfigs& configs);
    ErrStr execute_identify_text(
        const IdentifyTextArgs& args, const CliConfigs& configs
    );
    ErrStr execute_print(const PrintArgs& args, const CliConfigs& configs);

    ErrStr execute_command(const Command& command, const CliConfigs& configs);

}  // namespace stash
