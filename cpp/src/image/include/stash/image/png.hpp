#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include <png.h>


namespace stash {

    // Image header and text pairs as libpng reports them
    struct PngMeta {
        struct TextKV {
            std::string key;
            std::string value;
        };

        const TextKV* find_text_chunk(const std::string& key) const {
            for (const auto& kv : text) {
                if (kv.key == key)
                    return &kv;
            }
            return nullptr;
        }

        uint32_t width = 0;
        uint32_t height = 0;
        int bit_depth = 0;
        int color_type = 0;
        std::vector<TextKV> text;
        std::vector<std::string> warnings;
    };


    // Reads up to the first IDAT chunk. No pixel data is decoded.
    std::expected<PngMeta, std::string> read_png_meta(
        const uint8_t* data, size_t size
    );

    const char* color_type_str(int color_type);

}  // namespace stash
