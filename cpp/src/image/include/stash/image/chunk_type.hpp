#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "stash/image/errors.hpp"


namespace stash {

    /*
     * Four ASCII letters naming a chunk. The case of each letter encodes a
     * property bit (bit 5, 0x20):
     *   byte 0: ancillary bit
     *   byte 1: private bit
     *   byte 2: reserved bit
     *   byte 3: safe-to-copy bit
     *
     * An instance only exists if all 4 bytes are letters.
     */
    class ChunkType {

    public:
        using Bytes = std::array<uint8_t, 4>;

        static std::expected<ChunkType, ChunkTypeError> parse(
            std::string_view text
        );
        static std::expected<ChunkType, ChunkTypeError> from_bytes(
            const Bytes& bytes
        );

        const Bytes& bytes() const { return bytes_; }
        std::string to_str() const;

        bool is_critical() const;
        bool is_public() const;
        // True when the third letter is lowercase
        bool is_reserved_bit_valid() const;
        bool is_safe_to_copy() const;

        bool operator==(const ChunkType&) const = default;

    private:
        explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}

        Bytes bytes_;
    };

}  // namespace stash
