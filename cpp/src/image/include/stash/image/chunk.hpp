#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stash/image/chunk_type.hpp"
#include "stash/image/errors.hpp"


namespace stash {

    /*
     * One PNG chunk record. Serialized layout:
     *   length (4, big endian) | type (4) | data (length) | crc (4, big endian)
     *
     * CRC covers the type and data bytes. It is computed on construction and
     * verified on decode, so `crc()` always matches the record's contents.
     */
    class Chunk {

    public:
        // Length field, type and CRC
        static constexpr size_t OVERHEAD_SIZE = 12;
        // Lengths use 31 bits only
        static constexpr uint32_t MAX_LENGTH = 0x7FFFFFFF;

        // Throws std::length_error if `data` has more than MAX_LENGTH bytes
        Chunk(const ChunkType& type, std::vector<uint8_t> data);

        // Chunk holding the raw bytes of `text`
        static std::expected<Chunk, ChunkError> from_str(
            std::string_view type_text, std::string_view text
        );

        // Byte range of the record at the front of `stream`, not decoded
        static std::expected<std::span<const uint8_t>, ChunkError> slice_next(
            std::span<const uint8_t> stream
        );

        // `record` must hold exactly one record, no trailing bytes
        static std::expected<Chunk, ChunkError> decode(
            std::span<const uint8_t> record
        );

        uint32_t length() const { return length_; }
        const ChunkType& type() const { return type_; }
        const std::vector<uint8_t>& data() const { return data_; }
        uint32_t crc() const { return crc_; }

        std::expected<std::string, ChunkError> text() const;

        std::vector<uint8_t> serialize() const;
        void serialize_to(std::vector<uint8_t>& out) const;

        // Size of `serialize()` output
        size_t serialized_size() const { return OVERHEAD_SIZE + length_; }

        // One-line summary like "IHDR (13 bytes, crc 0x3A7E9B55)"
        std::string to_str() const;

        bool operator==(const Chunk&) const = default;

    private:
        Chunk(
            const ChunkType& type,
            std::vector<uint8_t> data,
            uint32_t length,
            uint32_t crc
        );

        uint32_t length_;
        ChunkType type_;
        std::vector<uint8_t> data_;
        uint32_t crc_;
    };

}  // namespace stash
