#include "stash/image/chunk.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <stdexcept>

#include "stash/image/crc32.hpp"


namespace {

    uint32_t read_u32_be(const uint8_t* src) {
        return (static_cast<uint32_t>(src[0]) << 24) |
               (static_cast<uint32_t>(src[1]) << 16) |
               (static_cast<uint32_t>(src[2]) << 8) |
               (static_cast<uint32_t>(src[3]));
    }

    void append_u32_be(std::vector<uint8_t>& out, const uint32_t value) {
        out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    uint32_t calc_chunk_crc(
        const stash::ChunkType& type, const uint8_t* data, size_t size
    ) {
        const auto& type_bytes = type.bytes();
        auto crc = stash::update_crc32(
            stash::CRC32_INIT, type_bytes.data(), type_bytes.size()
        );
        crc = stash::update_crc32(crc, data, size);
        return crc ^ stash::CRC32_INIT;
    }

    // Offset of the first byte that starts an ill-formed sequence. Overlong
    // forms, surrogates and code points above U+10FFFF are rejected.
    std::optional<size_t> find_invalid_utf8(const std::vector<uint8_t>& s) {
        size_t i = 0;
        const size_t size = s.size();

        while (i < size) {
            const uint8_t c = s[i];

            if (c < 0x80) {
                ++i;
                continue;
            }

            size_t need = 0;
            uint8_t lo = 0x80;
            uint8_t hi = 0xBF;

            if (c >= 0xC2 && c <= 0xDF) {
                need = 1;
            } else if (c == 0xE0) {
                need = 2;
                lo = 0xA0;
            } else if (c >= 0xE1 && c <= 0xEC) {
                need = 2;
            } else if (c == 0xED) {
                need = 2;
                hi = 0x9F;
            } else if (c >= 0xEE && c <= 0xEF) {
                need = 2;
            } else if (c == 0xF0) {
                need = 3;
                lo = 0x90;
            } else if (c >= 0xF1 && c <= 0xF3) {
                need = 3;
            } else if (c == 0xF4) {
                need = 3;
                hi = 0x8F;
            } else {
                return i;
            }

            if (need > size - i - 1)
                return i;

            // Only the first continuation byte has a narrowed range
            if (s[i + 1] < lo || s[i + 1] > hi)
                return i;
            for (size_t k = 2; k <= need; ++k) {
                if (s[i + k] < 0x80 || s[i + k] > 0xBF)
                    return i;
            }

            i += need + 1;
        }

        return std::nullopt;
    }

}  // namespace


namespace stash {

    Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
        : type_(type), data_(std::move(data)) {
        if (data_.size() > MAX_LENGTH) {
            throw std::length_error(
                std::format(
                    "Chunk data of {} bytes exceeds the {} byte limit",
                    data_.size(),
                    MAX_LENGTH
                )
            );
        }

        length_ = static_cast<uint32_t>(data_.size());
        crc_ = ::calc_chunk_crc(type_, data_.data(), data_.size());
    }

    Chunk::Chunk(
        const ChunkType& type,
        std::vector<uint8_t> data,
        const uint32_t length,
        const uint32_t crc
    )
        : length_(length), type_(type), data_(std::move(data)), crc_(crc) {}

    std::expected<Chunk, ChunkError> Chunk::from_str(
        const std::string_view type_text, const std::string_view text
    ) {
        const auto type = ChunkType::parse(type_text);
        if (!type)
            return std::unexpected(type.error());

        return Chunk{ *type, std::vector<uint8_t>(text.begin(), text.end()) };
    }

    std::expected<std::span<const uint8_t>, ChunkError> Chunk::slice_next(
        const std::span<const uint8_t> stream
    ) {
        if (stream.size() < OVERHEAD_SIZE)
            return std::unexpected(
                NotEnoughBytes{ stream.size(), OVERHEAD_SIZE }
            );

        const uint64_t length = ::read_u32_be(stream.data());
        const uint64_t total = OVERHEAD_SIZE + length;
        if (total > stream.size())
            return std::unexpected(LengthTooLarge{ total, stream.size() });

        return stream.first(static_cast<size_t>(total));
    }

    std::expected<Chunk, ChunkError> Chunk::decode(
        const std::span<const uint8_t> record
    ) {
        if (record.size() < OVERHEAD_SIZE)
            return std::unexpected(
                NotEnoughBytes{ record.size(), OVERHEAD_SIZE }
            );

        const auto length = ::read_u32_be(record.data());
        if (length > MAX_LENGTH)
            return std::unexpected(LengthTooLarge{ length, MAX_LENGTH });

        const size_t total = OVERHEAD_SIZE + length;
        if (record.size() < total)
            return std::unexpected(NotEnoughBytes{ record.size(), total });
        if (record.size() > total)
            return std::unexpected(RemainingBytes{ record.size() - total });

        // Integrity first, so any corruption of type or data reads as a CRC
        // mismatch
        const auto stored_crc = ::read_u32_be(record.data() + 8 + length);
        const auto computed_crc = stash::calc_crc32(
            record.data() + 4, 4 + size_t{ length }
        );
        if (stored_crc != computed_crc)
            return std::unexpected(CrcMismatch{ stored_crc, computed_crc });

        ChunkType::Bytes type_bytes;
        std::copy_n(record.begin() + 4, type_bytes.size(), type_bytes.begin());
        const auto type = ChunkType::from_bytes(type_bytes);
        if (!type)
            return std::unexpected(type.error());

        const auto data_begin = record.begin() + 8;
        std::vector<uint8_t> data(data_begin, data_begin + length);

        return Chunk{ *type, std::move(data), length, stored_crc };
    }

    std::expected<std::string, ChunkError> Chunk::text() const {
        if (const auto bad_offset = ::find_invalid_utf8(data_))
            return std::unexpected(InvalidUtf8{ *bad_offset });

        return std::string(data_.begin(), data_.end());
    }

    std::vector<uint8_t> Chunk::serialize() const {
        std::vector<uint8_t> out;
        out.reserve(this->serialized_size());
        this->serialize_to(out);
        return out;
    }

    void Chunk::serialize_to(std::vector<uint8_t>& out) const {
        const auto& type_bytes = type_.bytes();

        ::append_u32_be(out, length_);
        out.insert(out.end(), type_bytes.begin(), type_bytes.end());
        out.insert(out.end(), data_.begin(), data_.end());
        ::append_u32_be(out, crc_);
    }

    std::string Chunk::to_str() const {
        return std::format(
            "{} ({} bytes, crc 0x{:08X})", type_.to_str(), length_, crc_
        );
    }

}  // namespace stash
