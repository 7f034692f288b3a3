#include "stash/image/chunk_type.hpp"


namespace {

    constexpr uint8_t PROPERTY_BIT = 0x20;

    constexpr bool is_ascii_letter(const uint8_t c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    constexpr bool is_property_bit_set(const uint8_t c) {
        return (c & PROPERTY_BIT) != 0;
    }

}  // namespace


namespace stash {

    std::expected<ChunkType, ChunkTypeError> ChunkType::parse(
        const std::string_view text
    ) {
        if (text.size() != 4)
            return std::unexpected(InvalidTypeLength{ text.size() });

        Bytes bytes;
        for (size_t i = 0; i < bytes.size(); ++i)
            bytes[i] = static_cast<uint8_t>(text[i]);

        return ChunkType::from_bytes(bytes);
    }

    std::expected<ChunkType, ChunkTypeError> ChunkType::from_bytes(
        const Bytes& bytes
    ) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (!::is_ascii_letter(bytes[i]))
                return std::unexpected(InvalidTypeChar{ i, bytes[i] });
        }

        return ChunkType{ bytes };
    }

    std::string ChunkType::to_str() const {
        return std::string(bytes_.begin(), bytes_.end());
    }

    bool ChunkType::is_critical() const {
        return !::is_property_bit_set(bytes_[0]);
    }

    bool ChunkType::is_public() const {
        return !::is_property_bit_set(bytes_[1]);
    }

    bool ChunkType::is_reserved_bit_valid() const {
        return ::is_property_bit_set(bytes_[2]);
    }

    bool ChunkType::is_safe_to_copy() const {
        return ::is_property_bit_set(bytes_[3]);
    }

}  // namespace stash
