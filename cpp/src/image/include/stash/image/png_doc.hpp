#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "stash/auxiliary/err_str.hpp"
#include "stash/auxiliary/path.hpp"
#include "stash/image/chunk.hpp"
#include "stash/image/errors.hpp"


namespace stash {

    // A PNG stream as its signature plus an ordered list of chunks. Chunk
    // payloads are kept opaque, pixel data is never decoded.
    class PngDoc {

    public:
        using Signature = std::array<uint8_t, 8>;

        static constexpr Signature SIGNATURE = {
            0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A
        };

    public:
        PngDoc() = default;
        explicit PngDoc(std::vector<Chunk> chunks);

        // All or nothing: no partially filled document is ever returned
        static std::expected<PngDoc, PngError> parse(
            std::span<const uint8_t> bytes
        );

        std::vector<uint8_t> serialize() const;

        // First chunk whose type reads `type_text`, nullptr if there is none
        const Chunk* find_chunk(std::string_view type_text) const;

        // Duplicated types are allowed
        void append_chunk(Chunk chunk);

        // Removes and returns the first chunk whose type reads `type_text`.
        // Later chunks keep their order.
        std::expected<Chunk, PngError> remove_chunk(std::string_view type_text);

        const Signature& signature() const { return SIGNATURE; }
        const std::vector<Chunk>& chunks() const { return chunks_; }

        bool operator==(const PngDoc&) const = default;

    private:
        std::vector<Chunk> chunks_;
    };


    std::expected<PngDoc, std::string> read_png_doc(const Path& path);

    ErrStr write_png_doc(const Path& path, const PngDoc& doc);

}  // namespace stash
