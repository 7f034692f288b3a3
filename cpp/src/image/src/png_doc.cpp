#include "stash/image/png_doc.hpp"

#include <algorithm>

#include "stash/auxiliary/filesys.hpp"


namespace {

    enum class ParseState {
        awaiting_signature,
        reading_chunks,
        complete,
    };


    bool chunk_type_equals(
        const stash::Chunk& chunk, const std::string_view type_text
    ) {
        const auto& bytes = chunk.type().bytes();
        return std::equal(
            bytes.begin(), bytes.end(), type_text.begin(), type_text.end()
        );
    }

}  // namespace


namespace stash {

    PngDoc::PngDoc(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    std::expected<PngDoc, PngError> PngDoc::parse(
        const std::span<const uint8_t> bytes
    ) {
        std::vector<Chunk> chunks;
        size_t cursor = 0;
        auto state = ::ParseState::awaiting_signature;

        while (state != ::ParseState::complete) {
            switch (state) {
                case ::ParseState::awaiting_signature: {
                    const bool has_signature =
                        bytes.size() >= SIGNATURE.size() &&
                        std::equal(
                            SIGNATURE.begin(), SIGNATURE.end(), bytes.begin()
                        );
                    if (!has_signature)
                        return std::unexpected(
                            SignatureMismatch{ bytes.size() }
                        );

                    cursor = SIGNATURE.size();
                    state = ::ParseState::reading_chunks;
                    break;
                }
                case ::ParseState::reading_chunks: {
                    if (cursor == bytes.size()) {
                        state = ::ParseState::complete;
                        break;
                    }

                    const auto rest = bytes.subspan(cursor);
                    const auto record = Chunk::slice_next(rest);
                    if (!record)
                        return std::unexpected(
                            TruncatedStream{ cursor, rest.size() }
                        );

                    auto chunk = Chunk::decode(*record);
                    if (!chunk) {
                        return std::unexpected(
                            BadChunk{ chunks.size(), cursor, chunk.error() }
                        );
                    }

                    chunks.push_back(std::move(*chunk));
                    cursor += record->size();
                    break;
                }
                case ::ParseState::complete:
                    break;
            }
        }

        return PngDoc{ std::move(chunks) };
    }

    std::vector<uint8_t> PngDoc::serialize() const {
        size_t total = SIGNATURE.size();
        for (const auto& chunk : chunks_)
            total += chunk.serialized_size();

        std::vector<uint8_t> out;
        out.reserve(total);
        out.insert(out.end(), SIGNATURE.begin(), SIGNATURE.end());
        for (const auto& chunk : chunks_)
            chunk.serialize_to(out);

        return out;
    }

    const Chunk* PngDoc::find_chunk(const std::string_view type_text) const {
        for (const auto& chunk : chunks_) {
            if (::chunk_type_equals(chunk, type_text))
                return &chunk;
        }
        return nullptr;
    }

    void PngDoc::append_chunk(Chunk chunk) {
        chunks_.push_back(std::move(chunk));
    }

    std::expected<Chunk, PngError> PngDoc::remove_chunk(
        const std::string_view type_text
    ) {
        const auto it = std::find_if(
            chunks_.begin(), chunks_.end(), [&](const Chunk& chunk) {
                return ::chunk_type_equals(chunk, type_text);
            }
        );
        if (it == chunks_.end())
            return std::unexpected(ChunkNotFound{ std::string(type_text) });

        auto removed = std::move(*it);
        chunks_.erase(it);
        return removed;
    }

}  // namespace stash


// Free functions
namespace stash {

    std::expected<PngDoc, std::string> read_png_doc(const Path& path) {
        std::vector<uint8_t> content;
        if (!stash::read_file(path, content))
            return std::unexpected("Failed to read file: " + stash::tostr(path));

        auto doc = PngDoc::parse(content);
        if (!doc) {
            return std::unexpected(
                stash::tostr(path) + ": " + stash::to_str(doc.error())
            );
        }

        return std::move(*doc);
    }

    ErrStr write_png_doc(const Path& path, const PngDoc& doc) {
        const auto bytes = doc.serialize();
        if (!stash::write_file(path, bytes))
            return std::unexpected("Failed to write file: " + stash::tostr(path));

        return {};
    }

}  // namespace stash
