#pragma once

#include <cstdint>
#include <string>
#include <variant>


namespace stash {

    // Chunk type errors

    struct InvalidTypeLength {
        bool operator==(const InvalidTypeLength&) const = default;

        size_t actual_ = 0;
    };

    struct InvalidTypeChar {
        bool operator==(const InvalidTypeChar&) const = default;

        size_t index_ = 0;
        uint8_t byte_ = 0;
    };

    using ChunkTypeError = std::variant<InvalidTypeLength, InvalidTypeChar>;


    // Chunk record errors

    struct LengthTooLarge {
        bool operator==(const LengthTooLarge&) const = default;

        uint64_t required_ = 0;
        uint64_t available_ = 0;
    };

    struct NotEnoughBytes {
        bool operator==(const NotEnoughBytes&) const = default;

        size_t available_ = 0;
        size_t required_ = 0;
    };

    struct RemainingBytes {
        bool operator==(const RemainingBytes&) const = default;

        size_t extra_ = 0;
    };

    struct CrcMismatch {
        bool operator==(const CrcMismatch&) const = default;

        uint32_t stored_ = 0;
        uint32_t computed_ = 0;
    };

    struct InvalidUtf8 {
        bool operator==(const InvalidUtf8&) const = default;

        // First byte of the offending sequence
        size_t offset_ = 0;
    };

    using ChunkError = std::variant<
        LengthTooLarge,
        NotEnoughBytes,
        RemainingBytes,
        CrcMismatch,
        InvalidUtf8,
        ChunkTypeError>;


    // Document errors

    struct SignatureMismatch {
        bool operator==(const SignatureMismatch&) const = default;

        size_t available_ = 0;
    };

    struct TruncatedStream {
        bool operator==(const TruncatedStream&) const = default;

        size_t offset_ = 0;
        size_t remaining_ = 0;
    };

    struct ChunkNotFound {
        bool operator==(const ChunkNotFound&) const = default;

        std::string type_;
    };

    // A record in the middle of the stream failed to decode
    struct BadChunk {
        bool operator==(const BadChunk&) const = default;

        size_t index_ = 0;
        size_t offset_ = 0;
        ChunkError error_;
    };

    using PngError = std::variant<
        SignatureMismatch,
        TruncatedStream,
        ChunkNotFound,
        BadChunk>;


    std::string to_str(const ChunkTypeError& err);
    std::string to_str(const ChunkError& err);
    std::string to_str(const PngError& err);

}  // namespace stash
