#include "stash/image/errors.hpp"

#include <format>


namespace {

    template <typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

}  // namespace


namespace stash {

    std::string to_str(const ChunkTypeError& err) {
        return std::visit(
            ::Overloaded{
                [](const InvalidTypeLength& e) {
                    return std::format(
                        "Chunk type must be exactly 4 characters, got {}",
                        e.actual_
                    );
                },
                [](const InvalidTypeChar& e) {
                    return std::format(
                        "Invalid character 0x{:02X} at index {} of chunk "
                        "type, must be an ASCII letter",
                        e.byte_,
                        e.index_
                    );
                },
            },
            err
        );
    }

    std::string to_str(const ChunkError& err) {
        return std::visit(
            ::Overloaded{
                [](const LengthTooLarge& e) {
                    return std::format(
                        "Chunk length too large: {} bytes required, {} "
                        "available",
                        e.required_,
                        e.available_
                    );
                },
                [](const NotEnoughBytes& e) {
                    return std::format(
                        "Not enough bytes for a chunk: {} available, {} "
                        "required",
                        e.available_,
                        e.required_
                    );
                },
                [](const RemainingBytes& e) {
                    return std::format(
                        "{} bytes remaining after chunk, length is likely "
                        "incorrect",
                        e.extra_
                    );
                },
                [](const CrcMismatch& e) {
                    return std::format(
                        "CRC mismatch: stored 0x{:08X}, computed 0x{:08X}",
                        e.stored_,
                        e.computed_
                    );
                },
                [](const InvalidUtf8& e) {
                    return std::format(
                        "Chunk data is not valid UTF-8 (byte offset {})",
                        e.offset_
                    );
                },
                [](const ChunkTypeError& e) { return to_str(e); },
            },
            err
        );
    }

    std::string to_str(const PngError& err) {
        return std::visit(
            ::Overloaded{
                [](const SignatureMismatch& e) {
                    return std::format(
                        "PNG signature mismatch ({} bytes available)",
                        e.available_
                    );
                },
                [](const TruncatedStream& e) {
                    return std::format(
                        "Truncated stream at offset {}: {} trailing bytes "
                        "do not form a chunk",
                        e.offset_,
                        e.remaining_
                    );
                },
                [](const ChunkNotFound& e) {
                    return std::format("No chunk of type '{}' found", e.type_);
                },
                [](const BadChunk& e) {
                    return std::format(
                        "Chunk #{} at offset {}: {}",
                        e.index_,
                        e.offset_,
                        to_str(e.error_)
                    );
                },
            },
            err
        );
    }

}  // namespace stash
