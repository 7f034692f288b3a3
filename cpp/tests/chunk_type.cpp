#include "stash/image/chunk_type.hpp"

#include "test_util.hpp"


namespace {

    using stash::test::require;


    void test_parse_valid() {
        const auto type = stash::ChunkType::parse("RuSt");
        require(type.has_value(), "RuSt must parse");

        const stash::ChunkType::Bytes expected{ 82, 117, 83, 116 };
        require(type->bytes() == expected, "bytes mismatch");
        require(type->to_str() == "RuSt", "to_str mismatch");

        require(stash::ChunkType::parse("Rust").has_value(), "Rust must parse");
    }

    void test_from_bytes() {
        const auto from_bytes = stash::ChunkType::from_bytes({ 82, 117, 83, 116 });
        const auto from_text = stash::ChunkType::parse("RuSt");
        require(from_bytes.has_value() && from_text.has_value(), "must parse");
        require(*from_bytes == *from_text, "equal types differ");
        require(
            *from_bytes != *stash::ChunkType::parse("RUST"),
            "case must matter for equality"
        );

        const auto bad = stash::ChunkType::from_bytes({ 'a', 'b', 0x00, 'd' });
        require(!bad.has_value(), "NUL byte must be rejected");
        require(
            bad.error() == stash::ChunkTypeError{ stash::InvalidTypeChar{ 2, 0 } },
            "wrong error for NUL byte"
        );
    }

    void test_invalid_character() {
        const auto type = stash::ChunkType::parse("Ru1t");
        require(!type.has_value(), "Ru1t must be rejected");

        const auto* err = std::get_if<stash::InvalidTypeChar>(&type.error());
        require(err != nullptr, "expected InvalidTypeChar");
        require(err->index_ == 2, "wrong index");
        require(err->byte_ == '1', "wrong byte");

        // Only the first offender is reported
        const auto multi = stash::ChunkType::parse("@u1t");
        require(
            multi.error() ==
                stash::ChunkTypeError{ stash::InvalidTypeChar{ 0, '@' } },
            "first offender must be reported"
        );

        // Bytes just outside the letter ranges
        for (const char* text : { "Ru[t", "Ru`t", "Ru{t", "RuZ@" }) {
            require(
                !stash::ChunkType::parse(text).has_value(),
                std::string("must reject ") + text
            );
        }
    }

    void test_invalid_length() {
        for (const std::string_view text : { "Ru", "", "RuStX" }) {
            const auto type = stash::ChunkType::parse(text);
            require(!type.has_value(), "bad length must be rejected");
            require(
                type.error() ==
                    stash::ChunkTypeError{ stash::InvalidTypeLength{ text.size() } },
                "wrong length error"
            );
        }

        const auto msg = stash::to_str(stash::ChunkType::parse("Ru").error());
        require(msg.find('2') != std::string::npos, "message must hold length");
    }

    void test_properties() {
        const auto rust = *stash::ChunkType::parse("RuSt");
        require(rust.is_critical(), "RuSt is critical");
        require(!rust.is_public(), "RuSt is not public");
        require(!rust.is_reserved_bit_valid(), "RuSt reserved bit");
        require(rust.is_safe_to_copy(), "RuSt is safe to copy");

        require(!stash::ChunkType::parse("ruSt")->is_critical(), "ruSt");
        require(stash::ChunkType::parse("RUSt")->is_public(), "RUSt");
        require(
            stash::ChunkType::parse("Rust")->is_reserved_bit_valid(), "Rust"
        );
        require(!stash::ChunkType::parse("RuST")->is_safe_to_copy(), "RuST");

        const auto ihdr = *stash::ChunkType::parse("IHDR");
        require(ihdr.is_critical() && ihdr.is_public(), "IHDR flags");
        require(!ihdr.is_safe_to_copy(), "IHDR is not safe to copy");

        const auto text = *stash::ChunkType::parse("tEXt");
        require(!text.is_critical() && text.is_safe_to_copy(), "tEXt flags");
    }

}  // namespace


int main() {
    return stash::test::run_test("chunk_type", [] {
        ::test_parse_valid();
        ::test_from_bytes();
        ::test_invalid_character();
        ::test_invalid_length();
        ::test_properties();
    });
}
