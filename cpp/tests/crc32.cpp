#include "stash/image/crc32.hpp"

#include "test_util.hpp"


namespace {

    using stash::test::require;


    void test_known_values() {
        require(stash::calc_crc32(nullptr, 0) == 0, "empty input");

        const auto digits = stash::test::to_bytes("123456789");
        require(
            stash::calc_crc32(digits.data(), digits.size()) == 0xCBF43926,
            "check value of 123456789"
        );

        const auto iend = stash::test::to_bytes("IEND");
        require(
            stash::calc_crc32(iend.data(), iend.size()) == 0xAE426082,
            "IEND crc"
        );

        const auto secret = stash::test::to_bytes(
            "RuStThis is where your secret message will be!"
        );
        require(
            stash::calc_crc32(secret.data(), secret.size()) == 2882656334,
            "RuSt message crc"
        );
    }

    void test_incremental() {
        const auto whole = stash::test::to_bytes("IHDR some payload bytes");
        const auto expected = stash::calc_crc32(whole.data(), whole.size());

        for (size_t split = 0; split <= whole.size(); ++split) {
            auto crc = stash::update_crc32(
                stash::CRC32_INIT, whole.data(), split
            );
            crc = stash::update_crc32(
                crc, whole.data() + split, whole.size() - split
            );
            require(
                (crc ^ stash::CRC32_INIT) == expected,
                "split crc must match whole crc"
            );
        }
    }

    void test_deterministic() {
        const auto data = stash::test::to_bytes("same input, same output");
        const auto a = stash::calc_crc32(data.data(), data.size());
        const auto b = stash::calc_crc32(data.data(), data.size());
        require(a == b, "crc must not keep state between calls");
    }

}  // namespace


int main() {
    return stash::test::run_test("crc32", [] {
        ::test_known_values();
        ::test_incremental();
        ::test_deterministic();
    });
}
