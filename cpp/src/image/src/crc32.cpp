#include "stash/image/crc32.hpp"

#include <array>


namespace {

    constexpr uint32_t CRC32_POLY = 0xEDB88320;

    constexpr std::array<uint32_t, 256> make_crc_table() {
        std::array<uint32_t, 256> table{};

        for (uint32_t n = 0; n < table.size(); ++n) {
            uint32_t c = n;
            for (int k = 0; k < 8; ++k) {
                if (c & 1)
                    c = CRC32_POLY ^ (c >> 1);
                else
                    c = c >> 1;
            }
            table[n] = c;
        }

        return table;
    }

    constexpr auto CRC_TABLE = ::make_crc_table();

    static_assert(CRC_TABLE[1] == 0x77073096);
    static_assert(CRC_TABLE[255] == 0x2D02EF8D);

}  // namespace


namespace stash {

    uint32_t update_crc32(uint32_t crc, const uint8_t* data, size_t size) {
        for (size_t i = 0; i < size; ++i)
            crc = ::CRC_TABLE[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
        return crc;
    }

    uint32_t calc_crc32(const uint8_t* data, size_t size) {
        return update_crc32(CRC32_INIT, data, size) ^ CRC32_INIT;
    }

}  // namespace stash
