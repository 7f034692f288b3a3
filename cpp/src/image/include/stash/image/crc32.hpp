#pragma once

#include <cstddef>
#include <cstdint>


namespace stash {

    // CRC-32 with the reflected polynomial 0xEDB88320, as used by PNG chunks

    constexpr uint32_t CRC32_INIT = 0xFFFFFFFF;

    // Feed more bytes into a running CRC. Start with `CRC32_INIT` and XOR the
    // final value with `CRC32_INIT` to finish it.
    uint32_t update_crc32(uint32_t crc, const uint8_t* data, size_t size);

    uint32_t calc_crc32(const uint8_t* data, size_t size);

}  // namespace stash
