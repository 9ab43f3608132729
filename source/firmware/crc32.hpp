#pragma once

#include <cstdint>
#include <span>

namespace Firmware {

/// CRC-32 as used by IEEE 802.3 (reflected polynomial 0xEDB88320, initial value and final xor 0xffffffff)
uint32_t Crc32(std::span<const uint8_t> data);

} // namespace Firmware
