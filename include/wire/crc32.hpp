#pragma once

#include <cstddef>
#include <cstdint>

namespace res_agent::wire {

// CRC-32/IEEE 802.3: reflected polynomial 0xEDB88320, init and xorout 0xFFFFFFFF.
std::uint32_t crc32(const std::uint8_t* data, std::size_t size) noexcept;

}  // namespace res_agent::wire
