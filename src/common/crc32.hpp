#pragma once

#include <cstddef>
#include <cstdint>

namespace pagekv {

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

} // namespace pagekv
