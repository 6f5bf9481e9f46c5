#pragma once

#include "mtz/types.hpp"

namespace mtz {

namespace crc32 {

// Continue a CRC-32 (ISO-HDLC, as used by ZIP) over the next n bytes.
CRC32Value extend(CRC32Value init_val, const Byte* data, size_t n);

inline CRC32Value calculate(const Byte* data, size_t n) {
  return extend(0, data, n);
}

}  // namespace crc32

}  // namespace mtz
