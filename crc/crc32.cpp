#include "crc/crc32.hpp"

#include <algorithm>
#include <climits>

#include <zlib.h>

namespace mtz {

namespace crc32 {

CRC32Value extend(CRC32Value init_val, const Byte* data, size_t n) {
  uLong crc = init_val;
  while (n > 0) {
    const auto slice = static_cast<uInt>(std::min<size_t>(n, UINT_MAX));
    crc = ::crc32(crc, data, slice);
    data += slice;
    n -= slice;
  }
  return static_cast<CRC32Value>(crc);
}

}  // namespace crc32

}  // namespace mtz
