#pragma once

#include <cstring>
#include <string>

#include "mtz/types.hpp"

namespace mtz {

inline void marshal_8(Byte*& p, uint8 x) { *p++ = x; }

inline void marshal_16(Byte*& p, uint16 x) {
  *p++ = static_cast<Byte>((x >> 0) & 0xFF);
  *p++ = static_cast<Byte>((x >> 8) & 0xFF);
}

inline void marshal_32(Byte*& p, uint32 x) {
  *p++ = static_cast<Byte>((x >> 0) & 0xFF);
  *p++ = static_cast<Byte>((x >> 8) & 0xFF);
  *p++ = static_cast<Byte>((x >> 16) & 0xFF);
  *p++ = static_cast<Byte>((x >> 24) & 0xFF);
}

inline void marshal_64(Byte*& p, uint64 x) {
  marshal_32(p, static_cast<uint32>(x & 0xFFFFFFFFull));
  marshal_32(p, static_cast<uint32>(x >> 32));
}

inline void marshal_string(Byte*& p, const char* src, size_t n) {
  if (n != 0) {
    memcpy(p, src, n);
  }
  p += n;
}

inline void marshal_string(Byte*& p, const std::string& str) {
  marshal_string(p, str.c_str(), str.size());
}

inline uint16 unmarshal_16(const Byte* p) {
  return static_cast<uint16>(p[0] | (p[1] << 8));
}

inline uint32 unmarshal_32(const Byte* p) {
  return static_cast<uint32>(p[0]) | (static_cast<uint32>(p[1]) << 8) |
         (static_cast<uint32>(p[2]) << 16) | (static_cast<uint32>(p[3]) << 24);
}

}  // namespace mtz
