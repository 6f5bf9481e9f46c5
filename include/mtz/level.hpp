#pragma once

#include <optional>

#include "mtz/error.hpp"
#include "mtz/types.hpp"

namespace mtz {

// Deflate compression level, 0 (no compression) to 9 (best ratio).
class CompressionLevel {
 public:
  static constexpr int min_value = 0;
  static constexpr int max_value = 9;

  // Equivalent to balanced().
  constexpr CompressionLevel() : m_level(6) {}

  // Throws InvalidCompressionLevel if level is out of range.
  static CompressionLevel create(int level) {
    if (level < min_value || level > max_value) {
      throw InvalidCompressionLevel(level);
    }
    return CompressionLevel(static_cast<uint8>(level));
  }

  static std::optional<CompressionLevel> try_create(int level) {
    if (level < min_value || level > max_value) {
      return std::nullopt;
    }
    return CompressionLevel(static_cast<uint8>(level));
  }

  static constexpr CompressionLevel none() { return CompressionLevel(0); }
  static constexpr CompressionLevel fast() { return CompressionLevel(1); }
  static constexpr CompressionLevel balanced() { return CompressionLevel(6); }
  static constexpr CompressionLevel best() { return CompressionLevel(9); }

  [[nodiscard]] constexpr int get() const { return m_level; }

  constexpr bool operator==(CompressionLevel rhs) const {
    return m_level == rhs.m_level;
  }
  constexpr bool operator!=(CompressionLevel rhs) const {
    return m_level != rhs.m_level;
  }
  constexpr bool operator<(CompressionLevel rhs) const {
    return m_level < rhs.m_level;
  }
  constexpr bool operator<=(CompressionLevel rhs) const {
    return m_level <= rhs.m_level;
  }
  constexpr bool operator>(CompressionLevel rhs) const {
    return m_level > rhs.m_level;
  }
  constexpr bool operator>=(CompressionLevel rhs) const {
    return m_level >= rhs.m_level;
  }

 private:
  constexpr explicit CompressionLevel(uint8 level) : m_level(level) {}

  uint8 m_level;
};

}  // namespace mtz
