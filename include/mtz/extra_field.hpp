#pragma once

#include <initializer_list>
#include <optional>
#include <variant>
#include <vector>

#include <sys/stat.h>

#include "mtz/types.hpp"

namespace mtz {

// Which header an extra field block is written into.
enum class HeaderPlacement { local, central };

// NTFS file times (header 0x000A), 100ns ticks since 1601-01-01.
struct NtfsTimestamps {
  uint64 mtime;
  uint64 atime;
  uint64 ctime;
};

// Info-ZIP extended timestamp (header 0x5455), seconds since the Unix epoch.
// Only the modification time is kept in the central directory.
struct UnixExtendedTimestamp {
  std::optional<int32> mod_time;
  std::optional<int32> ac_time;
  std::optional<int32> cr_time;
};

// Info-ZIP Unix uid/gid, version 1 layout (header 0x7875).
struct UnixOwnership {
  uint32 uid;
  uint32 gid;
};

using ExtraField =
    std::variant<NtfsTimestamps, UnixExtendedTimestamp, UnixOwnership>;

[[nodiscard]] uint16 extra_field_header_id(const ExtraField& field);

// Size of the field payload, not counting the 4-byte id/size header.
[[nodiscard]] uint16 extra_field_size(const ExtraField& field,
                                      HeaderPlacement placement);

class ExtraFields {
 public:
  ExtraFields() = default;
  ExtraFields(std::initializer_list<ExtraField> fields) : m_values(fields) {}

  // Timestamps and ownership of a stat'ed file, in the host's format.
  static ExtraFields from_stat(const struct stat& st);

  void add(const ExtraField& field) { m_values.push_back(field); }

  [[nodiscard]] bool empty() const { return m_values.empty(); }
  [[nodiscard]] size_t size() const { return m_values.size(); }
  [[nodiscard]] const std::vector<ExtraField>& values() const {
    return m_values;
  }

  // Total encoded length in the given header. Throws CapacityError if it
  // does not fit in the 16-bit length field.
  [[nodiscard]] LengthType data_length(HeaderPlacement placement) const;

  // Marshal all fields at p, advancing p by data_length(placement).
  void marshal(Byte*& p, HeaderPlacement placement) const;

 private:
  std::vector<ExtraField> m_values;
};

}  // namespace mtz
