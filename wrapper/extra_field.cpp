#include "mtz/extra_field.hpp"

#include <limits>
#include <string>

#include "util/byte_util.hpp"

#include "mtz/error.hpp"

namespace mtz {

namespace {

constexpr uint16 ntfs_header_id = 0x000A;
constexpr uint16 extended_timestamp_header_id = 0x5455;
constexpr uint16 unix_ownership_header_id = 0x7875;

constexpr uint8 mod_time_present = 1;
constexpr uint8 ac_time_present = 1 << 1;
constexpr uint8 cr_time_present = 1 << 2;

uint16 optional_size(const std::optional<int32>& value) {
  return value ? static_cast<uint16>(sizeof(int32)) : 0;
}

#ifdef WIN32
// Seconds between 1601-01-01 and 1970-01-01.
constexpr uint64 ntfs_epoch_offset = 11644473600ull;
constexpr uint64 ntfs_ticks_per_second = 10000000ull;

uint64 to_ntfs_time(time_t t) {
  return (static_cast<uint64>(t) + ntfs_epoch_offset) * ntfs_ticks_per_second;
}
#endif

void marshal_field(Byte*& p, const ExtraField& field,
                   HeaderPlacement placement) {
  marshal_16(p, extra_field_header_id(field));
  marshal_16(p, extra_field_size(field, placement));

  if (const auto* ntfs = std::get_if<NtfsTimestamps>(&field)) {
    marshal_32(p, 0);   // Reserved
    marshal_16(p, 1);   // Tag1
    marshal_16(p, 24);  // Size of Tag1
    marshal_64(p, ntfs->mtime);
    marshal_64(p, ntfs->atime);
    marshal_64(p, ntfs->ctime);
  } else if (const auto* ts = std::get_if<UnixExtendedTimestamp>(&field)) {
    uint8 flags = 0;
    flags |= ts->mod_time ? mod_time_present : 0;
    flags |= ts->ac_time ? ac_time_present : 0;
    flags |= ts->cr_time ? cr_time_present : 0;
    marshal_8(p, flags);
    if (ts->mod_time) {
      marshal_32(p, static_cast<uint32>(*ts->mod_time));
    }
    if (placement == HeaderPlacement::local) {
      if (ts->ac_time) {
        marshal_32(p, static_cast<uint32>(*ts->ac_time));
      }
      if (ts->cr_time) {
        marshal_32(p, static_cast<uint32>(*ts->cr_time));
      }
    }
  } else {
    const auto& owner = std::get<UnixOwnership>(field);
    marshal_8(p, 1);  // Version
    marshal_8(p, 4);  // UIDSize
    marshal_32(p, owner.uid);
    marshal_8(p, 4);  // GIDSize
    marshal_32(p, owner.gid);
  }
}

}  // namespace

uint16 extra_field_header_id(const ExtraField& field) {
  switch (field.index()) {
    case 0:
      return ntfs_header_id;
    case 1:
      return extended_timestamp_header_id;
    default:
      return unix_ownership_header_id;
  }
}

uint16 extra_field_size(const ExtraField& field, HeaderPlacement placement) {
  if (std::holds_alternative<NtfsTimestamps>(field)) {
    return 32;
  }
  if (const auto* ts = std::get_if<UnixExtendedTimestamp>(&field)) {
    uint16 size = 1 + optional_size(ts->mod_time);
    if (placement == HeaderPlacement::local) {
      size += optional_size(ts->ac_time) + optional_size(ts->cr_time);
    }
    return size;
  }
  return 11;
}

ExtraFields ExtraFields::from_stat(const struct stat& st) {
#ifdef WIN32
  return ExtraFields{NtfsTimestamps{to_ntfs_time(st.st_mtime),
                                    to_ntfs_time(st.st_atime),
                                    to_ntfs_time(st.st_ctime)}};
#else
  return ExtraFields{
      UnixExtendedTimestamp{static_cast<int32>(st.st_mtime),
                            static_cast<int32>(st.st_atime),
                            static_cast<int32>(st.st_ctime)},
      UnixOwnership{static_cast<uint32>(st.st_uid),
                    static_cast<uint32>(st.st_gid)}};
#endif
}

LengthType ExtraFields::data_length(HeaderPlacement placement) const {
  size_t total = 0;
  for (const auto& field : m_values) {
    total += 4 + static_cast<size_t>(extra_field_size(field, placement));
  }
  if (total > std::numeric_limits<LengthType>::max()) {
    throw CapacityError("extra fields take " + std::to_string(total) +
                        " bytes, more than 65535");
  }
  return static_cast<LengthType>(total);
}

void ExtraFields::marshal(Byte*& p, HeaderPlacement placement) const {
  for (const auto& field : m_values) {
    marshal_field(p, field, placement);
  }
}

}  // namespace mtz
