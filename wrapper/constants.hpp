#pragma once

#include "mtz/types.hpp"

namespace mtz {

constexpr uint32 local_file_header_signature = 0x04034B50;
constexpr uint32 central_directory_file_header_signature = 0x02014b50;
constexpr uint32 endof_central_directory_file_header_signature = 0x06054b50;

constexpr size_t local_file_header_fixed_length = 30;
constexpr size_t central_directory_file_header_fixed_length = 46;
constexpr size_t endof_central_directory_length = 22;

// APPNOTE version 6.2, host id in the high byte.
#if defined(WIN32)
constexpr OptVersion version_made_by = (11 << 8) + 62;
#elif defined(__APPLE__)
constexpr OptVersion version_made_by = (19 << 8) + 62;
#else
constexpr OptVersion version_made_by = (3 << 8) + 62;
#endif

constexpr OptVersion version_needed_to_extract = 20;

// Bit 11: file names and comments are UTF-8.
constexpr GeneralPurpose general_purpose_flag = 1 << 11;

}  // namespace mtz
