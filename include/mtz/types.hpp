#pragma once

#include <cstddef>
#include <cstdint>

namespace mtz {

// clang-format off

using uint8  = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;
using int32  = int32_t;

using Byte           = uint8;

// Version needed to extract (minimum) / version made by
using OptVersion     = uint16;
// General purpose bit flag
using GeneralPurpose = uint16;

// Compression method, values are the ZIP method ids
enum class CompressionType : uint16 {
  stored  = 0x0000,
  deflate = 0x0008
};

// How a compression pass treats a job that fails
enum class FailurePolicy {
  abort_pass,
  skip_entry
};

// 32-bit CRC32 value
using CRC32Value     = uint32;

// 4-byte integer used to indicate size
using SizeType       = uint32;
// 2-byte integer used to indicate length
using LengthType     = uint16;

// Disk number where file starts
using DiskNumber     = uint16;

// 2-byte Internal file attributes
using InternalAttr   = uint16;
// 2-byte platform attributes, stored in the high half of the external ones
using FileAttr       = uint16;
// 4-byte External file attributes
using ExternalAttr   = uint32;

// 4-byte Offset type
using Offset         = uint32;

// 2-byte Number of records
using NRecord        = uint16;

// clang-format on

}  // namespace mtz
