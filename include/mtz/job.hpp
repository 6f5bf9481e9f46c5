#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mtz/extra_field.hpp"
#include "mtz/file_record.hpp"
#include "mtz/level.hpp"
#include "mtz/types.hpp"

namespace mtz {

// File opened at compression time. Attributes and extra fields come from its
// metadata.
struct FilesystemSource {
  std::string path;
};

// Bytes owned by the caller, who keeps them alive until the job is processed.
struct BorrowedBytes {
  const Byte* data;
  size_t size;
};

struct OwnedBytes {
  std::vector<Byte> data;
};

// Read to the end, the size is only known afterwards.
struct StreamSource {
  std::unique_ptr<std::istream> stream;
};

using DataOrigin =
    std::variant<FilesystemSource, BorrowedBytes, OwnedBytes, StreamSource>;

// An archive entry waiting for compression.
class Job {
 public:
  Job() = delete;
  Job(std::string archive_path, DataOrigin origin, CompressionLevel level,
      CompressionType type, FileAttr attributes, ExtraFields extra_fields,
      std::optional<std::string> comment);

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;
  Job(Job&&) = default;
  Job& operator=(Job&&) = default;
  ~Job() = default;

  [[nodiscard]] const std::string& get_archive_path() const {
    return m_archive_path;
  }

  // Read the source, checksum and compress it. The job is consumed.
  // Throws IoError if the source cannot be read and CapacityError if it is
  // larger than 4 GiB.
  FileRecord into_record();

 private:
  std::string m_archive_path;
  DataOrigin m_origin;
  CompressionLevel m_level;
  CompressionType m_type;
  FileAttr m_attributes;
  ExtraFields m_extra_fields;
  std::optional<std::string> m_comment;
};

}  // namespace mtz
