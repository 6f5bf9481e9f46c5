#pragma once

#include <ostream>
#include <utility>
#include <vector>

#include "mtz/file_record.hpp"
#include "mtz/types.hpp"

namespace mtz {

// Ordered file records of an archive and their serialization.
class ArchiveData {
 public:
  ArchiveData() = default;

  void append(FileRecord record) { m_records.push_back(std::move(record)); }
  void append(std::vector<FileRecord> records);

  [[nodiscard]] size_t n_records() const { return m_records.size(); }
  [[nodiscard]] const std::vector<FileRecord>& get_records() const {
    return m_records;
  }

  // Write local headers with data, the central directory and the end of
  // central directory record to os, consuming the records. Offsets are
  // relative to the position of os when called.
  // Throws CapacityError (before anything is written) if the archive does not
  // fit the ZIP field widths and IoError if os fails.
  void write(std::ostream& os);

 private:
  std::vector<FileRecord> m_records;

  void check_capacity() const;
};

}  // namespace mtz
