#pragma once

#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "mtz/archive_data.hpp"
#include "mtz/extra_field.hpp"
#include "mtz/fs.hpp"
#include "mtz/job_queue.hpp"
#include "mtz/level.hpp"
#include "mtz/types.hpp"

namespace mtz {

// Builds a ZIP archive, compressing file entries on a pool of threads.
//
// Files are queued and compressed by compress() (or implicitly by write()).
// Directories are added to the archive immediately, so their order follows
// the order of the add_directory* calls. Compressed files end up in no
// particular order. All add_* methods may be called from several threads.
class ZipArchive {
 public:
  ZipArchive() = default;
  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;

  // hardware_concurrency(), at least 1.
  static size_t default_thread_count();

  // Read fs_path when compressing. Attributes and timestamps are taken from
  // the file.
  void add_file_from_fs(std::string fs_path, std::string archive_name,
                        CompressionLevel level = CompressionLevel::best(),
                        CompressionType type = CompressionType::deflate,
                        std::optional<std::string> comment = std::nullopt);

  // The bytes are not copied and must outlive the next compression pass.
  void add_file_from_slice(const Byte* data, size_t size,
                           std::string archive_name,
                           CompressionLevel level = CompressionLevel::best(),
                           CompressionType type = CompressionType::deflate,
                           FileAttr attrs = io::default_file_attrs,
                           ExtraFields extra_fields = {},
                           std::optional<std::string> comment = std::nullopt);

  void add_file_from_owned_data(
      std::vector<Byte> data, std::string archive_name,
      CompressionLevel level = CompressionLevel::best(),
      CompressionType type = CompressionType::deflate,
      FileAttr attrs = io::default_file_attrs, ExtraFields extra_fields = {},
      std::optional<std::string> comment = std::nullopt);

  // The reader is consumed to its end by one of the compression threads.
  void add_file_from_reader(
      std::unique_ptr<std::istream> reader, std::string archive_name,
      CompressionLevel level = CompressionLevel::best(),
      CompressionType type = CompressionType::deflate,
      FileAttr attrs = io::default_file_attrs, ExtraFields extra_fields = {},
      std::optional<std::string> comment = std::nullopt);

  void add_directory(std::string archive_name,
                     FileAttr attrs = io::default_dir_attrs,
                     std::optional<std::string> comment = std::nullopt);

  void add_directory_with_metadata(
      std::string archive_name, ExtraFields extra_fields,
      FileAttr attrs = io::default_dir_attrs,
      std::optional<std::string> comment = std::nullopt);

  // Directory entry with the attributes and timestamps of fs_path.
  // Throws IoError if fs_path cannot be stat'ed.
  void add_directory_from_fs_metadata(const std::string& fs_path,
                                      std::string archive_name);

  // Compress the jobs queued so far. Returns the number of records added.
  // Throws the first job failure unless policy is FailurePolicy::skip_entry;
  // no record of a failed pass is added.
  size_t compress();
  size_t compress(size_t thread_cnt,
                  FailurePolicy policy = FailurePolicy::abort_pass);

  // Compress pending jobs if any, then serialize the archive into os. The
  // records are consumed, the archive is empty afterwards.
  void write(std::ostream& os);
  void write(std::ostream& os, size_t thread_cnt);
  void write(const std::string& filename);
  void write(const std::string& filename, size_t thread_cnt);

  [[nodiscard]] size_t n_pending_jobs() const { return m_jobs.size(); }
  [[nodiscard]] size_t n_records() const;

 private:
  JobQueue m_jobs;
  // One compression pass at a time.
  std::mutex m_pass_mutex;
  mutable std::mutex m_data_mutex;
  ArchiveData m_data;

  void add_record(FileRecord record);
};

}  // namespace mtz
