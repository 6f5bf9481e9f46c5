#include "mtz/zip_archive.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>
#include <utility>

#include "mtz/error.hpp"
#include "mtz/log.hpp"

namespace mtz {

size_t ZipArchive::default_thread_count() {
  return std::max<size_t>(std::thread::hardware_concurrency(), 1);
}

void ZipArchive::add_file_from_fs(std::string fs_path, std::string archive_name,
                                  CompressionLevel level, CompressionType type,
                                  std::optional<std::string> comment) {
  m_jobs.push(Job(std::move(archive_name),
                  FilesystemSource{std::move(fs_path)}, level, type,
                  io::default_file_attrs, {}, std::move(comment)));
}

void ZipArchive::add_file_from_slice(const Byte* data, size_t size,
                                     std::string archive_name,
                                     CompressionLevel level,
                                     CompressionType type, FileAttr attrs,
                                     ExtraFields extra_fields,
                                     std::optional<std::string> comment) {
  m_jobs.push(Job(std::move(archive_name), BorrowedBytes{data, size}, level,
                  type, attrs, std::move(extra_fields), std::move(comment)));
}

void ZipArchive::add_file_from_owned_data(std::vector<Byte> data,
                                          std::string archive_name,
                                          CompressionLevel level,
                                          CompressionType type, FileAttr attrs,
                                          ExtraFields extra_fields,
                                          std::optional<std::string> comment) {
  m_jobs.push(Job(std::move(archive_name), OwnedBytes{std::move(data)}, level,
                  type, attrs, std::move(extra_fields), std::move(comment)));
}

void ZipArchive::add_file_from_reader(std::unique_ptr<std::istream> reader,
                                      std::string archive_name,
                                      CompressionLevel level,
                                      CompressionType type, FileAttr attrs,
                                      ExtraFields extra_fields,
                                      std::optional<std::string> comment) {
  m_jobs.push(Job(std::move(archive_name), StreamSource{std::move(reader)},
                  level, type, attrs, std::move(extra_fields),
                  std::move(comment)));
}

void ZipArchive::add_directory(std::string archive_name, FileAttr attrs,
                               std::optional<std::string> comment) {
  add_record(FileRecord::directory(std::move(archive_name), attrs, {},
                                   std::move(comment)));
}

void ZipArchive::add_directory_with_metadata(
    std::string archive_name, ExtraFields extra_fields, FileAttr attrs,
    std::optional<std::string> comment) {
  add_record(FileRecord::directory(std::move(archive_name), attrs,
                                   std::move(extra_fields),
                                   std::move(comment)));
}

void ZipArchive::add_directory_from_fs_metadata(const std::string& fs_path,
                                                std::string archive_name) {
  const struct stat st = io::stat_path(fs_path);
  add_record(FileRecord::directory(std::move(archive_name),
                                   io::attributes_from_stat(st),
                                   ExtraFields::from_stat(st), std::nullopt));
}

size_t ZipArchive::compress() { return compress(default_thread_count()); }

size_t ZipArchive::compress(size_t thread_cnt, FailurePolicy policy) {
  std::lock_guard<std::mutex> pass_lock(m_pass_mutex);
  std::vector<Job> batch = m_jobs.drain();
  if (batch.empty()) {
    return 0;
  }

  WorkerPool pool(thread_cnt, policy);
  std::vector<FileRecord> records = pool.run(std::move(batch));
  const size_t n = records.size();

  std::lock_guard<std::mutex> data_lock(m_data_mutex);
  m_data.append(std::move(records));
  return n;
}

void ZipArchive::write(std::ostream& os) { write(os, default_thread_count()); }

void ZipArchive::write(std::ostream& os, size_t thread_cnt) {
  if (!m_jobs.empty()) {
    compress(thread_cnt);
  }
  std::lock_guard<std::mutex> data_lock(m_data_mutex);
  m_data.write(os);
}

void ZipArchive::write(const std::string& filename) {
  write(filename, default_thread_count());
}

void ZipArchive::write(const std::string& filename, size_t thread_cnt) {
  std::ofstream ofs;
  ofs.open(filename, std::ios::binary | std::ios::trunc);
  if (ofs.fail()) {
    throw IoError("cannot open file '" + filename + "': " + strerror(errno));
  }
  write(ofs, thread_cnt);
  ofs.close();
  if (ofs.fail()) {
    throw IoError("error closing '" + filename + "'");
  }
  log::log("archive written to '", filename, "'");
}

size_t ZipArchive::n_records() const {
  std::lock_guard<std::mutex> data_lock(m_data_mutex);
  return m_data.n_records();
}

void ZipArchive::add_record(FileRecord record) {
  std::lock_guard<std::mutex> data_lock(m_data_mutex);
  m_data.append(std::move(record));
}

}  // namespace mtz
