#include "mtz/archive_data.hpp"

#include <iterator>
#include <limits>
#include <string>
#include <utility>

#include "util/byte_util.hpp"

#include "mtz/error.hpp"
#include "mtz/log.hpp"
#include "wrapper/constants.hpp"

namespace mtz {

namespace {

constexpr uint64 MaxOffset = std::numeric_limits<Offset>::max();

class OffsetTracker {
 public:
  explicit OffsetTracker(std::ostream& os) : m_os(os) {}

  // Absolute position in the output stream.
  Offset position(const char* what) const {
    const std::streamoff pos = m_os.tellp();
    if (pos < 0) {
      throw IoError("output stream does not report its position");
    }
    if (static_cast<uint64>(pos) > MaxOffset) {
      throw CapacityError(std::string(what) + " lies beyond 4 GiB");
    }
    return static_cast<Offset>(pos);
  }

  void write(const Byte* data, size_t n) const {
    m_os.write(reinterpret_cast<const char*>(data),
               static_cast<std::streamsize>(n));
    if (!m_os) {
      throw IoError("error writing archive");
    }
  }

  void write(const std::vector<Byte>& bytes) const {
    write(bytes.data(), bytes.size());
  }

 private:
  std::ostream& m_os;
};

void write_eocd(const OffsetTracker& out, size_t n_entries, Offset off_cd,
                Offset cd_end) {
  Byte content[endof_central_directory_length];
  Byte* p = &content[0];
  marshal_32(p, endof_central_directory_file_header_signature);
  marshal_16(p, DiskNumber{0});  // Number of this disk
  marshal_16(p, DiskNumber{0});  // Disk where central directory starts
  marshal_16(p, static_cast<NRecord>(n_entries));
  marshal_16(p, static_cast<NRecord>(n_entries));
  marshal_32(p, cd_end - off_cd);
  marshal_32(p, off_cd);
  marshal_16(p, 0);  // Comment length
  out.write(content, sizeof(content));
}

}  // namespace

void ArchiveData::append(std::vector<FileRecord> records) {
  m_records.reserve(m_records.size() + records.size());
  std::move(records.begin(), records.end(), std::back_inserter(m_records));
}

void ArchiveData::check_capacity() const {
  if (m_records.size() > std::numeric_limits<NRecord>::max()) {
    throw CapacityError("archive has " + std::to_string(m_records.size()) +
                        " entries, more than 65535");
  }
  for (const auto& record : m_records) {
    (void)record.get_name_length();
    (void)record.get_comment_length();
    (void)record.get_extra_fields().data_length(HeaderPlacement::local);
    (void)record.get_extra_fields().data_length(HeaderPlacement::central);
  }
}

void ArchiveData::write(std::ostream& os) {
  check_capacity();
  OffsetTracker out(os);
  (void)out.position("archive start");

  std::vector<FileRecord> records = std::move(m_records);
  m_records.clear();

  const size_t n = records.size();
  log::log("writing ", n, " entries");
  std::vector<Offset> header_offset(n);
  std::vector<Byte> buffer;

  // local file headers & data
  for (size_t i = 0; i < n; ++i) {
    header_offset[i] = out.position("local file header");
    buffer.clear();
    records[i].write_local_file_header(buffer);
    out.write(buffer);
    out.write(records[i].get_data());
    records[i].release_data();
  }

  // offset to the start of central directory
  const Offset offset_cd = out.position("central directory");
  buffer.clear();
  for (size_t i = 0; i < n; ++i) {
    records[i].write_central_directory_file_header(buffer, header_offset[i]);
  }
  out.write(buffer);

  const Offset cd_end = out.position("end of central directory");
  write_eocd(out, n, offset_cd, cd_end);

  os.flush();
  if (!os) {
    throw IoError("error flushing archive");
  }
}

}  // namespace mtz
