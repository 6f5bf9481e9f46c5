#include "mtz/file_record.hpp"

#include <limits>
#include <utility>

#include "util/byte_util.hpp"

#include "mtz/error.hpp"
#include "wrapper/constants.hpp"

namespace mtz {

namespace {

LengthType checked_length(size_t n, const char* what,
                          const std::string& filename) {
  if (n > std::numeric_limits<LengthType>::max()) {
    throw CapacityError(std::string(what) + " of '" + filename.substr(0, 64) +
                        "' is " + std::to_string(n) + " bytes, more than 65535");
  }
  return static_cast<LengthType>(n);
}

}  // namespace

FileRecord::FileRecord(std::string filename, CompressionType method,
                       CRC32Value crc32, SizeType uncompressed_size,
                       std::vector<Byte> data, FileAttr attributes,
                       ExtraFields extra_fields,
                       std::optional<std::string> comment)
    : m_method{method},
      m_crc32{crc32},
      m_uncompressed_size{uncompressed_size},
      m_compressed_size{0},
      m_data{std::move(data)},
      m_filename{std::move(filename)},
      m_external_attr{static_cast<ExternalAttr>(attributes) << 16},
      m_extra_fields{std::move(extra_fields)},
      m_comment{std::move(comment)} {
  if (m_data.size() > std::numeric_limits<SizeType>::max()) {
    throw CapacityError("compressed data of '" + m_filename +
                        "' exceeds 4 GiB");
  }
  m_compressed_size = static_cast<SizeType>(m_data.size());
}

FileRecord FileRecord::directory(std::string name, FileAttr attributes,
                                 ExtraFields extra_fields,
                                 std::optional<std::string> comment) {
  if (name.empty() || name.back() != '/') {
    if (!name.empty() && name.back() == '\\') {
      name.back() = '/';
    } else {
      name.push_back('/');
    }
  }
  return FileRecord(std::move(name), CompressionType::stored, 0, 0, {},
                    attributes, std::move(extra_fields), std::move(comment));
}

LengthType FileRecord::get_name_length() const {
  return checked_length(m_filename.length(), "file name", m_filename);
}

LengthType FileRecord::get_comment_length() const {
  return m_comment ? checked_length(m_comment->length(), "comment", m_filename)
                   : 0;
}

void FileRecord::write_local_file_header(std::vector<Byte>& buffer) const {
  const LengthType name_length = get_name_length();
  const LengthType extra_length =
      m_extra_fields.data_length(HeaderPlacement::local);
  const size_t header_length =
      local_file_header_fixed_length + name_length + extra_length;
  const size_t start = buffer.size();
  buffer.resize(start + header_length);
  Byte* p = &buffer[start];

  marshal_32(p, local_file_header_signature);
  marshal_16(p, version_needed_to_extract);
  marshal_16(p, general_purpose_flag);
  marshal_16(p, static_cast<uint16>(m_method));
  // DOS time and date, modification time goes into the extra fields
  marshal_16(p, 0);
  marshal_16(p, 0);
  marshal_32(p, m_crc32);
  marshal_32(p, m_compressed_size);
  marshal_32(p, m_uncompressed_size);
  marshal_16(p, name_length);
  marshal_16(p, extra_length);
  marshal_string(p, m_filename);
  m_extra_fields.marshal(p, HeaderPlacement::local);
}

void FileRecord::write_central_directory_file_header(
    std::vector<Byte>& buffer, Offset off_local_file_header) const {
  const LengthType name_length = get_name_length();
  const LengthType extra_length =
      m_extra_fields.data_length(HeaderPlacement::central);
  const LengthType comment_length = get_comment_length();
  const size_t header_length = central_directory_file_header_fixed_length +
                               name_length + extra_length + comment_length;
  const size_t start = buffer.size();
  buffer.resize(start + header_length);
  Byte* p = &buffer[start];

  marshal_32(p, central_directory_file_header_signature);
  marshal_16(p, version_made_by);
  marshal_16(p, version_needed_to_extract);
  marshal_16(p, general_purpose_flag);
  marshal_16(p, static_cast<uint16>(m_method));
  marshal_16(p, 0);
  marshal_16(p, 0);
  marshal_32(p, m_crc32);
  marshal_32(p, m_compressed_size);
  marshal_32(p, m_uncompressed_size);
  marshal_16(p, name_length);
  marshal_16(p, extra_length);
  marshal_16(p, comment_length);
  marshal_16(p, DiskNumber{0});
  marshal_16(p, InternalAttr{0});
  marshal_32(p, m_external_attr);
  marshal_32(p, off_local_file_header);
  marshal_string(p, m_filename);
  m_extra_fields.marshal(p, HeaderPlacement::central);
  if (m_comment) {
    marshal_string(p, *m_comment);
  }
}

void FileRecord::release_data() {
  m_data.clear();
  m_data.shrink_to_fit();
}

}  // namespace mtz
