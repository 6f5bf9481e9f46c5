#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mtz/extra_field.hpp"
#include "mtz/types.hpp"

namespace mtz {

// One archive entry with its payload already compressed and checksummed.
class FileRecord {
 public:
  FileRecord() = delete;
  FileRecord(std::string filename, CompressionType method, CRC32Value crc32,
             SizeType uncompressed_size, std::vector<Byte> data,
             FileAttr attributes, ExtraFields extra_fields,
             std::optional<std::string> comment);

  // Stored record with no payload. The name always ends with '/'.
  static FileRecord directory(std::string name, FileAttr attributes,
                              ExtraFields extra_fields,
                              std::optional<std::string> comment);

  [[nodiscard]] const std::string& get_filename() const { return m_filename; }
  [[nodiscard]] CompressionType get_method() const { return m_method; }
  [[nodiscard]] CRC32Value get_crc32() const { return m_crc32; }
  [[nodiscard]] ExternalAttr get_external_attr() const {
    return m_external_attr;
  }
  [[nodiscard]] const ExtraFields& get_extra_fields() const {
    return m_extra_fields;
  }
  [[nodiscard]] const std::optional<std::string>& get_comment() const {
    return m_comment;
  }
  [[nodiscard]] const std::vector<Byte>& get_data() const { return m_data; }

  [[nodiscard]] SizeType get_uncompressed_size() const {
    return m_uncompressed_size;
  }
  [[nodiscard]] SizeType get_compressed_size() const {
    return m_compressed_size;
  }

  // Throw CapacityError if a length does not fit its header field.
  [[nodiscard]] LengthType get_name_length() const;
  [[nodiscard]] LengthType get_comment_length() const;

  void write_local_file_header(std::vector<Byte>& buffer) const;
  void write_central_directory_file_header(std::vector<Byte>& buffer,
                                           Offset off_local_file_header) const;

  // Drop the payload once it has been written, sizes are kept.
  void release_data();

 private:
  CompressionType m_method;
  CRC32Value m_crc32;
  SizeType m_uncompressed_size;
  SizeType m_compressed_size;
  std::vector<Byte> m_data;
  std::string m_filename;
  ExternalAttr m_external_attr;
  ExtraFields m_extra_fields;
  std::optional<std::string> m_comment;
};

}  // namespace mtz
