#include "mtz/job.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <utility>

#include "compress/cps_deflate.hpp"
#include "compress/cps_store.hpp"
#include "crc/crc32.hpp"
#include "mtz/error.hpp"
#include "mtz/fs.hpp"

namespace mtz {

namespace {

// Read granularity for file and stream sources.
constexpr size_t ReadChunkSize = 64 << 10;

constexpr uint64 MaxEntrySize = std::numeric_limits<SizeType>::max();

std::unique_ptr<Compressor> make_compressor(CompressionType type,
                                            CompressionLevel level,
                                            size_t size_hint) {
  switch (type) {
    case CompressionType::stored:
      return std::make_unique<StoreCompressor>(size_hint);
    case CompressionType::deflate:
      return std::make_unique<DeflateCompressor>(level, size_hint);
  }
  throw Error("unknown compression type " +
              std::to_string(static_cast<uint16>(type)));
}

// CRC accumulator in series with the compressor.
class Digest {
 public:
  Digest(CompressionType type, CompressionLevel level, size_t size_hint,
         const std::string& name)
      : m_compressor(make_compressor(type, level, size_hint)),
        m_crc(0),
        m_total_in(0),
        m_name(name) {}

  void feed(const Byte* data, size_t n) {
    m_total_in += n;
    if (m_total_in > MaxEntrySize) {
      throw CapacityError("'" + m_name + "' is larger than 4 GiB");
    }
    m_crc = crc32::extend(m_crc, data, n);
    m_compressor->feed(data, n);
  }

  void feed(std::istream& is) {
    std::vector<char> chunk(ReadChunkSize);
    while (true) {
      is.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const auto got = static_cast<size_t>(is.gcount());
      if (got > 0) {
        feed(reinterpret_cast<const Byte*>(chunk.data()), got);
      }
      if (is.bad()) {
        throw IoError("error reading data of '" + m_name + "'");
      }
      if (is.eof()) {
        break;
      }
      if (is.fail()) {
        throw IoError("error reading data of '" + m_name + "'");
      }
    }
  }

  [[nodiscard]] CRC32Value crc() const { return m_crc; }
  [[nodiscard]] SizeType total_in() const {
    return static_cast<SizeType>(m_total_in);
  }

  std::vector<Byte> finish() {
    m_compressor->compress();
    return m_compressor->take_result();
  }

 private:
  std::unique_ptr<Compressor> m_compressor;
  CRC32Value m_crc;
  uint64 m_total_in;
  std::string m_name;
};

}  // namespace

Job::Job(std::string archive_path, DataOrigin origin, CompressionLevel level,
         CompressionType type, FileAttr attributes, ExtraFields extra_fields,
         std::optional<std::string> comment)
    : m_archive_path(std::move(archive_path)),
      m_origin(std::move(origin)),
      m_level(level),
      m_type(type),
      m_attributes(attributes),
      m_extra_fields(std::move(extra_fields)),
      m_comment(std::move(comment)) {}

FileRecord Job::into_record() {
  std::unique_ptr<Digest> digest;

  if (auto* fs = std::get_if<FilesystemSource>(&m_origin)) {
    const struct stat st = io::stat_path(fs->path);
    if (io::is_directory(st)) {
      throw IoError("'" + fs->path + "' is a directory");
    }
    if (static_cast<uint64>(st.st_size) > MaxEntrySize) {
      throw CapacityError("'" + fs->path + "' is larger than 4 GiB");
    }
    m_attributes = io::attributes_from_stat(st);
    m_extra_fields = ExtraFields::from_stat(st);

    std::ifstream ifs(fs->path, std::ios::binary);
    if (ifs.fail()) {
      throw IoError("cannot open file '" + fs->path + "': " + strerror(errno));
    }
    digest = std::make_unique<Digest>(
        m_type, m_level, static_cast<size_t>(st.st_size), m_archive_path);
    digest->feed(ifs);
  } else if (auto* borrowed = std::get_if<BorrowedBytes>(&m_origin)) {
    digest = std::make_unique<Digest>(m_type, m_level, borrowed->size,
                                      m_archive_path);
    digest->feed(borrowed->data, borrowed->size);
  } else if (auto* owned = std::get_if<OwnedBytes>(&m_origin)) {
    digest = std::make_unique<Digest>(m_type, m_level, owned->data.size(),
                                      m_archive_path);
    digest->feed(owned->data.data(), owned->data.size());
    owned->data.clear();
    owned->data.shrink_to_fit();
  } else {
    auto& source = std::get<StreamSource>(m_origin);
    if (!source.stream) {
      throw IoError("no reader supplied for '" + m_archive_path + "'");
    }
    digest = std::make_unique<Digest>(m_type, m_level, 0, m_archive_path);
    digest->feed(*source.stream);
    source.stream.reset();
  }

  const CRC32Value crc = digest->crc();
  const SizeType uncompressed_size = digest->total_in();
  std::vector<Byte> data = digest->finish();
  return FileRecord(std::move(m_archive_path), m_type, crc, uncompressed_size,
                    std::move(data), m_attributes, std::move(m_extra_fields),
                    std::move(m_comment));
}

}  // namespace mtz
