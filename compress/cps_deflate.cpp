#include "compress/cps_deflate.hpp"

#include <algorithm>
#include <climits>
#include <string>

#include "mtz/error.hpp"

namespace mtz {

DeflateCompressor::DeflateCompressor(CompressionLevel level, size_t size_hint)
    : m_stream{}, m_res_len(0) {
  m_stream.zalloc = Z_NULL;
  m_stream.zfree = Z_NULL;
  m_stream.opaque = Z_NULL;
  // Negative window bits: raw deflate, no zlib wrapper.
  const int ret = deflateInit2(&m_stream, level.get(), Z_DEFLATED, -MAX_WBITS,
                               8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw Error("deflateInit2 failed with code " + std::to_string(ret));
  }
  if (size_hint != 0 && size_hint <= ULONG_MAX) {
    m_res.resize(deflateBound(&m_stream, static_cast<uLong>(size_hint)));
  }
}

DeflateCompressor::~DeflateCompressor() { deflateEnd(&m_stream); }

void DeflateCompressor::feed(const Byte* data, size_t n) {
  while (n > 0) {
    const auto slice = static_cast<uInt>(std::min<size_t>(n, UINT_MAX));
    m_stream.next_in = const_cast<Bytef*>(data);
    m_stream.avail_in = slice;
    run(Z_NO_FLUSH);
    data += slice;
    n -= slice;
  }
}

size_t DeflateCompressor::compress() {
  if (m_finish) {
    return get_length_compressed();
  }
  m_stream.next_in = Z_NULL;
  m_stream.avail_in = 0;
  run(Z_FINISH);
  m_res.resize(m_res_len);
  m_finish = true;
  return m_res_len;
}

void DeflateCompressor::run(int flush) {
  int ret = Z_OK;
  do {
    if (m_res.size() - m_res_len < DeflateOutputChunk) {
      m_res.resize(m_res_len + std::max(DeflateOutputChunk, m_res_len / 2));
    }
    const auto space =
        static_cast<uInt>(std::min<size_t>(m_res.size() - m_res_len, UINT_MAX));
    m_stream.next_out = m_res.data() + m_res_len;
    m_stream.avail_out = space;

    ret = deflate(&m_stream, flush);
    if (ret == Z_STREAM_ERROR) {
      throw Error("deflate stream state is inconsistent");
    }
    m_res_len += space - m_stream.avail_out;
  } while (flush == Z_FINISH ? ret != Z_STREAM_END
                             : m_stream.avail_in != 0);
}

}  // namespace mtz
