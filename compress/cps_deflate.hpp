#pragma once

#include <zlib.h>

#include "mtz/level.hpp"
#include "mtz/types.hpp"

#include "compress/compressor.hpp"

namespace mtz {

// Output grows by at least this much per deflate() round.
constexpr size_t DeflateOutputChunk = 64 << 10;

// Raw Deflate stream (no zlib header or trailer) as stored in ZIP entries.
class DeflateCompressor final : public Compressor {
 public:
  DeflateCompressor(CompressionLevel level, size_t size_hint);
  DeflateCompressor(const DeflateCompressor&) = delete;
  DeflateCompressor& operator=(const DeflateCompressor&) = delete;
  DeflateCompressor(DeflateCompressor&&) = delete;
  DeflateCompressor& operator=(DeflateCompressor&&) = delete;
  ~DeflateCompressor() override;

  void feed(const Byte* data, size_t n) override;
  size_t compress() override;

 private:
  z_stream m_stream;
  // Bytes of m_res holding compressed output, the rest is scratch space.
  size_t m_res_len;

  // Run deflate() over the pending input until it is consumed (or the stream
  // ends when flush is Z_FINISH).
  void run(int flush);
};

}  // namespace mtz
