#pragma once

#include <utility>
#include <vector>

#include "mtz/types.hpp"

namespace mtz {

class Compressor {
 public:
  Compressor() : m_finish(false) {}

  Compressor(const Compressor&) = delete;
  Compressor& operator=(const Compressor&) = delete;
  Compressor(Compressor&&) = delete;
  Compressor& operator=(Compressor&&) = delete;

  virtual ~Compressor() = default;

  // Feed the next chunk of content to be compressed.
  virtual void feed(const Byte* data, size_t n) = 0;

  // Finish the stream after the last chunk.
  // Return the length of compressed content.
  virtual size_t compress() = 0;

  [[nodiscard]] size_t get_length_compressed() const { return m_res.size(); }

  // Move the compressed content out.
  // Call compress() first, the compressor is spent afterwards.
  std::vector<Byte> take_result() {
    m_res.shrink_to_fit();
    return std::move(m_res);
  }

 protected:
  // Compressed content.
  std::vector<Byte> m_res;
  // Set when compress() is called and finished.
  bool m_finish;
};

}  // namespace mtz
