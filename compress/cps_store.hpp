#pragma once

#include "compress/compressor.hpp"

namespace mtz {

class StoreCompressor final : public Compressor {
 public:
  explicit StoreCompressor(size_t size_hint) { m_res.reserve(size_hint); }
  StoreCompressor(const StoreCompressor&) = delete;
  StoreCompressor& operator=(const StoreCompressor&) = delete;
  StoreCompressor(StoreCompressor&&) = delete;
  StoreCompressor& operator=(StoreCompressor&&) = delete;
  ~StoreCompressor() override = default;

  void feed(const Byte* data, size_t n) override {
    m_res.insert(m_res.end(), data, data + n);
  }

  size_t compress() override {
    m_finish = true;
    return m_res.size();
  }
};

}  // namespace mtz
