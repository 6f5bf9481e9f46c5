#pragma once

#include <stdexcept>
#include <string>

namespace mtz {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// A compression level outside [0, 9].
class InvalidCompressionLevel : public Error {
 public:
  explicit InvalidCompressionLevel(int value)
      : Error("invalid compression level number: " + std::to_string(value)),
        m_value(value) {}

  [[nodiscard]] int value() const { return m_value; }

 private:
  int m_value;
};

// Reading a source or writing the archive failed.
class IoError : public Error {
 public:
  explicit IoError(const std::string& what) : Error(what) {}
};

// A value does not fit into its 16/32-bit ZIP field.
class CapacityError : public Error {
 public:
  explicit CapacityError(const std::string& what) : Error(what) {}
};

}  // namespace mtz
