#pragma once

#include <cstdlib>
#include <iostream>
#include <mutex>

#include "mtz/common.hpp"

namespace mtz {

namespace log {

// Workers log concurrently, keep each line in one piece.
inline std::mutex& output_mutex() {
  static std::mutex mutex;
  return mutex;
}

template <typename... Ts>
[[noreturn]] void panic(Ts... args) {
  {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[ERROR] ";
    (std::cerr << ... << args);
    std::cerr << std::endl;
  }
  exit(-1);
}

template <typename... Ts>
void warn(Ts... args) {
  std::lock_guard<std::mutex> lock(output_mutex());
  std::cerr << "[WARN] ";
  (std::cerr << ... << args);
  std::cerr << std::endl;
}

template <typename... Ts>
void log(Ts... args) {
  if (log_info_switch) {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[INFO] ";
    (std::cerr << ... << args);
    std::cerr << std::endl;
  }
}

}  // namespace log

}  // namespace mtz
