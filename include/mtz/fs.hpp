#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/stat.h>

#include "mtz/error.hpp"
#include "mtz/types.hpp"

namespace mtz {

namespace io {

#ifdef WIN32
constexpr FileAttr default_file_attrs = 128;
constexpr FileAttr default_dir_attrs = 16;
#else
constexpr FileAttr default_file_attrs = 0100644;
constexpr FileAttr default_dir_attrs = 040755;
#endif

inline struct stat stat_path(const std::string& path) {
  struct stat result{};
  if (stat(path.c_str(), &result) != 0) {
    throw IoError("cannot stat '" + path + "': " + strerror(errno));
  }
  return result;
}

// Platform attributes as stored in the high half of the external attributes.
inline FileAttr attributes_from_stat(const struct stat& st) {
  return static_cast<FileAttr>(st.st_mode & 0xFFFF);
}

inline bool is_directory(const struct stat& st) {
  return (st.st_mode & S_IFMT) == S_IFDIR;
}

}  // namespace io

}  // namespace mtz
