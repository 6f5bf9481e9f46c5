#pragma once

namespace mtz {

// Print [INFO] lines (set by --verbose).
inline bool log_info_switch = false;

}  // namespace mtz
