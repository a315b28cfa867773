#pragma once
#include <chrono>

namespace chanscan {

// Seconds since the Unix epoch, the time base of every scanner timestamp.
inline double wall_clock() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

} // namespace chanscan
