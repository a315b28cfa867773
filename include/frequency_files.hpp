#pragma once
#include "config.hpp"
#include "scan/frequency_lists.hpp"
#include <cstdint>
#include <string>

namespace chanscan {

// One frequency in Hz per line, highest priority first. Blank lines and
// '#' comments are skipped, values are rounded to the channel spacing.
PriorityList load_priority_file(const std::string &path, int64_t spacing_hz);

// YAML document with optional "frequencies" (MHz list) and "ranges"
// (list of {min, max} in MHz). Every entry is marked saved.
LockoutSet load_lockout_file(const std::string &path, int64_t spacing_hz);

} // namespace chanscan
