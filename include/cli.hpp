#pragma once
#include "config.hpp"

namespace chanscan {

// Loads the config file named by -c (default chanscan.conf) and applies
// command line overrides on top. Returns false when --help was printed.
// Throws ConfigError for malformed options or values.
bool parse_command_line(int argc, const char *const argv[], Config &cfg);

} // namespace chanscan
