#pragma once
#include <string>

namespace chanscan {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error };

// Messages go to stderr; when a file path is given they are also appended
// to that file (the --debug_file option).
void init(Level level = Level::Info, const std::string &file_path = "");
void shutdown();
Level level_from_string(const std::string &name);
const char *level_to_string(Level lvl);
bool enabled(Level level);
void log(Level level, const std::string &msg);
void debug(const std::string &msg);
void info(const std::string &msg);
void warn(const std::string &msg);
void error(const std::string &msg);

} // namespace log
} // namespace chanscan
