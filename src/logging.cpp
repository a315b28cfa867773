#include "logging.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace chanscan {
namespace log {

namespace {
std::mutex log_mutex;
std::atomic<Level> current_level{Level::Info};
std::ofstream log_file;

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::tm tm;
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%F %T", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
  return out;
}

} // namespace

void init(Level level, const std::string &file_path) {
  current_level.store(level);
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open())
    log_file.close();
  if (!file_path.empty()) {
    log_file.open(file_path, std::ios::app);
    if (!log_file.is_open())
      std::cerr << "Cannot open log file " << file_path << std::endl;
  }
}

void shutdown() {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open())
    log_file.close();
}

const char *level_to_string(Level lvl) {
  switch (lvl) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "";
}

Level level_from_string(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "debug")
    return Level::Debug;
  if (s == "warn" || s == "warning")
    return Level::Warn;
  if (s == "error")
    return Level::Error;
  return Level::Info;
}

bool enabled(Level level) { return level >= current_level.load(); }

void log(Level level, const std::string &msg) {
  if (!enabled(level))
    return;
  std::string line =
      "[" + timestamp() + "][" + level_to_string(level) + "] " + msg;
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << line << std::endl;
  if (log_file.is_open())
    log_file << line << std::endl;
}

void debug(const std::string &msg) { log(Level::Debug, msg); }
void info(const std::string &msg) { log(Level::Info, msg); }
void warn(const std::string &msg) { log(Level::Warn, msg); }
void error(const std::string &msg) { log(Level::Error, msg); }

} // namespace log
} // namespace chanscan
