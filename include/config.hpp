#pragma once
#include "scan/demod_kind.hpp"
#include "scan/range_scanner.hpp"
#include "scan/scan_engine.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chanscan {

// Invalid configuration detected before the scan loop starts.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct Config {
  // scanner
  int num_demod = 4;
  DemodKind demod = DemodKind::NBFM;
  std::vector<std::string> freq_specs{"146000000"};
  double sample_rate = 2.4e6;
  int threshold_db = 10;
  int squelch_db = -60;
  double quiet_timeout = 12.0;
  double active_timeout = 20.0;
  int64_t channel_spacing = 5000;
  std::string priority_file;
  std::string lockout_file;
  bool auto_priority = false;
  int voice_floor = 1;
  bool record = false;
  double min_recording = 0.0;
  double max_recording = 0.0;

  // channel log
  std::string log_type = "none";
  std::string log_target = "channel-log";
  int log_active_timeout = 15;

  // front end
  int device_index = 0;
  int fft_size = 1024;
  double rf_gain_db = 0.0; // 0 selects automatic gain
  int freq_correction = 0;

  // service
  std::string db_path = "channels.db";
  int web_port = 8080;
  std::string log_level = "info";
  std::string debug_file;

  // Reads key = value lines. A missing file leaves the defaults. Throws
  // ConfigError for unknown keys or unparsable values.
  static Config load(const std::string &path);

  // Applies one key = value setting, shared by the file and CLI paths.
  void set(const std::string &key, const std::string &value);

  // Throws ConfigError for values the scanner cannot run with.
  void validate() const;

  std::vector<FrequencySpan> spans() const;
  EngineConfig engine_config() const;
};

// "146000000" or "460e6-470e6" in Hz.
FrequencySpan parse_frequency_spec(const std::string &spec);

} // namespace chanscan
