#include "config.hpp"
#include "channel_log.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace chanscan {
namespace {
std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

double parse_double(const std::string &key, const std::string &value) {
  try {
    size_t used = 0;
    double v = std::stod(value, &used);
    if (used != value.size() || !std::isfinite(v))
      throw std::invalid_argument(value);
    return v;
  } catch (const std::exception &) {
    throw ConfigError("Invalid number for " + key + ": '" + value + "'");
  }
}

int parse_int(const std::string &key, const std::string &value) {
  double v = parse_double(key, value);
  if (v != std::floor(v) || std::fabs(v) > 2147483647.0)
    throw ConfigError("Invalid integer for " + key + ": '" + value + "'");
  return static_cast<int>(v);
}

bool parse_bool(const std::string &key, const std::string &value) {
  std::string s = value;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off")
    return false;
  throw ConfigError("Invalid boolean for " + key + ": '" + value + "'");
}

std::vector<std::string> split_list(const std::string &value) {
  std::string s = value;
  std::replace(s.begin(), s.end(), ',', ' ');
  std::istringstream in(s);
  std::vector<std::string> out;
  std::string item;
  while (in >> item)
    out.push_back(item);
  return out;
}
} // namespace

FrequencySpan parse_frequency_spec(const std::string &spec) {
  std::string s = trim(spec);
  // a dash after the first character separates a range, "e-" is an exponent
  size_t dash = std::string::npos;
  for (size_t i = 1; i < s.size(); ++i) {
    if (s[i] == '-' && s[i - 1] != 'e' && s[i - 1] != 'E') {
      dash = i;
      break;
    }
  }
  if (dash == std::string::npos) {
    double f = parse_double("freq", s);
    if (f <= 0.0)
      throw ConfigError("Frequency must be positive: '" + spec + "'");
    int64_t hz = std::llround(f);
    return FrequencySpan{hz, hz};
  }
  double lo = parse_double("freq", trim(s.substr(0, dash)));
  double hi = parse_double("freq", trim(s.substr(dash + 1)));
  if (lo <= 0.0 || lo >= hi)
    throw ConfigError("Upper frequency must be larger than lower frequency: '" +
                      spec + "'");
  return FrequencySpan{std::llround(lo), std::llround(hi)};
}

Config Config::load(const std::string &path) {
  Config cfg;
  std::ifstream in(path);
  if (!in.is_open())
    return cfg;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line = line.substr(0, hash);
    line = trim(line);
    if (line.empty())
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos)
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": expected key = value");
    cfg.set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
  }
  return cfg;
}

void Config::set(const std::string &key, const std::string &value) {
  if (key == "demod") {
    num_demod = parse_int(key, value);
  } else if (key == "demodulator") {
    if (!parse_demod_kind(value, demod))
      throw ConfigError("Unknown demodulator type: '" + value + "'");
  } else if (key == "freq") {
    freq_specs = split_list(value);
  } else if (key == "rate") {
    sample_rate = parse_double(key, value);
  } else if (key == "threshold") {
    threshold_db = parse_int(key, value);
  } else if (key == "squelch") {
    squelch_db = parse_int(key, value);
  } else if (key == "quiet_timeout") {
    quiet_timeout = parse_double(key, value);
  } else if (key == "active_timeout") {
    active_timeout = parse_double(key, value);
  } else if (key == "channel_spacing") {
    channel_spacing = parse_int(key, value);
  } else if (key == "priority") {
    priority_file = value;
  } else if (key == "lockout") {
    lockout_file = value;
  } else if (key == "auto_priority") {
    auto_priority = parse_bool(key, value);
  } else if (key == "voice_floor") {
    voice_floor = parse_int(key, value);
  } else if (key == "write") {
    record = parse_bool(key, value);
  } else if (key == "min_recording") {
    min_recording = parse_double(key, value);
  } else if (key == "max_recording") {
    max_recording = parse_double(key, value);
  } else if (key == "log_type") {
    log_type = value;
  } else if (key == "log_target") {
    log_target = value;
  } else if (key == "log_active_timeout") {
    log_active_timeout = parse_int(key, value);
  } else if (key == "device") {
    device_index = parse_int(key, value);
  } else if (key == "fft_size") {
    fft_size = parse_int(key, value);
  } else if (key == "gain") {
    rf_gain_db = parse_double(key, value);
  } else if (key == "correction") {
    freq_correction = parse_int(key, value);
  } else if (key == "db_path") {
    db_path = value;
  } else if (key == "web_port") {
    web_port = parse_int(key, value);
  } else if (key == "log_level") {
    log_level = value;
  } else if (key == "debug_file") {
    debug_file = value;
  } else {
    throw ConfigError("Unknown configuration key: '" + key + "'");
  }
}

void Config::validate() const {
  if (num_demod < 1)
    throw ConfigError("Number of demodulators must be at least 1");
  if (freq_specs.empty())
    throw ConfigError("At least one frequency or range is required");
  if (!(sample_rate > 0.0))
    throw ConfigError("Sample rate must be positive");
  if (channel_spacing <= 0)
    throw ConfigError("Channel spacing must be positive");
  if (quiet_timeout < 0.0 || active_timeout < 0.0)
    throw ConfigError("Timeouts must not be negative");
  if (min_recording < 0.0 || max_recording < 0.0)
    throw ConfigError("Recording limits must not be negative");
  if (max_recording > 0.0 && max_recording < min_recording)
    throw ConfigError("max_recording must not be shorter than min_recording");
  if (log_active_timeout < 0)
    throw ConfigError("log_active_timeout must not be negative");
  if (voice_floor < 0)
    throw ConfigError("voice_floor must not be negative");
  if (fft_size < 16 || (fft_size & (fft_size - 1)) != 0)
    throw ConfigError("fft_size must be a power of two of at least 16");
  if (log_type != "none" && log_type != "debug" && log_type != "fixed-field" &&
      log_type != "sqlite" && log_type != "json-server")
    throw ConfigError("Unknown channel log type: '" + log_type + "'");
  HttpEndpoint endpoint;
  if (log_type == "json-server" && !parse_http_endpoint(log_target, endpoint))
    throw ConfigError("log_target must be an http:// URL for json-server");
  spans();
}

std::vector<FrequencySpan> Config::spans() const {
  std::vector<FrequencySpan> out;
  out.reserve(freq_specs.size());
  for (const auto &spec : freq_specs)
    out.push_back(parse_frequency_spec(spec));
  return out;
}

EngineConfig Config::engine_config() const {
  EngineConfig e;
  e.num_demod = static_cast<size_t>(num_demod);
  e.channel_spacing_hz = channel_spacing;
  e.threshold_db = static_cast<float>(threshold_db);
  e.quiet_timeout = quiet_timeout;
  e.active_timeout = active_timeout;
  e.record = record;
  e.min_recording = min_recording;
  e.max_recording = max_recording;
  // the none sink never repeats active events
  e.log_active_timeout = log_type == "none" ? 0 : log_active_timeout;
  e.auto_priority = auto_priority;
  e.voice_floor = voice_floor;
  e.expected_bins = static_cast<size_t>(fft_size);
  return e;
}

} // namespace chanscan
