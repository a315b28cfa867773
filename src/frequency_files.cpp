#include "frequency_files.hpp"

#include "logging.hpp"
#include "scan/spectrum.hpp"
#include <cmath>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace chanscan {

PriorityList load_priority_file(const std::string &path, int64_t spacing_hz) {
  std::ifstream in(path);
  if (!in.is_open())
    throw ConfigError("Cannot open priority file: " + path);

  PriorityList list;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto hash = line.find('#');
    if (hash != std::string::npos)
      line = line.substr(0, hash);
    auto start = line.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
      continue;
    auto end = line.find_last_not_of(" \t\r\n");
    std::string value = line.substr(start, end - start + 1);

    double hz = 0.0;
    try {
      size_t used = 0;
      hz = std::stod(value, &used);
      if (used != value.size())
        throw std::invalid_argument(value);
    } catch (const std::exception &) {
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": not a frequency: '" + value + "'");
    }
    if (!std::isfinite(hz) || hz <= 0.0)
      throw ConfigError(path + ":" + std::to_string(line_no) +
                        ": frequency must be positive");
    if (!list.append(round_to_spacing(hz, spacing_hz)))
      log::warn(path + ":" + std::to_string(line_no) +
                ": duplicate priority frequency ignored");
  }
  log::info("Loaded " + std::to_string(list.size()) +
            " priority frequencies from " + path);
  return list;
}

namespace {
int64_t mhz_to_hz(const YAML::Node &node) {
  double mhz = node.as<double>();
  if (!std::isfinite(mhz) || mhz <= 0.0)
    throw ConfigError("Lockout frequency must be positive");
  return std::llround(mhz * 1e6);
}
} // namespace

LockoutSet load_lockout_file(const std::string &path, int64_t spacing_hz) {
  LockoutSet set;
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (root.IsNull())
      return set;
    if (!root.IsMap())
      throw ConfigError("Lockout file must be a YAML mapping: " + path);

    if (const YAML::Node freqs = root["frequencies"]) {
      if (!freqs.IsSequence())
        throw ConfigError("'frequencies' must be a list in " + path);
      for (const auto &f : freqs)
        set.add(round_to_spacing(static_cast<double>(mhz_to_hz(f)),
                                 spacing_hz),
                true);
    }
    if (const YAML::Node ranges = root["ranges"]) {
      if (!ranges.IsSequence())
        throw ConfigError("'ranges' must be a list in " + path);
      for (const auto &r : ranges) {
        if (!r["min"] || !r["max"])
          throw ConfigError("Lockout range needs min and max in " + path);
        int64_t lo = mhz_to_hz(r["min"]);
        int64_t hi = mhz_to_hz(r["max"]);
        if (!set.add_range(lo, hi, true))
          throw ConfigError("Lockout range max must be larger than min in " +
                            path);
      }
    }
  } catch (const YAML::Exception &e) {
    throw ConfigError("Cannot read lockout file " + path + ": " + e.what());
  }
  log::info("Loaded " + std::to_string(set.frequencies().size()) +
            " lockout frequencies and " + std::to_string(set.ranges().size()) +
            " lockout ranges from " + path);
  return set;
}

} // namespace chanscan
