#include "request_args.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>

namespace chanscan {

namespace {
bool to_hz(double hz, int64_t &out) {
  if (!(hz > 0.0) || hz > static_cast<double>(kMaxRequestHz))
    return false;
  int64_t rounded = std::llround(hz);
  if (rounded <= 0)
    return false;
  out = rounded;
  return true;
}
} // namespace

bool parse_number(const std::string &text, double &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !std::isfinite(v))
    return false;
  out = v;
  return true;
}

bool parse_index(const std::string &text, size_t &out) {
  double v = 0.0;
  if (!parse_number(text, v) || v < 0.0 ||
      v > static_cast<double>(std::numeric_limits<int>::max()) ||
      v != std::floor(v))
    return false;
  out = static_cast<size_t>(v);
  return true;
}

bool parse_mhz(const std::string &text, int64_t &hz) {
  double mhz = 0.0;
  return parse_number(text, mhz) && to_hz(mhz * 1e6, hz);
}

bool parse_hz(const std::string &text, int64_t &hz) {
  double v = 0.0;
  return parse_number(text, v) && to_hz(v, hz);
}

bool parse_db(const std::string &text, double &db) {
  double v = 0.0;
  if (!parse_number(text, v) || v < -200.0 || v > 200.0)
    return false;
  db = v;
  return true;
}

} // namespace chanscan
