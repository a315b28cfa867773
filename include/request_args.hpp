#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace chanscan {

// Highest frequency accepted from a request, 100 GHz.
constexpr int64_t kMaxRequestHz = 100000000000LL;

// Parsers for HTTP query values. Each returns false for text that is not
// a finite number or is outside the accepted range, leaving out alone.
bool parse_number(const std::string &text, double &out);
// Whole number in [0, INT_MAX].
bool parse_index(const std::string &text, size_t &out);
// MHz in (0, kMaxRequestHz], converted to Hz.
bool parse_mhz(const std::string &text, int64_t &hz);
// Hz in (0, kMaxRequestHz].
bool parse_hz(const std::string &text, int64_t &hz);
// Level in [-200, 200] dB.
bool parse_db(const std::string &text, double &db);

} // namespace chanscan
