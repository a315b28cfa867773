#include "scan/range_scanner.hpp"

#include "logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace chanscan {

namespace {
ScanStep make_step(int64_t center, int64_t half_rate, int64_t lo, int64_t hi) {
  ScanStep s;
  s.center_hz = center;
  s.low_hz = std::max(center - half_rate, lo);
  s.high_hz = std::min(center + half_rate, hi);
  return s;
}
} // namespace

std::vector<ScanStep> build_steps(const std::vector<FrequencySpan> &spans,
                                  double sample_rate) {
  std::vector<ScanStep> steps;
  const int64_t rate = static_cast<int64_t>(sample_rate);
  const int64_t half = rate / 2;

  for (const auto &span : spans) {
    if (span.is_point()) {
      steps.push_back(ScanStep{span.low_hz, span.low_hz - half,
                               span.low_hz + half});
      continue;
    }
    const int64_t width = span.high_hz - span.low_hz;
    if (width <= rate) {
      steps.push_back(make_step(span.low_hz + width / 2, half, span.low_hz,
                                span.high_hz));
      continue;
    }
    const int64_t start = span.low_hz + half;
    const int64_t end = span.high_hz - half;
    const int64_t moves = (end - start) / rate + 2;
    const int64_t distance = (end - start) / (moves - 1);
    log::debug("Range " + std::to_string(span.low_hz) + "-" +
               std::to_string(span.high_hz) + " split into " +
               std::to_string(moves) + " steps " + std::to_string(distance) +
               " Hz apart");
    int64_t center = start;
    for (int64_t i = 0; i < moves; ++i) {
      steps.push_back(make_step(center, half, span.low_hz, span.high_hz));
      center += distance;
    }
  }
  return steps;
}

RangeScanner::RangeScanner(std::vector<ScanStep> steps,
                           RangeTimeouts timeouts, double now)
    : steps_(std::move(steps)), timeouts_(timeouts), step_entry_(now) {
  if (steps_.empty())
    throw std::invalid_argument("range scanner needs at least one step");
}

bool RangeScanner::advance(double now, bool activity) {
  if (!stepping())
    return false;
  if (activity)
    activity_seen_ = true;

  // activity stretches the dwell to the active timeout, never beyond it
  double dwell = timeouts_.quiet_timeout;
  if (activity_seen_)
    dwell = std::max(timeouts_.quiet_timeout, timeouts_.active_timeout);
  if (now - step_entry_ < dwell)
    return false;

  index_ = (index_ + 1) % steps_.size();
  step_entry_ = now;
  activity_seen_ = false;
  return true;
}

bool RangeScanner::jump_to(size_t index, double now) {
  if (index >= steps_.size())
    return false;
  index_ = index;
  step_entry_ = now;
  activity_seen_ = false;
  return true;
}

RangeProgress RangeScanner::progress() const {
  RangeProgress p;
  p.current_index = index_;
  p.total_steps = steps_.size();
  p.percent_complete =
      static_cast<double>(index_) / static_cast<double>(steps_.size());
  return p;
}

} // namespace chanscan
