#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace chanscan {

// A configured -f entry. A single frequency has low_hz == high_hz.
struct FrequencySpan {
  int64_t low_hz;
  int64_t high_hz;

  bool is_point() const { return low_hz == high_hz; }
};

// One capture window of the scan. Candidates outside [low_hz, high_hz]
// are not eligible while this step is tuned.
struct ScanStep {
  int64_t center_hz;
  int64_t low_hz;
  int64_t high_hz;

  bool contains(int64_t freq_hz) const {
    return freq_hz >= low_hz && freq_hz <= high_hz;
  }
};

struct RangeProgress {
  size_t current_index;
  size_t total_steps;
  double percent_complete;
};

struct RangeTimeouts {
  double quiet_timeout = 12.0;
  double active_timeout = 20.0;
};

// Splits points and ranges into capture windows. Ranges wider than the
// sample rate are divided so the first and last windows line up with the
// range edges and the rest are evenly spaced between them.
std::vector<ScanStep> build_steps(const std::vector<FrequencySpan> &spans,
                                  double sample_rate);

class RangeScanner {
public:
  // Throws std::invalid_argument when steps is empty.
  RangeScanner(std::vector<ScanStep> steps, RangeTimeouts timeouts,
               double now);

  bool stepping() const { return steps_.size() > 1; }

  // Called once per cycle after scheduling. activity is the cycle's
  // qualifying activity on the current step. Returns true when the
  // scanner moved to another step and the front end must be retuned.
  bool advance(double now, bool activity);

  // Manual retune; false for an index out of range.
  bool jump_to(size_t index, double now);

  const ScanStep &current() const { return steps_[index_]; }
  const std::vector<ScanStep> &steps() const { return steps_; }
  size_t current_index() const { return index_; }
  size_t total_steps() const { return steps_.size(); }
  double step_entry_time() const { return step_entry_; }
  bool activity_seen() const { return activity_seen_; }
  RangeProgress progress() const;

  const RangeTimeouts &timeouts() const { return timeouts_; }

private:
  std::vector<ScanStep> steps_;
  RangeTimeouts timeouts_;
  size_t index_{};
  double step_entry_{};
  bool activity_seen_{};
};

} // namespace chanscan
