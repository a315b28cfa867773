#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace chanscan {

// Ordered priority frequencies, index 0 is the highest priority.
class PriorityList {
public:
  static constexpr int kUnlisted = -1;

  PriorityList() = default;
  explicit PriorityList(std::vector<int64_t> freqs);

  // Position in the list or kUnlisted.
  int rank(int64_t freq_hz) const;
  bool contains(int64_t freq_hz) const { return rank(freq_hz) != kUnlisted; }
  // Appends at the lowest priority; false when already listed.
  bool append(int64_t freq_hz);

  size_t size() const { return freqs_.size(); }
  bool empty() const { return freqs_.empty(); }
  const std::vector<int64_t> &frequencies() const { return freqs_; }

private:
  std::vector<int64_t> freqs_;
};

// True when rank a takes precedence over rank b. Listed beats unlisted,
// lower index beats higher.
bool outranks(int a, int b);

struct LockoutFrequency {
  int64_t freq_hz;
  bool saved;
};

struct LockoutRange {
  int64_t low_hz;
  int64_t high_hz;
  bool saved;
};

// Locked out frequencies and inclusive ranges. Entries from the lockout
// file are saved, entries added while running are not.
class LockoutSet {
public:
  bool locked_out(int64_t freq_hz) const;
  // Locked out, but only by entries added at runtime.
  bool unsaved_only(int64_t freq_hz) const;

  bool add(int64_t freq_hz, bool saved = false);
  bool add_range(int64_t low_hz, int64_t high_hz, bool saved = false);
  size_t clear_unsaved();

  const std::vector<LockoutFrequency> &frequencies() const { return freqs_; }
  const std::vector<LockoutRange> &ranges() const { return ranges_; }
  bool empty() const { return freqs_.empty() && ranges_.empty(); }

private:
  std::vector<LockoutFrequency> freqs_;
  std::vector<LockoutRange> ranges_;
};

} // namespace chanscan
