#include "scan/frequency_lists.hpp"

#include <algorithm>

namespace chanscan {

constexpr int PriorityList::kUnlisted;

PriorityList::PriorityList(std::vector<int64_t> freqs) {
  for (auto f : freqs)
    append(f);
}

int PriorityList::rank(int64_t freq_hz) const {
  auto it = std::find(freqs_.begin(), freqs_.end(), freq_hz);
  if (it == freqs_.end())
    return kUnlisted;
  return static_cast<int>(it - freqs_.begin());
}

bool PriorityList::append(int64_t freq_hz) {
  if (contains(freq_hz))
    return false;
  freqs_.push_back(freq_hz);
  return true;
}

bool outranks(int a, int b) {
  if (a == PriorityList::kUnlisted)
    return false;
  if (b == PriorityList::kUnlisted)
    return true;
  return a < b;
}

bool LockoutSet::locked_out(int64_t freq_hz) const {
  for (const auto &f : freqs_) {
    if (f.freq_hz == freq_hz)
      return true;
  }
  for (const auto &r : ranges_) {
    if (r.low_hz <= freq_hz && freq_hz <= r.high_hz)
      return true;
  }
  return false;
}

bool LockoutSet::unsaved_only(int64_t freq_hz) const {
  bool any = false;
  for (const auto &f : freqs_) {
    if (f.freq_hz != freq_hz)
      continue;
    if (f.saved)
      return false;
    any = true;
  }
  for (const auto &r : ranges_) {
    if (freq_hz < r.low_hz || freq_hz > r.high_hz)
      continue;
    if (r.saved)
      return false;
    any = true;
  }
  return any;
}

bool LockoutSet::add(int64_t freq_hz, bool saved) {
  for (const auto &f : freqs_) {
    if (f.freq_hz == freq_hz)
      return false;
  }
  freqs_.push_back(LockoutFrequency{freq_hz, saved});
  return true;
}

bool LockoutSet::add_range(int64_t low_hz, int64_t high_hz, bool saved) {
  if (low_hz >= high_hz)
    return false;
  ranges_.push_back(LockoutRange{low_hz, high_hz, saved});
  return true;
}

size_t LockoutSet::clear_unsaved() {
  size_t before = freqs_.size() + ranges_.size();
  freqs_.erase(std::remove_if(freqs_.begin(), freqs_.end(),
                              [](const LockoutFrequency &f) { return !f.saved; }),
               freqs_.end());
  ranges_.erase(std::remove_if(ranges_.begin(), ranges_.end(),
                               [](const LockoutRange &r) { return !r.saved; }),
                ranges_.end());
  return before - freqs_.size() - ranges_.size();
}

} // namespace chanscan
