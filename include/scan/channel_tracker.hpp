#pragma once
#include "scan/frequency_lists.hpp"
#include "scan/spectrum.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace chanscan {

enum class ChannelState { Idle, Active };

const char *state_to_string(ChannelState s);

struct ChannelEntry {
  int64_t freq_hz{};
  double last_seen{};
  ChannelState state{ChannelState::Idle};
  bool is_priority{};
  bool is_locked_out{};
  bool is_unsaved_lockout{};
  bool recording_active{};
  double recording_start{};
  float last_power_db{};
  bool heard{}; // matched a candidate in the latest cycle
};

struct StateTransition {
  int64_t freq_hz;
  ChannelState from;
  ChannelState to;
  double time;
};

// Per-bucket activity state. Buckets are created by the first matching
// candidate and erased once Idle for longer than the retention period.
class ChannelStateTracker {
public:
  // A retention of 0 selects max(10 * quiet_timeout, 60 s).
  explicit ChannelStateTracker(double quiet_timeout, double retention = 0.0);

  std::vector<StateTransition> update(const std::vector<Candidate> &candidates,
                                      double now, const LockoutSet &lockouts,
                                      const PriorityList &priorities);

  // Recomputes the lockout and priority flags without a new cycle.
  void refresh_flags(const LockoutSet &lockouts,
                     const PriorityList &priorities);

  // Candidates whose bucket is not locked out, order preserved.
  std::vector<Candidate>
  eligible(const std::vector<Candidate> &candidates) const;

  const ChannelEntry *find(int64_t freq_hz) const;
  bool is_active(int64_t freq_hz) const;
  bool is_recording(int64_t freq_hz) const;

  void begin_recording(int64_t freq_hz, double now);
  void end_recording(int64_t freq_hz);

  double quiet_timeout() const { return quiet_timeout_; }
  const std::map<int64_t, ChannelEntry> &entries() const { return entries_; }

private:
  void apply_flags(ChannelEntry &e, const LockoutSet &lockouts,
                   const PriorityList &priorities) const;

  double quiet_timeout_;
  double retention_;
  bool derived_retention_;
  std::map<int64_t, ChannelEntry> entries_;
};

} // namespace chanscan
