#pragma once
#include "scan/channel_tracker.hpp"
#include "scan/frequency_lists.hpp"
#include "scan/range_scanner.hpp"
#include "scan/spectrum.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace chanscan {

// Frequency a slot is tuned to when it holds no channel.
constexpr int64_t kParkedHz = 0;

struct DemodulatorSlot {
  size_t id{};
  int64_t assigned_hz{kParkedHz};
  double tuned_since{};
  bool is_priority_hold{};

  bool assigned() const { return assigned_hz != kParkedHz; }
};

enum class SlotAction { Assigned, Preempted, Parked };

enum class ReleaseReason {
  None,
  Idle,
  LockedOut,
  OutOfWindow,
  MaxRecording,
  Preempted,
  Shutdown
};

const char *action_to_string(SlotAction a);
const char *reason_to_string(ReleaseReason r);

struct SlotChange {
  size_t slot;
  int64_t from_hz;
  int64_t to_hz;
  SlotAction action;
  ReleaseReason reason;
  double prev_tuned_since;
  bool prev_priority_hold{};
};

struct SchedulerConfig {
  // Recording mode: a slot with an open recording is never preempted.
  bool record = false;
  // Seconds before a held slot is cycled to split the recording, 0 = off.
  double max_recording = 0.0;
};

struct ScheduleInput {
  const std::vector<Candidate> &eligible;
  const ChannelStateTracker &tracker;
  const PriorityList &priorities;
  const LockoutSet &lockouts;
  const ScanStep &window;
  double now;
};

class DemodulatorScheduler {
public:
  explicit DemodulatorScheduler(size_t num_slots,
                                SchedulerConfig cfg = SchedulerConfig());

  // One allocation pass. Held slots stay put, idle slots are filled in
  // rank order and listed candidates may preempt lower ranked holders.
  // Slots whose channel went idle, got locked out or left the window are
  // parked. Changes are listed in the order they must be applied.
  std::vector<SlotChange> schedule(const ScheduleInput &in);

  std::vector<SlotChange> release_all(ReleaseReason reason);

  // Puts a slot back to a frequency, used when a tuning command failed.
  void restore(size_t slot, int64_t freq_hz, double tuned_since,
               bool priority_hold = false);

  const std::vector<DemodulatorSlot> &slots() const { return slots_; }
  std::vector<int64_t> assigned_frequencies() const;
  // Index of the slot holding freq_hz, or -1.
  int slot_for(int64_t freq_hz) const;

  const SchedulerConfig &config() const { return cfg_; }

private:
  SchedulerConfig cfg_;
  std::vector<DemodulatorSlot> slots_;
};

} // namespace chanscan
