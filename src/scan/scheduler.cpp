#include "scan/scheduler.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace chanscan {

namespace {

struct Ranked {
  int64_t freq_hz;
  float power_db;
  int rank;
};

// rank, then power descending, then frequency ascending
bool precedes(const Ranked &a, const Ranked &b) {
  if (a.rank != b.rank) {
    if (outranks(a.rank, b.rank))
      return true;
    if (outranks(b.rank, a.rank))
      return false;
  }
  if (a.power_db != b.power_db)
    return a.power_db > b.power_db;
  return a.freq_hz < b.freq_hz;
}

} // namespace

const char *action_to_string(SlotAction a) {
  switch (a) {
  case SlotAction::Assigned:
    return "assigned";
  case SlotAction::Preempted:
    return "preempted";
  case SlotAction::Parked:
    return "parked";
  }
  return "";
}

const char *reason_to_string(ReleaseReason r) {
  switch (r) {
  case ReleaseReason::None:
    return "none";
  case ReleaseReason::Idle:
    return "idle";
  case ReleaseReason::LockedOut:
    return "locked out";
  case ReleaseReason::OutOfWindow:
    return "out of window";
  case ReleaseReason::MaxRecording:
    return "max recording";
  case ReleaseReason::Preempted:
    return "preempted";
  case ReleaseReason::Shutdown:
    return "shutdown";
  }
  return "";
}

DemodulatorScheduler::DemodulatorScheduler(size_t num_slots,
                                           SchedulerConfig cfg)
    : cfg_(cfg), slots_(num_slots) {
  for (size_t i = 0; i < slots_.size(); ++i)
    slots_[i].id = i;
}

std::vector<SlotChange>
DemodulatorScheduler::schedule(const ScheduleInput &in) {
  std::vector<SlotChange> changes;
  std::map<int64_t, float> heard;
  for (const auto &c : in.eligible)
    heard.emplace(c.freq_hz, c.power_db);

  // Hold or park what is already tuned.
  std::set<int64_t> held;
  for (auto &slot : slots_) {
    if (!slot.assigned())
      continue;
    const int64_t f = slot.assigned_hz;
    ReleaseReason reason = ReleaseReason::None;
    if (in.lockouts.locked_out(f))
      reason = ReleaseReason::LockedOut;
    else if (!in.window.contains(f))
      reason = ReleaseReason::OutOfWindow;
    else if (heard.count(f) == 0 && !in.tracker.is_active(f))
      reason = ReleaseReason::Idle;
    else if (cfg_.max_recording > 0.0 &&
             in.now - slot.tuned_since >= cfg_.max_recording)
      reason = ReleaseReason::MaxRecording;

    if (reason != ReleaseReason::None) {
      changes.push_back(SlotChange{slot.id, f, kParkedHz, SlotAction::Parked,
                                   reason, slot.tuned_since,
                                   slot.is_priority_hold});
      slot.assigned_hz = kParkedHz;
      slot.is_priority_hold = false;
      continue;
    }
    slot.is_priority_hold = in.priorities.contains(f);
    held.insert(f);
  }

  std::vector<Ranked> pending;
  for (const auto &c : in.eligible) {
    if (held.count(c.freq_hz) || !in.window.contains(c.freq_hz) ||
        in.lockouts.locked_out(c.freq_hz))
      continue;
    pending.push_back(
        Ranked{c.freq_hz, c.power_db, in.priorities.rank(c.freq_hz)});
  }
  std::sort(pending.begin(), pending.end(), precedes);

  for (const auto &c : pending) {
    auto idle = std::find_if(
        slots_.begin(), slots_.end(),
        [](const DemodulatorSlot &s) { return !s.assigned(); });
    if (idle != slots_.end()) {
      changes.push_back(SlotChange{idle->id, kParkedHz, c.freq_hz,
                                   SlotAction::Assigned, ReleaseReason::None,
                                   idle->tuned_since});
      idle->assigned_hz = c.freq_hz;
      idle->tuned_since = in.now;
      idle->is_priority_hold = c.rank != PriorityList::kUnlisted;
      continue;
    }
    if (c.rank == PriorityList::kUnlisted)
      continue;

    // Lowest precedence holder that c outranks and that is not busy.
    DemodulatorSlot *victim = nullptr;
    Ranked victim_rank{};
    for (auto &slot : slots_) {
      Ranked r;
      r.freq_hz = slot.assigned_hz;
      r.rank = in.priorities.rank(slot.assigned_hz);
      auto h = heard.find(slot.assigned_hz);
      r.power_db = h == heard.end() ? -std::numeric_limits<float>::infinity()
                                    : h->second;
      if (!outranks(c.rank, r.rank))
        continue;
      if (cfg_.record && in.tracker.is_recording(slot.assigned_hz))
        continue;
      if (!victim || precedes(victim_rank, r)) {
        victim = &slot;
        victim_rank = r;
      }
    }
    if (!victim)
      continue;
    changes.push_back(SlotChange{victim->id, victim->assigned_hz, c.freq_hz,
                                 SlotAction::Preempted,
                                 ReleaseReason::Preempted,
                                 victim->tuned_since,
                                 victim->is_priority_hold});
    victim->assigned_hz = c.freq_hz;
    victim->tuned_since = in.now;
    victim->is_priority_hold = true;
  }
  return changes;
}

std::vector<SlotChange>
DemodulatorScheduler::release_all(ReleaseReason reason) {
  std::vector<SlotChange> changes;
  for (auto &slot : slots_) {
    if (!slot.assigned())
      continue;
    changes.push_back(SlotChange{slot.id, slot.assigned_hz, kParkedHz,
                                 SlotAction::Parked, reason,
                                 slot.tuned_since, slot.is_priority_hold});
    slot.assigned_hz = kParkedHz;
    slot.is_priority_hold = false;
  }
  return changes;
}

void DemodulatorScheduler::restore(size_t slot, int64_t freq_hz,
                                   double tuned_since, bool priority_hold) {
  if (slot >= slots_.size())
    return;
  slots_[slot].assigned_hz = freq_hz;
  slots_[slot].tuned_since = tuned_since;
  slots_[slot].is_priority_hold = freq_hz != kParkedHz && priority_hold;
}

std::vector<int64_t> DemodulatorScheduler::assigned_frequencies() const {
  std::vector<int64_t> out;
  out.reserve(slots_.size());
  for (const auto &s : slots_)
    out.push_back(s.assigned_hz);
  return out;
}

int DemodulatorScheduler::slot_for(int64_t freq_hz) const {
  if (freq_hz == kParkedHz)
    return -1;
  for (const auto &s : slots_) {
    if (s.assigned_hz == freq_hz)
      return static_cast<int>(s.id);
  }
  return -1;
}

} // namespace chanscan
