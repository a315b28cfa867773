#include "scan/channel_tracker.hpp"

#include <algorithm>

namespace chanscan {

namespace {
double derive_retention(double quiet_timeout) {
  return std::max(10.0 * quiet_timeout, 60.0);
}
} // namespace

const char *state_to_string(ChannelState s) {
  return s == ChannelState::Active ? "active" : "idle";
}

ChannelStateTracker::ChannelStateTracker(double quiet_timeout,
                                         double retention)
    : quiet_timeout_(quiet_timeout), retention_(retention),
      derived_retention_(retention <= 0.0) {
  if (derived_retention_)
    retention_ = derive_retention(quiet_timeout_);
}

void ChannelStateTracker::apply_flags(ChannelEntry &e,
                                      const LockoutSet &lockouts,
                                      const PriorityList &priorities) const {
  e.is_locked_out = lockouts.locked_out(e.freq_hz);
  e.is_unsaved_lockout = e.is_locked_out && lockouts.unsaved_only(e.freq_hz);
  e.is_priority = priorities.contains(e.freq_hz);
}

std::vector<StateTransition>
ChannelStateTracker::update(const std::vector<Candidate> &candidates,
                            double now, const LockoutSet &lockouts,
                            const PriorityList &priorities) {
  std::vector<StateTransition> transitions;

  for (auto &kv : entries_)
    kv.second.heard = false;

  for (const auto &c : candidates) {
    auto it = entries_.find(c.freq_hz);
    if (it == entries_.end()) {
      ChannelEntry e;
      e.freq_hz = c.freq_hz;
      it = entries_.emplace(c.freq_hz, e).first;
    }
    ChannelEntry &e = it->second;
    if (e.state == ChannelState::Idle) {
      e.state = ChannelState::Active;
      transitions.push_back(StateTransition{e.freq_hz, ChannelState::Idle,
                                            ChannelState::Active, now});
    }
    e.last_seen = now;
    e.last_power_db = c.power_db;
    e.heard = true;
  }

  for (auto it = entries_.begin(); it != entries_.end();) {
    ChannelEntry &e = it->second;
    apply_flags(e, lockouts, priorities);
    if (!e.heard && e.state == ChannelState::Active &&
        now - e.last_seen > quiet_timeout_) {
      e.state = ChannelState::Idle;
      transitions.push_back(StateTransition{e.freq_hz, ChannelState::Active,
                                            ChannelState::Idle, now});
    }
    if (e.state == ChannelState::Idle && !e.recording_active &&
        now - e.last_seen > retention_) {
      it = entries_.erase(it);
      continue;
    }
    ++it;
  }
  return transitions;
}

void ChannelStateTracker::refresh_flags(const LockoutSet &lockouts,
                                        const PriorityList &priorities) {
  for (auto &kv : entries_)
    apply_flags(kv.second, lockouts, priorities);
}

std::vector<Candidate>
ChannelStateTracker::eligible(const std::vector<Candidate> &candidates) const {
  std::vector<Candidate> out;
  out.reserve(candidates.size());
  for (const auto &c : candidates) {
    const ChannelEntry *e = find(c.freq_hz);
    if (e && e->is_locked_out)
      continue;
    out.push_back(c);
  }
  return out;
}

const ChannelEntry *ChannelStateTracker::find(int64_t freq_hz) const {
  auto it = entries_.find(freq_hz);
  return it == entries_.end() ? nullptr : &it->second;
}

bool ChannelStateTracker::is_active(int64_t freq_hz) const {
  const ChannelEntry *e = find(freq_hz);
  return e && e->state == ChannelState::Active;
}

bool ChannelStateTracker::is_recording(int64_t freq_hz) const {
  const ChannelEntry *e = find(freq_hz);
  return e && e->recording_active;
}

void ChannelStateTracker::begin_recording(int64_t freq_hz, double now) {
  auto it = entries_.find(freq_hz);
  if (it == entries_.end()) {
    ChannelEntry e;
    e.freq_hz = freq_hz;
    e.last_seen = now;
    it = entries_.emplace(freq_hz, e).first;
  }
  it->second.recording_active = true;
  it->second.recording_start = now;
}

void ChannelStateTracker::end_recording(int64_t freq_hz) {
  auto it = entries_.find(freq_hz);
  if (it != entries_.end())
    it->second.recording_active = false;
}

} // namespace chanscan
