#include "scan/scan_engine.hpp"

#include "logging.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <utility>

namespace chanscan {

namespace {
std::string mhz(int64_t freq_hz) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f MHz",
                static_cast<double>(freq_hz) / 1e6);
  return buf;
}
} // namespace

ScanEngine::ScanEngine(EngineConfig cfg, PriorityList priorities,
                       LockoutSet lockouts, std::vector<ScanStep> steps,
                       DemodControl &demod, TunerControl *tuner,
                       RecordingClassifier *classifier, double now)
    : cfg_(cfg), priorities_(std::move(priorities)),
      lockouts_(std::move(lockouts)), estimator_(cfg.estimator),
      tracker_(cfg.quiet_timeout),
      scheduler_(cfg.num_demod,
                 SchedulerConfig{cfg.record, cfg.max_recording}),
      scanner_(std::move(steps),
               RangeTimeouts{cfg.quiet_timeout, cfg.active_timeout}, now),
      promoter_(cfg.voice_floor), activity_(cfg.log_active_timeout),
      demod_(demod), tuner_(tuner), classifier_(classifier),
      last_time_(now) {
  retune_front_end();
}

CycleReport ScanEngine::cycle(const SpectrumSample &sample, double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  CycleReport report = std::move(pending_);
  pending_ = CycleReport();
  report.time = now;

  if (!sample.valid(cfg_.expected_bins)) {
    log::warn("Skipping cycle: malformed spectrum (" +
              std::to_string(sample.bins()) + " bins)");
    report.skipped = true;
    report.progress = scanner_.progress();
    return report;
  }
  last_time_ = now;

  report.candidates = estimator_.estimate(sample, cfg_.threshold_db,
                                          cfg_.channel_spacing_hz);
  report.transitions =
      tracker_.update(report.candidates, now, lockouts_, priorities_);
  auto eligible = tracker_.eligible(report.candidates);

  ScheduleInput in{eligible,  tracker_,          priorities_,
                   lockouts_, scanner_.current(), now};
  auto changes = scheduler_.schedule(in);
  bool recording_done = apply_changes(changes, now, report);

  bool activity = recording_done;
  if (!cfg_.record) {
    activity = false;
    for (const auto &tr : report.transitions) {
      if (tr.to != ChannelState::Active)
        continue;
      if (lockouts_.locked_out(tr.freq_hz) ||
          !scanner_.current().contains(tr.freq_hz))
        continue;
      activity = true;
      break;
    }
  }

  if (scanner_.advance(now, activity)) {
    report.stepped = true;
    step_to_current(now, report);
  }

  auto beats = activity_.heartbeat(now);
  report.events.insert(report.events.end(), beats.begin(), beats.end());
  report.progress = scanner_.progress();
  last_candidates_ = report.candidates;
  return report;
}

void ScanEngine::step_to_current(double now, CycleReport &out) {
  const ScanStep &step = scanner_.current();
  log::info("Stepping to " + mhz(step.center_hz) + " (step " +
            std::to_string(scanner_.current_index() + 1) + " of " +
            std::to_string(scanner_.total_steps()) + ")");
  apply_changes(scheduler_.release_all(ReleaseReason::OutOfWindow), now, out);
  retune_front_end();
}

bool ScanEngine::apply_changes(const std::vector<SlotChange> &changes,
                               double now, CycleReport &out) {
  bool recording_done = false;
  for (const auto &c : changes) {
    if (!demod_.set_slot_frequency(c.slot, c.to_hz)) {
      log::error("Demodulator " + std::to_string(c.slot) +
                 " rejected tuning to " + std::to_string(c.to_hz) + " Hz");
      // a failed park still counts as parked so a lockout is never held
      if (c.action != SlotAction::Parked) {
        scheduler_.restore(c.slot, c.from_hz, c.prev_tuned_since,
                           c.prev_priority_hold);
        continue;
      }
    }
    log::debug("Demodulator " + std::to_string(c.slot) + " " +
               action_to_string(c.action) + " " +
               (c.to_hz == kParkedHz ? std::string("0 Hz") : mhz(c.to_hz)) +
               (c.reason == ReleaseReason::None
                    ? std::string()
                    : std::string(" (") + reason_to_string(c.reason) + ")"));
    out.changes.push_back(c);
    if (c.from_hz != kParkedHz && close_channel(c, now, out))
      recording_done = true;
    if (c.to_hz != kParkedHz) {
      if (cfg_.record)
        tracker_.begin_recording(c.to_hz, now);
      out.events.push_back(activity_.opened(c.slot, c.to_hz, now));
    }
  }
  return recording_done;
}

bool ScanEngine::close_channel(const SlotChange &change, double now,
                               CycleReport &out) {
  const int64_t f = change.from_hz;
  if (!cfg_.record) {
    out.events.push_back(activity_.closed(change.slot, f, now));
    return false;
  }

  double start = change.prev_tuned_since;
  const ChannelEntry *entry = tracker_.find(f);
  if (entry && entry->recording_active)
    start = entry->recording_start;
  tracker_.end_recording(f);

  if (cfg_.min_recording > 0.0 && now - start < cfg_.min_recording) {
    out.events.push_back(activity_.closed(change.slot, f, now,
                                          Classification::None,
                                          "Discarded short recording"));
    return false;
  }

  FinishedRecording rec{change.slot, f, start, now, Classification::None};
  if (classifier_) {
    try {
      rec.classification = classifier_->classify(rec);
    } catch (const std::exception &e) {
      log::error("Classifier unavailable for " + mhz(f) + ": " + e.what());
    }
  }
  if (cfg_.auto_priority &&
      promoter_.observe(f, rec.classification, priorities_)) {
    out.promoted.push_back(f);
    tracker_.refresh_flags(lockouts_, priorities_);
  }
  out.finished.push_back(rec);
  out.events.push_back(
      activity_.closed(change.slot, f, now, rec.classification));
  return true;
}

std::vector<ChannelEvent> ScanEngine::shutdown(double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  CycleReport out = std::move(pending_);
  pending_ = CycleReport();
  apply_changes(scheduler_.release_all(ReleaseReason::Shutdown), now, out);
  return out.events;
}

void ScanEngine::park_locked_out(double now) {
  tracker_.refresh_flags(lockouts_, priorities_);
  std::vector<SlotChange> parked;
  for (const auto &slot : scheduler_.slots()) {
    if (slot.assigned() && lockouts_.locked_out(slot.assigned_hz))
      parked.push_back(SlotChange{slot.id, slot.assigned_hz, kParkedHz,
                                  SlotAction::Parked,
                                  ReleaseReason::LockedOut, slot.tuned_since,
                                  slot.is_priority_hold});
  }
  for (const auto &c : parked)
    scheduler_.restore(c.slot, kParkedHz, c.prev_tuned_since);
  apply_changes(parked, now, pending_);
}

bool ScanEngine::add_lockout(int64_t freq_hz, double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t f = round_to_spacing(static_cast<double>(freq_hz),
                               cfg_.channel_spacing_hz);
  if (!lockouts_.add(f, false))
    return false;
  log::info("Locked out " + mhz(f));
  park_locked_out(now);
  return true;
}

bool ScanEngine::add_lockout_range(int64_t low_hz, int64_t high_hz,
                                   double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!lockouts_.add_range(low_hz, high_hz, false))
    return false;
  log::info("Locked out " + mhz(low_hz) + " - " + mhz(high_hz));
  park_locked_out(now);
  return true;
}

bool ScanEngine::lockout_slot(size_t slot, double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot >= scheduler_.slots().size())
    return false;
  const int64_t f = scheduler_.slots()[slot].assigned_hz;
  if (f == kParkedHz || !lockouts_.add(f, false))
    return false;
  log::info("Locked out " + mhz(f) + " from demodulator " +
            std::to_string(slot));
  park_locked_out(now);
  return true;
}

size_t ScanEngine::clear_unsaved_lockouts() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = lockouts_.clear_unsaved();
  tracker_.refresh_flags(lockouts_, priorities_);
  return n;
}

bool ScanEngine::add_priority(int64_t freq_hz) {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t f = round_to_spacing(static_cast<double>(freq_hz),
                               cfg_.channel_spacing_hz);
  if (!priorities_.append(f))
    return false;
  tracker_.refresh_flags(lockouts_, priorities_);
  return true;
}

void ScanEngine::set_threshold(float db) {
  std::lock_guard<std::mutex> lock(mutex_);
  cfg_.threshold_db = db;
}

float ScanEngine::threshold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cfg_.threshold_db;
}

bool ScanEngine::jump_to_step(size_t index, double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!scanner_.jump_to(index, now))
    return false;
  step_to_current(now, pending_);
  return true;
}

EngineSnapshot ScanEngine::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EngineSnapshot s;
  s.time = last_time_;
  s.threshold_db = cfg_.threshold_db;
  s.slots = scheduler_.slots();
  for (const auto &kv : tracker_.entries())
    s.channels.push_back(kv.second);
  s.candidates = last_candidates_;
  s.priorities = priorities_.frequencies();
  s.lockout_freqs = lockouts_.frequencies();
  s.lockout_ranges = lockouts_.ranges();
  s.step = scanner_.current();
  s.progress = scanner_.progress();
  return s;
}

int64_t ScanEngine::round_frequency(double freq_hz) const {
  return round_to_spacing(freq_hz, cfg_.channel_spacing_hz);
}

void ScanEngine::retune_front_end() {
  if (!tuner_)
    return;
  const int64_t center = scanner_.current().center_hz;
  if (!tuner_->set_center_frequency(center))
    log::error("Front end rejected retune to " + mhz(center));
}

} // namespace chanscan
