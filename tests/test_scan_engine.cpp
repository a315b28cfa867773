#include <catch2/catch.hpp>
#include "scan/scan_engine.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

using namespace chanscan;

namespace {
constexpr double kRate = 2.56e6; // 2500 Hz bins at 1024 points
constexpr size_t kBins = 1024;

class FakeDemod : public DemodControl {
public:
  bool set_slot_frequency(size_t slot, int64_t freq_hz) override {
    if (reject.count(freq_hz))
      return false;
    calls.emplace_back(slot, freq_hz);
    return true;
  }
  std::vector<std::pair<size_t, int64_t>> calls;
  std::set<int64_t> reject;
};

class FakeTuner : public TunerControl {
public:
  bool set_center_frequency(int64_t freq_hz) override {
    centers.push_back(freq_hz);
    return true;
  }
  std::vector<int64_t> centers;
};

class FakeClassifier : public RecordingClassifier {
public:
  Classification classify(const FinishedRecording &) override {
    ++calls;
    if (fail)
      throw std::runtime_error("model not loaded");
    return result;
  }
  Classification result{Classification::Voice};
  bool fail{};
  int calls{};
};

// Flat -100 dB spectrum with three bin wide carriers at the given
// frequencies, all at power_db.
SpectrumSample spectrum(int64_t center, std::vector<int64_t> carriers,
                        float power_db = -40.0f) {
  SpectrumSample s;
  s.power_db.assign(kBins, -100.0f);
  s.center_freq_hz = static_cast<double>(center);
  s.sample_rate = kRate;
  for (auto f : carriers) {
    long k = static_cast<long>(kBins / 2) + static_cast<long>((f - center) / 2500);
    s.power_db[k - 1] = power_db - 6.0f;
    s.power_db[k] = power_db;
    s.power_db[k + 1] = power_db - 6.0f;
  }
  return s;
}

EngineConfig test_config() {
  EngineConfig cfg;
  cfg.num_demod = 2;
  cfg.channel_spacing_hz = 5000;
  cfg.threshold_db = -60.0f;
  cfg.quiet_timeout = 12.0;
  cfg.active_timeout = 20.0;
  cfg.log_active_timeout = 0.0;
  cfg.expected_bins = kBins;
  return cfg;
}

std::vector<ScanStep> single_step(int64_t center) {
  return build_steps({{center, center}}, kRate);
}

std::vector<ScanStep> two_steps() {
  return build_steps({{146000000, 146000000}, {460000000, 460000000}}, kRate);
}

size_t count_events(const CycleReport &r, EventKind kind) {
  return static_cast<size_t>(
      std::count_if(r.events.begin(), r.events.end(),
                    [&](const ChannelEvent &e) { return e.kind == kind; }));
}

const int64_t kCenter = 460250000;
const int64_t kLocked = 460200000;
const int64_t kOpen = 460600000;
} // namespace

TEST_CASE("Locked out range never reaches a demodulator") {
  LockoutSet lockouts;
  lockouts.add_range(460000000, 460500000, true);
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), lockouts,
                    single_step(kCenter), demod);

  auto report = engine.cycle(spectrum(kCenter, {kLocked, kOpen}), 0.0);
  REQUIRE(report.candidates.size() == 2);

  auto snap = engine.snapshot();
  bool tracked = false;
  for (const auto &c : snap.channels) {
    if (c.freq_hz == kLocked) {
      tracked = true;
      REQUIRE(c.is_locked_out);
    }
  }
  REQUIRE(tracked);
  for (const auto &s : snap.slots)
    REQUIRE(s.assigned_hz != kLocked);
  REQUIRE(demod.calls.size() == 1);
  REQUIRE(demod.calls[0].second == kOpen);
  REQUIRE(count_events(report, EventKind::Opened) == 1);
}

TEST_CASE("Malformed spectra skip the cycle") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  auto bad = spectrum(kCenter, {kOpen});
  bad.power_db.resize(512);
  auto report = engine.cycle(bad, 0.0);
  REQUIRE(report.skipped);
  REQUIRE(report.candidates.empty());
  REQUIRE(demod.calls.empty());
  REQUIRE(engine.snapshot().channels.empty());

  report = engine.cycle(spectrum(kCenter, {kOpen}), 0.1);
  REQUIRE_FALSE(report.skipped);
  REQUIRE(demod.calls.size() == 1);
}

TEST_CASE("Rejected tuning leaves the slot parked until the next cycle") {
  FakeDemod demod;
  demod.reject.insert(kOpen);
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);

  auto report = engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE(report.changes.empty());
  REQUIRE(report.events.empty());
  for (const auto &s : engine.snapshot().slots)
    REQUIRE_FALSE(s.assigned());

  demod.reject.clear();
  report = engine.cycle(spectrum(kCenter, {kOpen}), 0.1);
  REQUIRE(report.changes.size() == 1);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == kOpen);
}

TEST_CASE("Runtime lockout parks the slot immediately") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == kOpen);

  REQUIRE(engine.add_lockout(kOpen + 1000, 1.0));
  REQUIRE(demod.calls.back() == std::make_pair(size_t(0), kParkedHz));
  REQUIRE_FALSE(engine.snapshot().slots[0].assigned());
  REQUIRE_FALSE(engine.add_lockout(kOpen, 1.0));

  auto report = engine.cycle(spectrum(kCenter, {kOpen}), 1.1);
  REQUIRE(count_events(report, EventKind::Closed) == 1);
  REQUIRE(report.changes.size() == 1);
  REQUIRE(report.changes[0].reason == ReleaseReason::LockedOut);
  REQUIRE(count_events(report, EventKind::Opened) == 0);

  REQUIRE(engine.clear_unsaved_lockouts() == 1);
  engine.cycle(spectrum(kCenter, {kOpen}), 1.2);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == kOpen);
}

TEST_CASE("Runtime lockout range covers its end points") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == kOpen);

  REQUIRE_FALSE(engine.add_lockout_range(kOpen, kOpen, 1.0));
  REQUIRE(engine.add_lockout_range(kOpen - 50000, kOpen, 1.0));
  REQUIRE_FALSE(engine.snapshot().slots[0].assigned());
  REQUIRE(engine.snapshot().lockout_ranges.size() == 1);
  REQUIRE_FALSE(engine.snapshot().lockout_ranges[0].saved);

  engine.cycle(spectrum(kCenter, {kOpen}), 1.1);
  REQUIRE_FALSE(engine.snapshot().slots[0].assigned());
  REQUIRE(engine.clear_unsaved_lockouts() == 1);
  REQUIRE(engine.snapshot().lockout_ranges.empty());
}

TEST_CASE("Locking out a demodulator locks its frequency") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE_FALSE(engine.lockout_slot(1, 0.5));
  REQUIRE_FALSE(engine.lockout_slot(7, 0.5));
  REQUIRE(engine.lockout_slot(0, 0.5));

  auto snap = engine.snapshot();
  REQUIRE(snap.lockout_freqs.size() == 1);
  REQUIRE(snap.lockout_freqs[0].freq_hz == kOpen);
  REQUIRE_FALSE(snap.lockout_freqs[0].saved);
  REQUIRE_FALSE(snap.slots[0].assigned());
}

TEST_CASE("Voice recordings promote a channel to priority") {
  auto cfg = test_config();
  cfg.record = true;
  cfg.auto_priority = true;
  cfg.voice_floor = 1;
  FakeDemod demod;
  FakeClassifier classifier;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), single_step(kCenter),
                    demod, nullptr, &classifier);

  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  auto report = engine.cycle(spectrum(kCenter, {}), 13.0);
  REQUIRE(report.finished.size() == 1);
  REQUIRE(report.finished[0].start == 0.0);
  REQUIRE(report.finished[0].end == 13.0);
  REQUIRE(report.finished[0].classification == Classification::Voice);
  REQUIRE(report.promoted.empty());

  engine.cycle(spectrum(kCenter, {kOpen}), 14.0);
  report = engine.cycle(spectrum(kCenter, {}), 28.0);
  REQUIRE(report.promoted.size() == 1);
  REQUIRE(report.promoted[0] == kOpen);
  auto priorities = engine.snapshot().priorities;
  REQUIRE(std::find(priorities.begin(), priorities.end(), kOpen) !=
          priorities.end());
  REQUIRE(classifier.calls == 2);
}

TEST_CASE("Short recordings are discarded") {
  auto cfg = test_config();
  cfg.record = true;
  cfg.min_recording = 30.0;
  FakeDemod demod;
  FakeClassifier classifier;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), single_step(kCenter),
                    demod, nullptr, &classifier);

  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  auto report = engine.cycle(spectrum(kCenter, {}), 13.0);
  REQUIRE(report.finished.empty());
  REQUIRE(classifier.calls == 0);
  REQUIRE(count_events(report, EventKind::Closed) == 1);
  REQUIRE(report.events[0].detail == "Discarded short recording");
}

TEST_CASE("Classifier failures leave the recording unclassified") {
  auto cfg = test_config();
  cfg.record = true;
  FakeDemod demod;
  FakeClassifier classifier;
  classifier.fail = true;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), single_step(kCenter),
                    demod, nullptr, &classifier);

  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  auto report = engine.cycle(spectrum(kCenter, {}), 13.0);
  REQUIRE(report.finished.size() == 1);
  REQUIRE(report.finished[0].classification == Classification::None);
}

TEST_CASE("Range scan steps and retunes the front end") {
  FakeDemod demod;
  FakeTuner tuner;
  auto steps = build_steps({{146000000, 146000000}, {460000000, 460000000}},
                           kRate);
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(), steps, demod,
                    &tuner);
  REQUIRE(tuner.centers == std::vector<int64_t>{146000000});

  auto report = engine.cycle(spectrum(146000000, {146100000}), 0.0);
  REQUIRE_FALSE(report.stepped);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == 146100000);

  // activity holds the window past the quiet timeout
  report = engine.cycle(spectrum(146000000, {146100000}), 12.0);
  REQUIRE_FALSE(report.stepped);

  report = engine.cycle(spectrum(146000000, {146100000}), 20.0);
  REQUIRE(report.stepped);
  REQUIRE(tuner.centers.back() == 460000000);
  REQUIRE(report.progress.current_index == 1);
  REQUIRE(report.progress.percent_complete == Approx(0.5));
  REQUIRE(count_events(report, EventKind::Closed) == 1);
  REQUIRE(report.changes.back().reason == ReleaseReason::OutOfWindow);
  REQUIRE_FALSE(engine.snapshot().slots[0].assigned());
  REQUIRE(engine.snapshot().step.center_hz == 460000000);
}

TEST_CASE("Recording mode does not hold a step for a channel opening") {
  auto cfg = test_config();
  cfg.record = true;
  cfg.num_demod = 1;
  FakeDemod demod;
  ScanEngine engine(cfg, PriorityList(std::vector<int64_t>{146200000}),
                    LockoutSet(), two_steps(), demod);

  auto report = engine.cycle(spectrum(146000000, {146100000}), 0.0);
  REQUIRE(engine.snapshot().slots[0].assigned_hz == 146100000);
  report = engine.cycle(spectrum(146000000, {146100000, 146200000}), 6.0);
  REQUIRE_FALSE(report.stepped);
  // the open recording is not preempted by the listed channel
  REQUIRE(engine.snapshot().slots[0].assigned_hz == 146100000);
  REQUIRE(report.changes.empty());

  report = engine.cycle(spectrum(146000000, {146100000}), 12.0);
  REQUIRE(report.stepped);
  REQUIRE(report.progress.current_index == 1);
}

TEST_CASE("Recording mode holds a step for a finished recording") {
  auto cfg = test_config();
  cfg.record = true;
  FakeDemod demod;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), two_steps(), demod);

  engine.cycle(spectrum(146000000, {146100000}), 0.0);
  auto report = engine.cycle(spectrum(146000000, {}), 12.5);
  REQUIRE(report.finished.size() == 1);
  REQUIRE_FALSE(report.stepped);
  REQUIRE(report.progress.current_index == 0);

  // held up to the active timeout, no longer
  report = engine.cycle(spectrum(146000000, {}), 20.0);
  REQUIRE(report.stepped);
  REQUIRE(report.progress.current_index == 1);
}

TEST_CASE("Recording mode ignores discarded recordings when stepping") {
  auto cfg = test_config();
  cfg.record = true;
  cfg.min_recording = 30.0;
  FakeDemod demod;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), two_steps(), demod);

  engine.cycle(spectrum(146000000, {146100000}), 0.0);
  auto report = engine.cycle(spectrum(146000000, {}), 12.5);
  REQUIRE(report.finished.empty());
  REQUIRE(count_events(report, EventKind::Closed) == 1);
  REQUIRE(report.stepped);
}

TEST_CASE("Rejected preemption restores the previous holder") {
  auto cfg = test_config();
  cfg.num_demod = 1;
  FakeDemod demod;
  const int64_t listed = 460100000;
  ScanEngine engine(cfg, PriorityList(std::vector<int64_t>{listed}),
                    LockoutSet(), single_step(kCenter), demod);

  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE_FALSE(engine.snapshot().slots[0].is_priority_hold);

  demod.reject.insert(listed);
  auto report = engine.cycle(spectrum(kCenter, {kOpen, listed}), 0.1);
  REQUIRE(report.changes.empty());
  auto slot = engine.snapshot().slots[0];
  REQUIRE(slot.assigned_hz == kOpen);
  REQUIRE(slot.tuned_since == 0.0);
  REQUIRE_FALSE(slot.is_priority_hold);

  demod.reject.clear();
  report = engine.cycle(spectrum(kCenter, {kOpen, listed}), 0.2);
  REQUIRE(report.changes.size() == 1);
  REQUIRE(report.changes[0].action == SlotAction::Preempted);
  REQUIRE(engine.snapshot().slots[0].is_priority_hold);
}

TEST_CASE("Manual step selection") {
  FakeDemod demod;
  FakeTuner tuner;
  auto steps = build_steps({{146000000, 146000000}, {460000000, 460000000}},
                           kRate);
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(), steps, demod,
                    &tuner);
  REQUIRE_FALSE(engine.jump_to_step(2, 1.0));
  REQUIRE(engine.jump_to_step(1, 1.0));
  REQUIRE(tuner.centers.back() == 460000000);
  REQUIRE(engine.snapshot().progress.current_index == 1);
}

TEST_CASE("Open channels repeat active events while held") {
  auto cfg = test_config();
  cfg.log_active_timeout = 15.0;
  FakeDemod demod;
  ScanEngine engine(cfg, PriorityList(), LockoutSet(), single_step(kCenter),
                    demod);
  engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  auto report = engine.cycle(spectrum(kCenter, {kOpen}), 10.0);
  REQUIRE(count_events(report, EventKind::Active) == 0);
  report = engine.cycle(spectrum(kCenter, {kOpen}), 15.0);
  REQUIRE(count_events(report, EventKind::Active) == 1);
}

TEST_CASE("Shutdown parks every demodulator") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  engine.cycle(spectrum(kCenter, {kOpen, 460700000}), 0.0);
  auto events = engine.shutdown(1.0);
  REQUIRE(events.size() == 2);
  for (const auto &e : events)
    REQUIRE(e.kind == EventKind::Closed);
  for (const auto &s : engine.snapshot().slots)
    REQUIRE_FALSE(s.assigned());
}

TEST_CASE("Runtime edits round to the channel spacing") {
  FakeDemod demod;
  ScanEngine engine(test_config(), PriorityList(), LockoutSet(),
                    single_step(kCenter), demod);
  REQUIRE(engine.add_priority(146522400));
  REQUIRE_FALSE(engine.add_priority(146521000));
  REQUIRE(engine.snapshot().priorities ==
          std::vector<int64_t>{146520000});
  REQUIRE(engine.round_frequency(460602600.0) == 460605000);

  engine.set_threshold(-30.0f);
  REQUIRE(engine.threshold() == -30.0f);
  auto report = engine.cycle(spectrum(kCenter, {kOpen}), 0.0);
  REQUIRE(report.candidates.empty());
}
