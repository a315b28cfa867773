#pragma once
#include "scan/auto_priority.hpp"
#include "scan/channel_activity.hpp"
#include "scan/channel_tracker.hpp"
#include "scan/frequency_lists.hpp"
#include "scan/range_scanner.hpp"
#include "scan/scheduler.hpp"
#include "scan/spectrum.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace chanscan {

// Retunes one demodulator of the external chain. kParkedHz parks it.
// Returns false when the chain rejected the command.
class DemodControl {
public:
  virtual ~DemodControl() = default;
  virtual bool set_slot_frequency(size_t slot, int64_t freq_hz) = 0;
};

// Retunes the capture front end when the range scan steps.
class TunerControl {
public:
  virtual ~TunerControl() = default;
  virtual bool set_center_frequency(int64_t freq_hz) = 0;
};

struct FinishedRecording {
  size_t slot;
  int64_t freq_hz;
  double start;
  double end;
  Classification classification;
};

// Classification oracle for finalized recordings. May throw when the
// model is unavailable.
class RecordingClassifier {
public:
  virtual ~RecordingClassifier() = default;
  virtual Classification classify(const FinishedRecording &rec) = 0;
};

struct EngineConfig {
  size_t num_demod = 4;
  int64_t channel_spacing_hz = 5000;
  float threshold_db = 10.0f;
  double quiet_timeout = 12.0;
  double active_timeout = 20.0;
  bool record = false;
  double min_recording = 0.0;
  double max_recording = 0.0;
  double log_active_timeout = 15.0;
  bool auto_priority = false;
  int voice_floor = 1;
  // Spectra with another bin count are treated as malformed, 0 = any.
  size_t expected_bins = 0;
  EstimatorOptions estimator;
};

struct CycleReport {
  double time{};
  bool skipped{};
  bool stepped{};
  std::vector<Candidate> candidates;
  std::vector<StateTransition> transitions;
  std::vector<SlotChange> changes;
  std::vector<ChannelEvent> events;
  std::vector<FinishedRecording> finished;
  std::vector<int64_t> promoted;
  RangeProgress progress{};
};

struct EngineSnapshot {
  double time{};
  float threshold_db{};
  std::vector<DemodulatorSlot> slots;
  std::vector<ChannelEntry> channels;
  std::vector<Candidate> candidates;
  std::vector<int64_t> priorities;
  std::vector<LockoutFrequency> lockout_freqs;
  std::vector<LockoutRange> lockout_ranges;
  ScanStep step{};
  RangeProgress progress{};
};

// Shared scanner state and the per-cycle pipeline. Every public method
// takes the same lock so a cycle never sees a half-applied UI edit.
class ScanEngine {
public:
  ScanEngine(EngineConfig cfg, PriorityList priorities, LockoutSet lockouts,
             std::vector<ScanStep> steps, DemodControl &demod,
             TunerControl *tuner = nullptr,
             RecordingClassifier *classifier = nullptr, double now = 0.0);

  // Estimate, track, schedule, step. A malformed sample skips the cycle
  // and leaves all state untouched.
  CycleReport cycle(const SpectrumSample &sample, double now);

  // Parks every slot, closing open channels.
  std::vector<ChannelEvent> shutdown(double now);

  bool add_lockout(int64_t freq_hz, double now);
  bool add_lockout_range(int64_t low_hz, int64_t high_hz, double now);
  // Locks out whatever the slot is tuned to.
  bool lockout_slot(size_t slot, double now);
  size_t clear_unsaved_lockouts();
  bool add_priority(int64_t freq_hz);
  void set_threshold(float db);
  float threshold() const;
  bool jump_to_step(size_t index, double now);

  EngineSnapshot snapshot() const;
  int64_t round_frequency(double freq_hz) const;

private:
  // Applies scheduler decisions to the demodulator chain and collects the
  // applied changes and resulting events. Returns true when a recording
  // was finalized.
  bool apply_changes(const std::vector<SlotChange> &changes, double now,
                     CycleReport &out);
  bool close_channel(const SlotChange &change, double now, CycleReport &out);
  void park_locked_out(double now);
  void step_to_current(double now, CycleReport &out);
  void retune_front_end();

  EngineConfig cfg_;
  PriorityList priorities_;
  LockoutSet lockouts_;
  SpectrumEstimator estimator_;
  ChannelStateTracker tracker_;
  DemodulatorScheduler scheduler_;
  RangeScanner scanner_;
  AutoPriorityPromoter promoter_;
  ChannelActivityLog activity_;
  DemodControl &demod_;
  TunerControl *tuner_;
  RecordingClassifier *classifier_;

  std::vector<Candidate> last_candidates_;
  // Output of UI edits between cycles, merged into the next report.
  CycleReport pending_;
  double last_time_{};
  mutable std::mutex mutex_;
};

} // namespace chanscan
