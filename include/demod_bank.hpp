#pragma once
#include "scan/demod_kind.hpp"
#include "scan/scan_engine.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace chanscan {

struct DemodChannel {
  int64_t freq_hz{};   // 0 when parked
  int64_t offset_hz{}; // from the capture center
  bool recording{};
};

// Control side of the demodulator chain: one channel per slot, tuned as
// a baseband offset from the capture center. The flow graph that does
// the audio work consumes these settings. Center frequency changes are
// forwarded to the front end so offsets and hardware stay in step.
class DemodBank : public DemodControl, public TunerControl {
public:
  DemodBank(size_t num_slots, DemodKind kind, double sample_rate,
            int squelch_db, bool record, TunerControl *front_end = nullptr);

  // Rejects frequencies outside the current capture window.
  bool set_slot_frequency(size_t slot, int64_t freq_hz) override;
  bool set_center_frequency(int64_t center_hz) override;
  int64_t center_frequency() const;

  std::vector<DemodChannel> channels() const;
  const DemodParams &params() const { return params_; }
  double sample_rate() const { return sample_rate_; }
  int squelch_db() const;
  // Clamped to [-100, 0] dB, returns the level applied.
  int set_squelch(int squelch_db);

private:
  const DemodParams &params_;
  double sample_rate_;
  int squelch_db_;
  bool record_;
  TunerControl *front_end_;
  int64_t center_hz_{};
  std::vector<DemodChannel> channels_;
  mutable std::mutex mutex_;
};

} // namespace chanscan
