#include "demod_bank.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace chanscan {

namespace {
int clamp_squelch(int db) { return std::max(std::min(0, db), -100); }
} // namespace

DemodBank::DemodBank(size_t num_slots, DemodKind kind, double sample_rate,
                     int squelch_db, bool record, TunerControl *front_end)
    : params_(demod_params(kind)), sample_rate_(sample_rate),
      squelch_db_(clamp_squelch(squelch_db)), record_(record), front_end_(front_end),
      channels_(num_slots) {
  log::info(std::to_string(num_slots) + " " + params_.name +
            " demodulators, channel cutoff " +
            std::to_string(params_.channel_cutoff_hz) + " Hz, audio " +
            std::to_string(params_.audio_rate) + " Hz, squelch " +
            std::to_string(squelch_db_) + " dB");
}

bool DemodBank::set_slot_frequency(size_t slot, int64_t freq_hz) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot >= channels_.size())
    return false;
  DemodChannel &ch = channels_[slot];
  if (freq_hz == kParkedHz) {
    ch = DemodChannel();
    return true;
  }
  int64_t offset = freq_hz - center_hz_;
  if (static_cast<double>(std::llabs(offset)) > sample_rate_ / 2.0)
    return false;
  ch.freq_hz = freq_hz;
  ch.offset_hz = offset;
  ch.recording = record_;
  return true;
}

bool DemodBank::set_center_frequency(int64_t center_hz) {
  if (front_end_ && !front_end_->set_center_frequency(center_hz))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  center_hz_ = center_hz;
  for (auto &ch : channels_) {
    if (ch.freq_hz != kParkedHz)
      ch.offset_hz = ch.freq_hz - center_hz_;
  }
  return true;
}

int DemodBank::squelch_db() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return squelch_db_;
}

int DemodBank::set_squelch(int squelch_db) {
  std::lock_guard<std::mutex> lock(mutex_);
  squelch_db_ = clamp_squelch(squelch_db);
  log::info("Squelch set to " + std::to_string(squelch_db_) + " dB");
  return squelch_db_;
}

int64_t DemodBank::center_frequency() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return center_hz_;
}

std::vector<DemodChannel> DemodBank::channels() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_;
}

} // namespace chanscan
