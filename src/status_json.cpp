#include "status_json.hpp"
#include <sstream>

namespace chanscan {

namespace {
template <typename T, typename F>
void write_array(std::ostringstream &os, const std::vector<T> &items, F fn) {
  os << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i)
      os << ",";
    fn(items[i]);
  }
  os << "]";
}

const char *boolean(bool v) { return v ? "true" : "false"; }
} // namespace

std::string status_json(const EngineSnapshot &s) {
  std::ostringstream os;
  os.precision(12);
  os << "{\"time\":" << s.time << ",\"threshold\":" << s.threshold_db
     << ",\"center\":" << s.step.center_hz << ",\"window\":[" << s.step.low_hz
     << "," << s.step.high_hz << "],\"step\":" << s.progress.current_index
     << ",\"steps\":" << s.progress.total_steps
     << ",\"percent\":" << s.progress.percent_complete << ",\"demods\":";
  write_array(os, s.slots, [&](const DemodulatorSlot &d) {
    os << "{\"id\":" << d.id << ",\"freq\":" << d.assigned_hz
       << ",\"priority\":" << boolean(d.is_priority_hold)
       << ",\"since\":" << d.tuned_since << "}";
  });
  os << ",\"candidates\":";
  write_array(os, s.candidates, [&](const Candidate &c) {
    os << "{\"freq\":" << c.freq_hz << ",\"power\":" << c.power_db << "}";
  });
  os << ",\"priority\":";
  write_array(os, s.priorities, [&](int64_t f) { os << f; });
  os << ",\"lockout\":";
  write_array(os, s.lockout_freqs, [&](const LockoutFrequency &l) {
    os << "{\"freq\":" << l.freq_hz << ",\"saved\":" << boolean(l.saved)
       << "}";
  });
  os << ",\"lockout_ranges\":";
  write_array(os, s.lockout_ranges, [&](const LockoutRange &r) {
    os << "{\"min\":" << r.low_hz << ",\"max\":" << r.high_hz
       << ",\"saved\":" << boolean(r.saved) << "}";
  });
  os << "}";
  return os.str();
}

std::string channels_json(const EngineSnapshot &s) {
  std::ostringstream os;
  os.precision(12);
  write_array(os, s.channels, [&](const ChannelEntry &c) {
    os << "{\"freq\":" << c.freq_hz << ",\"state\":\""
       << state_to_string(c.state) << "\",\"last_seen\":" << c.last_seen
       << ",\"power\":" << c.last_power_db
       << ",\"priority\":" << boolean(c.is_priority)
       << ",\"locked_out\":" << boolean(c.is_locked_out)
       << ",\"recording\":" << boolean(c.recording_active) << "}";
  });
  return os.str();
}

std::string demods_json(const DemodBank &bank) {
  std::ostringstream os;
  os.precision(12);
  os << "{\"kind\":\"" << bank.params().name
     << "\",\"squelch\":" << bank.squelch_db()
     << ",\"center\":" << bank.center_frequency()
     << ",\"rate\":" << bank.sample_rate() << ",\"channels\":";
  write_array(os, bank.channels(), [&](const DemodChannel &c) {
    os << "{\"freq\":" << c.freq_hz << ",\"offset\":" << c.offset_hz
       << ",\"recording\":" << boolean(c.recording) << "}";
  });
  os << "}";
  return os.str();
}

} // namespace chanscan
