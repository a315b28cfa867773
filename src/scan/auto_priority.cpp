#include "scan/auto_priority.hpp"

#include "logging.hpp"
#include <algorithm>

namespace chanscan {

const char *classification_to_string(Classification c) {
  switch (c) {
  case Classification::None:
    return "";
  case Classification::Voice:
    return "V";
  case Classification::Data:
    return "D";
  case Classification::Skip:
    return "S";
  }
  return "";
}

Classification classification_from_string(const std::string &s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(), ::tolower);
  if (v == "v" || v == "voice")
    return Classification::Voice;
  if (v == "d" || v == "data")
    return Classification::Data;
  if (v == "s" || v == "skip")
    return Classification::Skip;
  return Classification::None;
}

AutoPriorityPromoter::AutoPriorityPromoter(int voice_floor)
    : voice_floor_(voice_floor) {}

bool AutoPriorityPromoter::observe(int64_t freq_hz, Classification c,
                                   PriorityList &priorities) {
  if (c == Classification::None)
    return false;
  ClassCounts &n = counts_[freq_hz];
  if (c == Classification::Voice)
    ++n.voice_count;
  else
    ++n.non_voice_count;

  if (n.voice_count <= n.non_voice_count || n.voice_count <= voice_floor_)
    return false;
  if (!priorities.append(freq_hz))
    return false;
  log::info("Auto priority: added " + std::to_string(freq_hz) + " Hz after " +
            std::to_string(n.voice_count) + " voice transmissions");
  return true;
}

ClassCounts AutoPriorityPromoter::counts(int64_t freq_hz) const {
  auto it = counts_.find(freq_hz);
  return it == counts_.end() ? ClassCounts{} : it->second;
}

} // namespace chanscan
