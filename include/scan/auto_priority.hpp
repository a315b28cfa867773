#pragma once
#include "scan/frequency_lists.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace chanscan {

enum class Classification { None, Voice, Data, Skip };

const char *classification_to_string(Classification c);
Classification classification_from_string(const std::string &s);

struct ClassCounts {
  int voice_count{};
  int non_voice_count{};
};

// Appends frequencies that mostly carry voice to the priority list.
class AutoPriorityPromoter {
public:
  explicit AutoPriorityPromoter(int voice_floor = 1);

  // Returns true when this observation promoted freq_hz.
  bool observe(int64_t freq_hz, Classification c, PriorityList &priorities);

  ClassCounts counts(int64_t freq_hz) const;
  int voice_floor() const { return voice_floor_; }

private:
  int voice_floor_;
  std::map<int64_t, ClassCounts> counts_;
};

} // namespace chanscan
