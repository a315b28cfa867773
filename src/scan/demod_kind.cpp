#include "scan/demod_kind.hpp"

#include <algorithm>

namespace chanscan {

namespace {
const DemodParams kParams[] = {
    {DemodKind::NBFM, "NBFM", 12500, 3500, 8000},
    {DemodKind::AM, "AM", 5000, 3500, 8000},
    {DemodKind::WBFM, "WBFM", 25000, 3500, 8000},
};
} // namespace

const DemodParams &demod_params(DemodKind kind) {
  return kParams[static_cast<int>(kind)];
}

bool parse_demod_kind(const std::string &text, DemodKind &out) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "0" || s == "nbfm") {
    out = DemodKind::NBFM;
  } else if (s == "1" || s == "am") {
    out = DemodKind::AM;
  } else if (s == "2" || s == "wbfm") {
    out = DemodKind::WBFM;
  } else {
    return false;
  }
  return true;
}

} // namespace chanscan
