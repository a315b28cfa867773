#pragma once
#include <cstdint>
#include <string>

namespace chanscan {

enum class DemodKind { NBFM = 0, AM = 1, WBFM = 2 };

// Per-kind parameters handed to the demodulator chain. The scheduler
// does not look at them.
struct DemodParams {
  DemodKind kind;
  const char *name;
  int64_t channel_cutoff_hz;
  int64_t audio_cutoff_hz;
  int audio_rate;
};

const DemodParams &demod_params(DemodKind kind);
// Accepts the -d index (0, 1, 2) or a name ("nbfm", "am", "wbfm").
bool parse_demod_kind(const std::string &text, DemodKind &out);

} // namespace chanscan
