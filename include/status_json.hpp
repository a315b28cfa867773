#pragma once
#include "demod_bank.hpp"
#include "scan/scan_engine.hpp"
#include <string>

namespace chanscan {

// Bodies of GET /api/status and GET /api/channels.
std::string status_json(const EngineSnapshot &s);
std::string channels_json(const EngineSnapshot &s);
// Body of GET /api/demods: demodulator kind, squelch and per-slot tuning.
std::string demods_json(const DemodBank &bank);

} // namespace chanscan
