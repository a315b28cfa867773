#include "cli.hpp"

#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace chanscan {

namespace {
// Value options share their name with the config file key.
const char *const kValueKeys[] = {
    "demod",
    "demodulator",
    "rate",
    "threshold",
    "squelch",
    "quiet_timeout",
    "active_timeout",
    "channel_spacing",
    "priority",
    "lockout",
    "voice_floor",
    "min_recording",
    "max_recording",
    "log_type",
    "log_target",
    "log_active_timeout",
    "device",
    "fft_size",
    "gain",
    "correction",
    "db_path",
    "web_port",
    "log_level",
    "debug_file",
};

po::options_description make_options() {
  po::options_description desc("chanscan options");
  // clang-format off
  desc.add_options()
      ("help,h", "Show this help")
      ("config,c", po::value<std::string>()->default_value("chanscan.conf"),
       "Configuration file")
      ("demod,n", po::value<std::string>(), "Number of demodulators")
      ("demodulator,d", po::value<std::string>(),
       "Demodulator type: 0/nbfm, 1/am, 2/wbfm")
      ("freq,f", po::value<std::vector<std::string>>()->composing(),
       "Frequency in Hz or range lo-hi, repeatable")
      ("rate,r", po::value<std::string>(), "Sample rate in Hz")
      ("threshold,t", po::value<std::string>(),
       "Detection threshold in dB")
      ("squelch,s", po::value<std::string>(), "Demodulator squelch in dB")
      ("quiet_timeout", po::value<std::string>(),
       "Seconds without signal before a channel is idle")
      ("active_timeout", po::value<std::string>(),
       "Longest dwell in seconds on a range step with activity")
      ("channel_spacing,B", po::value<std::string>(),
       "Channel spacing in Hz")
      ("priority,p", po::value<std::string>(), "Priority file")
      ("auto_priority,P", po::bool_switch(),
       "Promote voice channels to the priority list")
      ("lockout,l", po::value<std::string>(), "Lockout file (YAML)")
      ("write,w", po::bool_switch(), "Record audio on every assigned slot")
      ("min_recording", po::value<std::string>(),
       "Discard recordings shorter than this many seconds")
      ("max_recording", po::value<std::string>(),
       "Split recordings longer than this many seconds")
      ("voice_floor", po::value<std::string>(),
       "Voice classifications needed before promotion")
      ("log_type,T", po::value<std::string>(),
       "Channel log: none, debug, fixed-field, json-server, sqlite")
      ("log_target,L", po::value<std::string>(),
       "Channel log file, or server URL for json-server")
      ("log_active_timeout,A", po::value<std::string>(),
       "Seconds between channel log heartbeats, 0 disables")
      ("device", po::value<std::string>(), "RTL-SDR device index")
      ("fft_size", po::value<std::string>(), "Spectrum bins")
      ("gain", po::value<std::string>(), "RF gain in dB, 0 for automatic")
      ("correction", po::value<std::string>(), "Frequency correction in ppm")
      ("db_path", po::value<std::string>(), "SQLite database")
      ("web_port", po::value<std::string>(), "HTTP control port")
      ("log_level", po::value<std::string>(), "debug, info, warn, error")
      ("debug_file", po::value<std::string>(), "Copy log lines to a file");
  // clang-format on
  return desc;
}
} // namespace

bool parse_command_line(int argc, const char *const argv[], Config &cfg) {
  auto desc = make_options();
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    throw ConfigError(e.what());
  }

  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return false;
  }

  cfg = Config::load(vm["config"].as<std::string>());

  for (const char *key : kValueKeys) {
    if (vm.count(key))
      cfg.set(key, vm[key].as<std::string>());
  }
  if (vm.count("freq")) {
    std::string joined;
    for (const auto &f : vm["freq"].as<std::vector<std::string>>())
      joined += f + " ";
    cfg.set("freq", joined);
  }
  if (vm["auto_priority"].as<bool>())
    cfg.auto_priority = true;
  if (vm["write"].as<bool>())
    cfg.record = true;
  return true;
}

} // namespace chanscan
