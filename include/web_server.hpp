#pragma once
#include "demod_bank.hpp"
#include "scan/scan_engine.hpp"
#include <memory>

struct mg_connection;
class CivetServer;

namespace chanscan {

class StatusHandler;
class ChannelsHandler;
class LockoutHandler;
class PriorityHandler;
class ThresholdHandler;
class StepHandler;
class DemodsHandler;
class SquelchHandler;

// HTTP control surface. Handler threads read and edit scanner state only
// through ScanEngine, and demodulator settings through DemodBank.
class WebServer {
public:
  WebServer(ScanEngine &engine, DemodBank &bank, int port = 8080);
  ~WebServer();

private:
  std::unique_ptr<CivetServer> server_;
  std::unique_ptr<StatusHandler> status_handler_;
  std::unique_ptr<ChannelsHandler> channels_handler_;
  std::unique_ptr<LockoutHandler> lockout_handler_;
  std::unique_ptr<PriorityHandler> priority_handler_;
  std::unique_ptr<ThresholdHandler> threshold_handler_;
  std::unique_ptr<StepHandler> step_handler_;
  std::unique_ptr<DemodsHandler> demods_handler_;
  std::unique_ptr<SquelchHandler> squelch_handler_;
};

} // namespace chanscan
