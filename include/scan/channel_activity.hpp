#pragma once
#include "scan/auto_priority.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chanscan {

enum class EventKind { Opened, Active, Closed };

const char *event_to_string(EventKind k);

struct ChannelEvent {
  int64_t freq_hz{};
  size_t slot{};
  EventKind kind{EventKind::Opened};
  Classification classification{Classification::None};
  std::string detail;
  double timestamp{};
};

// Turns slot open/close into channel log events and repeats an "active"
// event for every open slot each active_interval seconds (0 disables).
class ChannelActivityLog {
public:
  explicit ChannelActivityLog(double active_interval = 15.0);

  ChannelEvent opened(size_t slot, int64_t freq_hz, double now);
  ChannelEvent closed(size_t slot, int64_t freq_hz, double now,
                      Classification c = Classification::None,
                      const std::string &detail = "");
  std::vector<ChannelEvent> heartbeat(double now);

  double active_interval() const { return interval_; }
  size_t open_count() const { return open_.size(); }

private:
  struct OpenChannel {
    int64_t freq_hz;
    double last_logged;
  };
  double interval_;
  std::map<size_t, OpenChannel> open_;
};

} // namespace chanscan
