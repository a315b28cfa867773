#include "scan/channel_activity.hpp"

namespace chanscan {

const char *event_to_string(EventKind k) {
  switch (k) {
  case EventKind::Opened:
    return "on";
  case EventKind::Active:
    return "act";
  case EventKind::Closed:
    return "off";
  }
  return "";
}

ChannelActivityLog::ChannelActivityLog(double active_interval)
    : interval_(active_interval) {}

ChannelEvent ChannelActivityLog::opened(size_t slot, int64_t freq_hz,
                                        double now) {
  open_[slot] = OpenChannel{freq_hz, now};
  ChannelEvent ev;
  ev.freq_hz = freq_hz;
  ev.slot = slot;
  ev.kind = EventKind::Opened;
  ev.timestamp = now;
  return ev;
}

ChannelEvent ChannelActivityLog::closed(size_t slot, int64_t freq_hz,
                                        double now, Classification c,
                                        const std::string &detail) {
  open_.erase(slot);
  ChannelEvent ev;
  ev.freq_hz = freq_hz;
  ev.slot = slot;
  ev.kind = EventKind::Closed;
  ev.classification = c;
  ev.detail = detail;
  ev.timestamp = now;
  return ev;
}

std::vector<ChannelEvent> ChannelActivityLog::heartbeat(double now) {
  std::vector<ChannelEvent> out;
  if (interval_ <= 0.0)
    return out;
  for (auto &kv : open_) {
    if (now - kv.second.last_logged < interval_)
      continue;
    kv.second.last_logged = now;
    ChannelEvent ev;
    ev.freq_hz = kv.second.freq_hz;
    ev.slot = kv.first;
    ev.kind = EventKind::Active;
    ev.timestamp = now;
    out.push_back(ev);
  }
  return out;
}

} // namespace chanscan
