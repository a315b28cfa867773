#include "channel_log.hpp"

#include "config.hpp"
#include "logging.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace chanscan {

std::string format_fixed_field(const ChannelEvent &e) {
  std::time_t secs = static_cast<std::time_t>(std::floor(e.timestamp));
  long micros = static_cast<long>((e.timestamp - std::floor(e.timestamp)) * 1e6);
  std::tm tm{};
  localtime_r(&secs, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d, %H:%M:%S", &tm);

  char freq[16];
  std::snprintf(freq, sizeof(freq), "%.4f",
                static_cast<double>(e.freq_hz) / 1e6);
  char line[128];
  std::snprintf(line, sizeof(line), "%s.%06ld: %-4s%-10s%-2zu", date, micros,
                event_to_string(e.kind), freq, e.slot);
  return line;
}

namespace {
std::string json_string(const std::string &s) {
  std::string out = "\"";
  for (char ch : s) {
    if (ch == '"' || ch == '\\') {
      out += '\\';
      out += ch;
    } else if (static_cast<unsigned char>(ch) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
      out += buf;
    } else {
      out += ch;
    }
  }
  return out + "\"";
}
} // namespace

std::string format_json_event(const ChannelEvent &e) {
  std::ostringstream os;
  os << "{\"state\":\"" << event_to_string(e.kind)
     << "\",\"frequency\":" << e.freq_hz << ",\"channel\":" << e.slot
     << ",\"timestamp\":" << std::fixed << std::setprecision(6)
     << e.timestamp << ",\"classification\":";
  if (e.classification == Classification::None)
    os << "null";
  else
    os << json_string(classification_to_string(e.classification));
  os << ",\"detail\":";
  if (e.detail.empty())
    os << "null";
  else
    os << json_string(e.detail);
  os << "}";
  return os.str();
}

bool parse_http_endpoint(const std::string &url, HttpEndpoint &out) {
  HttpEndpoint ep;
  std::string rest;
  if (url.compare(0, 7, "http://") == 0) {
    rest = url.substr(7);
    ep.port = 80;
  } else if (url.compare(0, 8, "https://") == 0) {
    rest = url.substr(8);
    ep.tls = true;
    ep.port = 443;
  } else {
    return false;
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  ep.path = slash == std::string::npos ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
      return false;
    ep.port = std::stoi(port);
    if (ep.port < 1 || ep.port > 65535)
      return false;
    authority.resize(colon);
  }
  if (authority.empty())
    return false;
  ep.host = authority;
  out = ep;
  return true;
}

bool JsonServerSink::write(const std::vector<ChannelEvent> &events) {
  bool ok = true;
  for (const auto &e : events) {
    if (!poster_.post(endpoint_, format_json_event(e))) {
      log::error("Channel event not delivered to " + endpoint_.host +
                 endpoint_.path);
      ok = false;
    }
  }
  return ok;
}

bool DebugLogSink::write(const std::vector<ChannelEvent> &events) {
  if (!log::enabled(log::Level::Debug))
    return true;
  for (const auto &e : events) {
    char freq[16];
    std::snprintf(freq, sizeof(freq), "%.4f",
                  static_cast<double>(e.freq_hz) / 1e6);
    std::string msg = std::string("Channel ") + event_to_string(e.kind) +
                      " " + freq + " MHz demod " + std::to_string(e.slot);
    if (e.classification != Classification::None)
      msg += std::string(" class ") + classification_to_string(e.classification);
    if (!e.detail.empty())
      msg += " (" + e.detail + ")";
    log::debug(msg);
  }
  return true;
}

FixedFieldSink::FixedFieldSink(const std::string &path) : path_(path) {}

bool FixedFieldSink::write(const std::vector<ChannelEvent> &events) {
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    log::error("Cannot open channel log " + path_);
    return false;
  }
  for (const auto &e : events)
    out << format_fixed_field(e) << '\n';
  return static_cast<bool>(out);
}

bool SqliteSink::write(const std::vector<ChannelEvent> &events) {
  return db_.insert(events);
}

std::unique_ptr<ChannelLogSink> make_sink(const std::string &type,
                                          const std::string &target,
                                          DataStore &db,
                                          JsonPoster *poster) {
  if (type == "none")
    return std::make_unique<NullSink>();
  if (type == "debug")
    return std::make_unique<DebugLogSink>();
  if (type == "fixed-field")
    return std::make_unique<FixedFieldSink>(target);
  if (type == "sqlite") {
    if (!db.is_open() && !(db.open() && db.init()))
      throw ConfigError("Cannot open channel log database");
    return std::make_unique<SqliteSink>(db);
  }
  if (type == "json-server") {
    HttpEndpoint endpoint;
    if (!parse_http_endpoint(target, endpoint))
      throw ConfigError("json-server channel log needs an http:// URL, got '" +
                        target + "'");
    if (!poster)
      throw ConfigError("json-server channel log needs an HTTP client");
    return std::make_unique<JsonServerSink>(std::move(endpoint), *poster);
  }
  throw ConfigError("Unknown channel log type: '" + type + "'");
}

} // namespace chanscan
