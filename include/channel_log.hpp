#pragma once
#include "data_store.hpp"
#include "scan/channel_activity.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace chanscan {

// Destination for channel events, written from the logger thread only.
class ChannelLogSink {
public:
  virtual ~ChannelLogSink() = default;
  // Returns false when the batch could not be written.
  virtual bool write(const std::vector<ChannelEvent> &events) = 0;
  virtual const char *name() const = 0;
};

class NullSink : public ChannelLogSink {
public:
  bool write(const std::vector<ChannelEvent> &) override { return true; }
  const char *name() const override { return "none"; }
};

// Writes each event to the debug log.
class DebugLogSink : public ChannelLogSink {
public:
  bool write(const std::vector<ChannelEvent> &events) override;
  const char *name() const override { return "debug"; }
};

// Appends one fixed width record per event:
// "2024-05-01, 13:45:10.123456: on  146.5200  0 "
class FixedFieldSink : public ChannelLogSink {
public:
  explicit FixedFieldSink(const std::string &path);
  bool write(const std::vector<ChannelEvent> &events) override;
  const char *name() const override { return "fixed-field"; }

private:
  std::string path_;
};

class SqliteSink : public ChannelLogSink {
public:
  explicit SqliteSink(DataStore &db) : db_(db) {}
  bool write(const std::vector<ChannelEvent> &events) override;
  const char *name() const override { return "sqlite"; }

private:
  DataStore &db_;
};

struct HttpEndpoint {
  bool tls{};
  std::string host;
  int port{};
  std::string path;
};

// Accepts http://host[:port][/path] and https://... targets.
bool parse_http_endpoint(const std::string &url, HttpEndpoint &out);

// Delivers one JSON document to an HTTP endpoint with a POST. Returns
// false when the request failed or the server did not answer 2xx.
class JsonPoster {
public:
  virtual ~JsonPoster() = default;
  virtual bool post(const HttpEndpoint &to, const std::string &body) = 0;
};

// POSTs every event as its own JSON object to a remote server.
class JsonServerSink : public ChannelLogSink {
public:
  JsonServerSink(HttpEndpoint endpoint, JsonPoster &poster)
      : endpoint_(std::move(endpoint)), poster_(poster) {}
  bool write(const std::vector<ChannelEvent> &events) override;
  const char *name() const override { return "json-server"; }

private:
  HttpEndpoint endpoint_;
  JsonPoster &poster_;
};

std::string format_fixed_field(const ChannelEvent &e);
// {"state":"on","frequency":146520000,"channel":0,"timestamp":...,
//  "classification":null,"detail":null}
std::string format_json_event(const ChannelEvent &e);

// Builds the sink for a log type. db is only used by "sqlite", poster
// only by "json-server". Throws ConfigError for unknown types and for
// targets the type cannot use.
std::unique_ptr<ChannelLogSink> make_sink(const std::string &type,
                                          const std::string &target,
                                          DataStore &db,
                                          JsonPoster *poster = nullptr);

} // namespace chanscan
