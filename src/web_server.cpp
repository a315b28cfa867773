#include "web_server.hpp"
#include "CivetServer.h"
#include "clock.hpp"
#include "logging.hpp"
#include "request_args.hpp"
#include "status_json.hpp"
#include <cstring>
#include <string>
#include <vector>

namespace chanscan {

namespace {
void reply(struct mg_connection *conn, int status, const std::string &body) {
  const char *text = status == 200 ? "OK" : "Bad Request";
  mg_printf(conn,
            "HTTP/1.1 %d %s\r\nContent-Type: application/json\r\n"
            "Content-Length: %zu\r\nConnection: close\r\n\r\n%s",
            status, text, body.size(), body.c_str());
}

void reply_ok(struct mg_connection *conn, bool ok) {
  reply(conn, 200, std::string("{\"ok\":") + (ok ? "true" : "false") + "}");
}

void reply_error(struct mg_connection *conn, const std::string &msg) {
  reply(conn, 400, "{\"error\":\"" + msg + "\"}");
}

// Looks up a query string parameter.
bool query_var(struct mg_connection *conn, const char *name, std::string &out) {
  const struct mg_request_info *ri = mg_get_request_info(conn);
  if (!ri->query_string)
    return false;
  char buf[64];
  size_t len = strlen(ri->query_string);
  if (mg_get_var(ri->query_string, len, name, buf, sizeof(buf)) <= 0)
    return false;
  out = buf;
  return true;
}

// Reads a query parameter through one of the request_args parsers.
template <typename T>
bool query(struct mg_connection *conn, const char *name,
           bool (*parse)(const std::string &, T &), T &out) {
  std::string text;
  return query_var(conn, name, text) && parse(text, out);
}
} // namespace

class StatusHandler : public CivetHandler {
public:
  explicit StatusHandler(ScanEngine &engine) : engine_(engine) {}
  bool handleGet(CivetServer *, struct mg_connection *conn) override {
    reply(conn, 200, status_json(engine_.snapshot()));
    return true;
  }

private:
  ScanEngine &engine_;
};

class ChannelsHandler : public CivetHandler {
public:
  explicit ChannelsHandler(ScanEngine &engine) : engine_(engine) {}
  bool handleGet(CivetServer *, struct mg_connection *conn) override {
    reply(conn, 200, channels_json(engine_.snapshot()));
    return true;
  }

private:
  ScanEngine &engine_;
};

class LockoutHandler : public CivetHandler {
public:
  explicit LockoutHandler(ScanEngine &engine) : engine_(engine) {}
  // ?freq=<MHz>, ?min=<MHz>&max=<MHz> or ?slot=<demodulator>
  bool handlePost(CivetServer *, struct mg_connection *conn) override {
    int64_t low = 0;
    int64_t high = 0;
    size_t slot = 0;
    if (query(conn, "min", parse_mhz, low) &&
        query(conn, "max", parse_mhz, high)) {
      reply_ok(conn, engine_.add_lockout_range(low, high, wall_clock()));
      return true;
    }
    if (query(conn, "freq", parse_mhz, low)) {
      reply_ok(conn, engine_.add_lockout(low, wall_clock()));
      return true;
    }
    if (query(conn, "slot", parse_index, slot)) {
      reply_ok(conn, engine_.lockout_slot(slot, wall_clock()));
      return true;
    }
    reply_error(conn, "missing or invalid freq, min/max or slot");
    return true;
  }
  // Drops lockouts added while running, file entries stay.
  bool handleDelete(CivetServer *, struct mg_connection *conn) override {
    size_t n = engine_.clear_unsaved_lockouts();
    reply(conn, 200, "{\"cleared\":" + std::to_string(n) + "}");
    return true;
  }

private:
  ScanEngine &engine_;
};

class PriorityHandler : public CivetHandler {
public:
  explicit PriorityHandler(ScanEngine &engine) : engine_(engine) {}
  bool handlePost(CivetServer *, struct mg_connection *conn) override {
    int64_t hz = 0;
    if (!query(conn, "freq", parse_hz, hz)) {
      reply_error(conn, "missing or invalid freq");
      return true;
    }
    reply_ok(conn, engine_.add_priority(hz));
    return true;
  }

private:
  ScanEngine &engine_;
};

class ThresholdHandler : public CivetHandler {
public:
  explicit ThresholdHandler(ScanEngine &engine) : engine_(engine) {}
  bool handlePost(CivetServer *, struct mg_connection *conn) override {
    double db = 0.0;
    if (!query(conn, "db", parse_db, db)) {
      reply_error(conn, "missing or invalid db");
      return true;
    }
    engine_.set_threshold(static_cast<float>(db));
    log::info("Threshold set to " + std::to_string(db) + " dB");
    reply(conn, 200, "{\"threshold\":" + std::to_string(db) + "}");
    return true;
  }

private:
  ScanEngine &engine_;
};

class StepHandler : public CivetHandler {
public:
  explicit StepHandler(ScanEngine &engine) : engine_(engine) {}
  bool handlePost(CivetServer *, struct mg_connection *conn) override {
    size_t index = 0;
    if (!query(conn, "index", parse_index, index)) {
      reply_error(conn, "missing or invalid index");
      return true;
    }
    reply_ok(conn, engine_.jump_to_step(index, wall_clock()));
    return true;
  }

private:
  ScanEngine &engine_;
};

class DemodsHandler : public CivetHandler {
public:
  explicit DemodsHandler(const DemodBank &bank) : bank_(bank) {}
  bool handleGet(CivetServer *, struct mg_connection *conn) override {
    reply(conn, 200, demods_json(bank_));
    return true;
  }

private:
  const DemodBank &bank_;
};

class SquelchHandler : public CivetHandler {
public:
  explicit SquelchHandler(DemodBank &bank) : bank_(bank) {}
  bool handlePost(CivetServer *, struct mg_connection *conn) override {
    double db = 0.0;
    if (!query(conn, "db", parse_db, db)) {
      reply_error(conn, "missing or invalid db");
      return true;
    }
    int applied = bank_.set_squelch(static_cast<int>(db));
    reply(conn, 200, "{\"squelch\":" + std::to_string(applied) + "}");
    return true;
  }

private:
  DemodBank &bank_;
};

WebServer::WebServer(ScanEngine &engine, DemodBank &bank, int port) {
  std::vector<std::string> opts = {"listening_ports", std::to_string(port),
                                   "num_threads", "4"};
  server_ = std::make_unique<CivetServer>(opts);
  status_handler_ = std::make_unique<StatusHandler>(engine);
  channels_handler_ = std::make_unique<ChannelsHandler>(engine);
  lockout_handler_ = std::make_unique<LockoutHandler>(engine);
  priority_handler_ = std::make_unique<PriorityHandler>(engine);
  threshold_handler_ = std::make_unique<ThresholdHandler>(engine);
  step_handler_ = std::make_unique<StepHandler>(engine);
  demods_handler_ = std::make_unique<DemodsHandler>(bank);
  squelch_handler_ = std::make_unique<SquelchHandler>(bank);
  server_->addHandler("/api/status", *status_handler_);
  server_->addHandler("/api/channels", *channels_handler_);
  server_->addHandler("/api/lockout", *lockout_handler_);
  server_->addHandler("/api/priority", *priority_handler_);
  server_->addHandler("/api/threshold", *threshold_handler_);
  server_->addHandler("/api/step", *step_handler_);
  server_->addHandler("/api/demods", *demods_handler_);
  server_->addHandler("/api/squelch", *squelch_handler_);
  log::info("Control server listening on port " + std::to_string(port));
}

WebServer::~WebServer() {
  if (server_) {
    server_->removeHandler("/api/status");
    server_->removeHandler("/api/channels");
    server_->removeHandler("/api/lockout");
    server_->removeHandler("/api/priority");
    server_->removeHandler("/api/threshold");
    server_->removeHandler("/api/step");
    server_->removeHandler("/api/demods");
    server_->removeHandler("/api/squelch");
  }
}

} // namespace chanscan
