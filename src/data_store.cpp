#include "data_store.hpp"
#include "logging.hpp"

namespace chanscan {

namespace {
EventKind event_from_string(const std::string &s) {
  if (s == "on")
    return EventKind::Opened;
  if (s == "act")
    return EventKind::Active;
  return EventKind::Closed;
}

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : "";
}
} // namespace

DataStore::DataStore(const std::string &path) : path_(path), db_(nullptr) {}
DataStore::~DataStore() { close(); }

bool DataStore::open() {
  if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
    log::error("Cannot open database " + path_ + ": " +
               (db_ ? sqlite3_errmsg(db_) : "out of memory"));
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

void DataStore::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool DataStore::init() {
  const char *sql =
      "CREATE TABLE IF NOT EXISTS channel_events ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "timestamp REAL,"
      "frequency INTEGER,"
      "slot INTEGER,"
      "event TEXT,"
      "classification TEXT,"
      "detail TEXT);";
  char *err = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    log::error(std::string("Cannot create channel_events table: ") +
               (err ? err : "unknown error"));
    sqlite3_free(err);
    return false;
  }
  return true;
}

bool DataStore::insert(const std::vector<ChannelEvent> &events) {
  if (!db_)
    return false;
  const char *sql =
      "INSERT INTO channel_events "
      "(timestamp,frequency,slot,event,classification,detail)"
      " VALUES (?,?,?,?,?,?);";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
    return false;

  if (sqlite3_exec(db_, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr) !=
      SQLITE_OK) {
    sqlite3_finalize(stmt);
    return false;
  }
  bool ok = true;
  for (const auto &e : events) {
    sqlite3_bind_double(stmt, 1, e.timestamp);
    sqlite3_bind_int64(stmt, 2, e.freq_hz);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(e.slot));
    sqlite3_bind_text(stmt, 4, event_to_string(e.kind), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 5, classification_to_string(e.classification), -1,
                      SQLITE_STATIC);
    sqlite3_bind_text(stmt, 6, e.detail.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
      ok = false;
      break;
    }
    sqlite3_reset(stmt);
  }
  if (ok)
    ok = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK;
  if (!ok) {
    log::error(std::string("Channel event insert failed: ") +
               sqlite3_errmsg(db_));
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  sqlite3_finalize(stmt);
  return ok;
}

std::vector<ChannelEvent> DataStore::recent(int limit) {
  std::vector<ChannelEvent> out;
  if (!db_)
    return out;
  const char *sql =
      "SELECT timestamp,frequency,slot,event,classification,detail "
      "FROM channel_events ORDER BY id DESC LIMIT ?;";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
    return out;
  sqlite3_bind_int(stmt, 1, limit);
  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ChannelEvent e;
    e.timestamp = sqlite3_column_double(stmt, 0);
    e.freq_hz = sqlite3_column_int64(stmt, 1);
    e.slot = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
    e.kind = event_from_string(column_text(stmt, 3));
    e.classification = classification_from_string(column_text(stmt, 4));
    e.detail = column_text(stmt, 5);
    out.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE)
    out.clear();
  sqlite3_finalize(stmt);
  return out;
}

} // namespace chanscan
