#pragma once
#include "scan/channel_activity.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace chanscan {

// Channel log persisted to SQLite, one row per channel event.
class DataStore {
public:
  explicit DataStore(const std::string &path);
  ~DataStore();

  DataStore(const DataStore &) = delete;
  DataStore &operator=(const DataStore &) = delete;

  bool open();
  void close();
  bool is_open() const { return db_ != nullptr; }
  bool init();
  bool insert(const std::vector<ChannelEvent> &events);
  // Newest first.
  std::vector<ChannelEvent> recent(int limit);

private:
  std::string path_;
  sqlite3 *db_;
};

} // namespace chanscan
