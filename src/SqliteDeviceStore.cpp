#include "SqliteDeviceStore.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

static const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS devices (
    mac TEXT PRIMARY KEY,
    vendor TEXT,
    friendly_name TEXT,
    device_type TEXT DEFAULT 'unknown',
    ignored INTEGER DEFAULT 0,
    watched INTEGER DEFAULT 0,
    first_seen TIMESTAMP,
    last_seen TIMESTAMP,
    total_sightings INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS sightings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    mac TEXT NOT NULL,
    timestamp TIMESTAMP NOT NULL,
    rssi INTEGER,
    FOREIGN KEY (mac) REFERENCES devices(mac)
);

CREATE INDEX IF NOT EXISTS idx_sightings_mac_time ON sightings(mac, timestamp);
CREATE INDEX IF NOT EXISTS idx_sightings_timestamp ON sightings(timestamp);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT
);
)SQL";

static const char* DEVICE_COLUMNS =
  "mac, vendor, friendly_name, device_type, ignored, watched, first_seen, last_seen, total_sightings";

// ----------------------------- Statement -----------------------------

namespace {

// Prepared statement bound to the store's connection; finalized on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) : _db(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &_stmt, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(_stmt); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind(int idx, const std::string& v) {
    check(sqlite3_bind_text(_stmt, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT));
    return *this;
  }
  Statement& bind(int idx, int64_t v) {
    check(sqlite3_bind_int64(_stmt, idx, v));
    return *this;
  }
  Statement& bindNull(int idx) {
    check(sqlite3_bind_null(_stmt, idx));
    return *this;
  }

  // true while a row is available
  bool step() {
    const int rc = sqlite3_step(_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(_db));
  }

  std::string text(int col) const {
    const unsigned char* t = sqlite3_column_text(_stmt, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string{};
  }
  int64_t int64(int col) const { return sqlite3_column_int64(_stmt, col); }
  bool isNull(int col) const { return sqlite3_column_type(_stmt, col) == SQLITE_NULL; }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(_db));
  }

  sqlite3* _db;
  sqlite3_stmt* _stmt = nullptr;
};

// Rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : _db(db) { run("BEGIN"); }
  ~Transaction() {
    if (!_done) sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr);
  }
  void commit() {
    run("COMMIT");
    _done = true;
  }

private:
  void run(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw std::runtime_error(std::string("sqlite ") + sql + ": " + msg);
    }
  }

  sqlite3* _db;
  bool _done = false;
};

Device read_device(const Statement& st) {
  Device d;
  d.mac = st.text(0);
  d.vendor = st.text(1);
  d.friendly_name = st.text(2);
  d.device_type = st.isNull(3) ? "unknown" : st.text(3);
  d.ignored = st.int64(4) != 0;
  d.watched = st.int64(5) != 0;
  d.first_seen_s = SqliteDeviceStore::ParseTimestamp(st.text(6));
  d.last_seen_s = SqliteDeviceStore::ParseTimestamp(st.text(7));
  d.total_sightings = (int)st.int64(8);
  return d;
}

std::string days_modifier(int days) {
  return "-" + std::to_string(days < 0 ? 0 : days) + " days";
}

bool parse_bool(const std::string& v) {
  return v == "1" || v == "true";
}

int parse_int(const std::string& v, int fallback) {
  try {
    return std::stoi(v);
  } catch (const std::exception&) {
    return fallback;
  }
}

} // namespace

// ----------------------------- Timestamps -----------------------------

std::string SqliteDeviceStore::FormatTimestamp(int64_t epoch_s) {
  if (epoch_s <= 0) return {};
  const time_t t = (time_t)epoch_s;
  struct tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

int64_t SqliteDeviceStore::ParseTimestamp(const std::string& text) {
  if (text.empty()) return 0;
  struct tm tm{};
  if (std::sscanf(text.c_str(), "%d-%d-%d%*c%d:%d:%d",
                  &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
    return 0;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  return (int64_t)timegm(&tm);
}

// ----------------------------- Lifecycle -----------------------------

SqliteDeviceStore::SqliteDeviceStore(std::string path)
  : _path(std::move(path)) {}

SqliteDeviceStore::~SqliteDeviceStore() {
  if (_db) sqlite3_close(_db);
}

bool SqliteDeviceStore::begin() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (sqlite3_open(_path.c_str(), &_db) != SQLITE_OK) {
    spdlog::critical("Cannot open database {}: {}", _path, _db ? sqlite3_errmsg(_db) : "out of memory");
    if (_db) {
      sqlite3_close(_db);
      _db = nullptr;
    }
    return false;
  }
  sqlite3_busy_timeout(_db, 5000);

  try {
    exec(SCHEMA);
  } catch (const std::exception& e) {
    spdlog::critical("Cannot initialize database schema: {}", e.what());
    return false;
  }
  spdlog::info("Database ready at {}", _path);
  return true;
}

void SqliteDeviceStore::exec(const char* sql) {
  if (!_db) throw std::runtime_error("database not open");
  char* err = nullptr;
  if (sqlite3_exec(_db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

// ----------------------------- Devices -----------------------------

Device SqliteDeviceStore::upsert(const std::string& mac, const std::string& vendor, int rssi,
                                 const std::string& device_type) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_db) throw std::runtime_error("database not open");

  const std::string now = FormatTimestamp((int64_t)std::time(nullptr));
  const std::string type = device_type.empty() ? std::string("unknown") : device_type;

  Transaction tx(_db);
  {
    Statement st(_db,
      "INSERT INTO devices (mac, vendor, device_type, first_seen, last_seen, total_sightings) "
      "VALUES (?1, ?2, ?3, ?4, ?4, 1) "
      "ON CONFLICT(mac) DO UPDATE SET "
      "  last_seen = excluded.last_seen, "
      "  total_sightings = total_sightings + 1, "
      "  vendor = COALESCE(NULLIF(vendor, ''), excluded.vendor), "
      "  device_type = CASE WHEN device_type IS NULL OR device_type = 'unknown' "
      "                     THEN excluded.device_type ELSE device_type END");
    st.bind(1, mac);
    if (vendor.empty()) st.bindNull(2); else st.bind(2, vendor);
    st.bind(3, type).bind(4, now);
    st.step();
  }
  {
    Statement st(_db, "INSERT INTO sightings (mac, timestamp, rssi) VALUES (?1, ?2, ?3)");
    st.bind(1, mac).bind(2, now).bind(3, (int64_t)rssi);
    st.step();
  }
  tx.commit();

  Device d;
  if (!getDeviceLocked(mac, d)) throw std::runtime_error("upserted device vanished: " + mac);
  return d;
}

bool SqliteDeviceStore::getDeviceLocked(const std::string& mac, Device& out) {
  if (!_db) throw std::runtime_error("database not open");
  Statement st(_db, std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE mac = ?1");
  st.bind(1, mac);
  if (!st.step()) return false;
  out = read_device(st);
  return true;
}

bool SqliteDeviceStore::getDevice(const std::string& mac, Device& out) {
  std::lock_guard<std::mutex> lock(_mutex);
  return getDeviceLocked(mac, out);
}

std::vector<Device> SqliteDeviceStore::queryDevices(const char* where) {
  if (!_db) throw std::runtime_error("database not open");
  Statement st(_db, std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices " + where +
                    " ORDER BY last_seen DESC");
  std::vector<Device> out;
  while (st.step()) out.push_back(read_device(st));
  return out;
}

std::vector<Device> SqliteDeviceStore::getAllDevices(bool include_ignored) {
  std::lock_guard<std::mutex> lock(_mutex);
  return queryDevices(include_ignored ? "" : "WHERE ignored = 0");
}

std::vector<Device> SqliteDeviceStore::getWatchedDevices() {
  std::lock_guard<std::mutex> lock(_mutex);
  return queryDevices("WHERE watched = 1");
}

bool SqliteDeviceStore::updateFlag(const char* sql, const std::string& mac, const std::string* text, int value) {
  if (!_db) throw std::runtime_error("database not open");
  Statement st(_db, sql);
  if (text) st.bind(1, *text); else st.bind(1, (int64_t)value);
  st.bind(2, mac);
  st.step();
  return sqlite3_changes(_db) > 0;
}

bool SqliteDeviceStore::setFriendlyName(const std::string& mac, const std::string& name) {
  std::lock_guard<std::mutex> lock(_mutex);
  return updateFlag("UPDATE devices SET friendly_name = ?1 WHERE mac = ?2", mac, &name, 0);
}

bool SqliteDeviceStore::setIgnored(const std::string& mac, bool ignored) {
  std::lock_guard<std::mutex> lock(_mutex);
  return updateFlag("UPDATE devices SET ignored = ?1 WHERE mac = ?2", mac, nullptr, ignored ? 1 : 0);
}

bool SqliteDeviceStore::setWatched(const std::string& mac, bool watched) {
  std::lock_guard<std::mutex> lock(_mutex);
  return updateFlag("UPDATE devices SET watched = ?1 WHERE mac = ?2", mac, nullptr, watched ? 1 : 0);
}

// ----------------------------- Sightings -----------------------------

std::vector<Sighting> SqliteDeviceStore::getSightings(const std::string& mac, int days) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_db) throw std::runtime_error("database not open");

  Statement st(_db,
    "SELECT timestamp, rssi FROM sightings "
    "WHERE mac = ?1 AND timestamp > datetime('now', ?2) "
    "ORDER BY timestamp DESC, id DESC");
  st.bind(1, mac).bind(2, days_modifier(days));

  std::vector<Sighting> out;
  while (st.step()) {
    Sighting s;
    s.timestamp_s = ParseTimestamp(st.text(0));
    s.rssi = (int)st.int64(1);
    out.push_back(s);
  }
  return out;
}

std::map<int, int> SqliteDeviceStore::distribution(const char* sql, const std::string& mac, int days) {
  if (!_db) throw std::runtime_error("database not open");
  Statement st(_db, sql);
  st.bind(1, mac).bind(2, days_modifier(days));

  std::map<int, int> out;
  while (st.step()) out[(int)st.int64(0)] = (int)st.int64(1);
  return out;
}

std::map<int, int> SqliteDeviceStore::getHourlyDistribution(const std::string& mac, int days) {
  std::lock_guard<std::mutex> lock(_mutex);
  return distribution(
    "SELECT CAST(strftime('%H', timestamp, 'localtime') AS INTEGER) AS hour, COUNT(*) "
    "FROM sightings WHERE mac = ?1 AND timestamp > datetime('now', ?2) "
    "GROUP BY hour ORDER BY hour", mac, days);
}

std::map<int, int> SqliteDeviceStore::getDailyDistribution(const std::string& mac, int days) {
  std::lock_guard<std::mutex> lock(_mutex);
  // %w is 0 = Sunday; shift so 0 = Monday
  return distribution(
    "SELECT (CAST(strftime('%w', timestamp, 'localtime') AS INTEGER) + 6) % 7 AS day, COUNT(*) "
    "FROM sightings WHERE mac = ?1 AND timestamp > datetime('now', ?2) "
    "GROUP BY day ORDER BY day", mac, days);
}

int SqliteDeviceStore::cleanupOldSightings(int days) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_db) throw std::runtime_error("database not open");
  Statement st(_db, "DELETE FROM sightings WHERE timestamp < datetime('now', ?1)");
  st.bind(1, days_modifier(days));
  st.step();
  return sqlite3_changes(_db);
}

// ----------------------------- Settings -----------------------------

NotificationSettings SqliteDeviceStore::getSettings() {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_db) throw std::runtime_error("database not open");

  NotificationSettings s;
  Statement st(_db, "SELECT key, value FROM settings");
  while (st.step()) {
    const std::string key = st.text(0);
    const std::string value = st.text(1);
    if (key == "ntfy_enabled") s.ntfy_enabled = parse_bool(value);
    else if (key == "ntfy_topic") s.ntfy_topic = value;
    else if (key == "notify_new_device") s.notify_new_device = parse_bool(value);
    else if (key == "notify_watched_return") s.notify_watched_return = parse_bool(value);
    else if (key == "notify_watched_leave") s.notify_watched_leave = parse_bool(value);
    else if (key == "watched_return_minutes") s.watched_return_minutes = parse_int(value, s.watched_return_minutes);
    else if (key == "watched_absence_minutes") s.watched_absence_minutes = parse_int(value, s.watched_absence_minutes);
  }
  return s;
}

void SqliteDeviceStore::saveSettings(const NotificationSettings& s) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_db) throw std::runtime_error("database not open");

  const std::pair<const char*, std::string> rows[] = {
    { "ntfy_enabled",            s.ntfy_enabled ? "1" : "0" },
    { "ntfy_topic",              s.ntfy_topic },
    { "notify_new_device",       s.notify_new_device ? "1" : "0" },
    { "notify_watched_return",   s.notify_watched_return ? "1" : "0" },
    { "notify_watched_leave",    s.notify_watched_leave ? "1" : "0" },
    { "watched_return_minutes",  std::to_string(s.watched_return_minutes) },
    { "watched_absence_minutes", std::to_string(s.watched_absence_minutes) },
  };

  Transaction tx(_db);
  for (const auto& kv : rows) {
    Statement st(_db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)");
    st.bind(1, std::string(kv.first)).bind(2, kv.second);
    st.step();
  }
  tx.commit();
}
