#pragma once

#include <mutex>
#include <string>

#include <sqlite3.h>

#include "DeviceStore.h"

// DeviceStore over a single SQLite connection. ":memory:" gives a private
// in-memory database.
class SqliteDeviceStore : public DeviceStore {
public:
  explicit SqliteDeviceStore(std::string path);
  ~SqliteDeviceStore() override;

  SqliteDeviceStore(const SqliteDeviceStore&) = delete;
  SqliteDeviceStore& operator=(const SqliteDeviceStore&) = delete;

  // Opens the database and creates the schema.
  bool begin();

  Device upsert(const std::string& mac, const std::string& vendor, int rssi,
                const std::string& device_type) override;

  bool getDevice(const std::string& mac, Device& out) override;
  std::vector<Device> getAllDevices(bool include_ignored) override;
  std::vector<Device> getWatchedDevices() override;

  bool setFriendlyName(const std::string& mac, const std::string& name) override;
  bool setIgnored(const std::string& mac, bool ignored) override;
  bool setWatched(const std::string& mac, bool watched) override;

  std::vector<Sighting> getSightings(const std::string& mac, int days) override;
  std::map<int, int> getHourlyDistribution(const std::string& mac, int days) override;
  std::map<int, int> getDailyDistribution(const std::string& mac, int days) override;

  int cleanupOldSightings(int days) override;

  NotificationSettings getSettings() override;
  void saveSettings(const NotificationSettings& settings) override;

  // "YYYY-MM-DD HH:MM:SS" (UTC) <-> epoch seconds; 0 <-> empty.
  static std::string FormatTimestamp(int64_t epoch_s);
  static int64_t ParseTimestamp(const std::string& text);

private:
  void exec(const char* sql);
  bool getDeviceLocked(const std::string& mac, Device& out);
  std::vector<Device> queryDevices(const char* sql);
  std::map<int, int> distribution(const char* sql, const std::string& mac, int days);
  bool updateFlag(const char* sql, const std::string& mac, const std::string* text, int value);

  std::string _path;
  std::mutex _mutex;
  sqlite3* _db = nullptr;
};
