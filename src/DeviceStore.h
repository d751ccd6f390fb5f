#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// A persisted device. Timestamps are epoch seconds; 0 means never.
struct Device {
  std::string mac;
  std::string vendor;          // empty when unresolved
  std::string friendly_name;   // empty when the operator never set one
  std::string device_type = "unknown";
  bool        ignored = false;
  bool        watched = false;
  int64_t     first_seen_s = 0;
  int64_t     last_seen_s = 0;
  int         total_sightings = 0;

  // friendly name, else vendor, else address
  const std::string& displayName() const {
    if (!friendly_name.empty()) return friendly_name;
    if (!vendor.empty()) return vendor;
    return mac;
  }
};

struct Sighting {
  int64_t timestamp_s = 0;
  int     rssi = 0;
};

struct NotificationSettings {
  bool        ntfy_enabled = false;
  std::string ntfy_topic;
  bool        notify_new_device = false;
  bool        notify_watched_return = true;
  bool        notify_watched_leave = true;
  int         watched_return_minutes = 5;
  int         watched_absence_minutes = 30;
};

// Persistence collaborator. Implementations are safe to call from several
// threads and throw std::runtime_error on storage failures.
class DeviceStore {
public:
  virtual ~DeviceStore() = default;

  // Create-or-update: bumps last_seen and total_sightings, appends a
  // sighting. `vendor` fills an empty stored vendor; `device_type` replaces
  // a stored "unknown".
  virtual Device upsert(const std::string& mac, const std::string& vendor, int rssi,
                        const std::string& device_type) = 0;

  virtual bool getDevice(const std::string& mac, Device& out) = 0;
  virtual std::vector<Device> getAllDevices(bool include_ignored) = 0;
  virtual std::vector<Device> getWatchedDevices() = 0;

  // Return false when no such device exists.
  virtual bool setFriendlyName(const std::string& mac, const std::string& name) = 0;
  virtual bool setIgnored(const std::string& mac, bool ignored) = 0;
  virtual bool setWatched(const std::string& mac, bool watched) = 0;

  // Newest first.
  virtual std::vector<Sighting> getSightings(const std::string& mac, int days) = 0;
  // hour of day (0-23) -> count, local time
  virtual std::map<int, int> getHourlyDistribution(const std::string& mac, int days) = 0;
  // day of week (0 = Monday) -> count, local time
  virtual std::map<int, int> getDailyDistribution(const std::string& mac, int days) = 0;

  // Returns the number of sightings deleted.
  virtual int cleanupOldSightings(int days) = 0;

  virtual NotificationSettings getSettings() = 0;
  virtual void saveSettings(const NotificationSettings& settings) = 0;
};
