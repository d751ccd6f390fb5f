#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "DeviceStore.h"
#include "HttpClient.h"

// Turns presence transitions into push notifications (ntfy-style HTTP POST).
//
// Holds the per-watched-device state: last time the gateway saw it and the
// last time an absence alert fired. Settings and watched devices are loaded
// from the store by start() and reloadSettings().
class NotificationGateway {
public:
  using Clock = std::function<int64_t()>;   // epoch seconds

  static constexpr int64_t ABSENCE_ALERT_SUPPRESS_S = 3600;

  // `clock` defaults to the system clock.
  NotificationGateway(DeviceStore& store,
                      HttpClient& http,
                      std::string base_url,
                      long timeout_ms,
                      Clock clock = nullptr);

  void start();
  void stop();
  void reloadSettings();

  // Called once per device per scan cycle, after it was persisted.
  void onDeviceSeen(const Device& device, bool is_new);

  // Periodic sweep for watched devices that have been gone too long.
  void checkAbsentDevices();

  // Keeps watch state in step with the operator toggling `watched`.
  void updateWatchedState(const std::string& mac, bool watched);

  // POST `message` to <base>/<topic>. False when disabled, unconfigured or
  // the sink did not accept it; never throws.
  bool send(const std::string& title,
            const std::string& message,
            int priority = 3,
            const std::vector<std::string>& tags = {});

  NotificationSettings settings() const;

  // 45 -> "45 minutes", 90 -> "1.5 hours", 2000 -> "1.4 days"
  static std::string FormatDuration(double minutes);

private:
  struct WatchState {
    int64_t last_seen_s = 0;
    int64_t last_absence_alert_s = 0;
  };

  struct Alert {
    std::string title;
    std::string message;
    int priority;
    std::vector<std::string> tags;
  };

  int64_t now() const;

  DeviceStore& _store;
  HttpClient& _http;
  std::string _baseUrl;
  long _timeoutMs;
  Clock _clock;

  mutable std::mutex _mutex;
  NotificationSettings _settings;
  std::unordered_map<std::string, WatchState> _watched;
};
