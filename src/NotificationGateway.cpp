#include "NotificationGateway.h"

#include <cstdio>
#include <ctime>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "DeviceClassifier.h"

static std::string type_label(const std::string& key) {
  DeviceType t = DeviceType::Unknown;
  DeviceClassifier::ParseDeviceType(key.c_str(), t);
  return DeviceClassifier::DeviceTypeLabel(t);
}

static std::string join_tags(const std::vector<std::string>& tags) {
  std::string out;
  for (const auto& t : tags) {
    if (!out.empty()) out += ',';
    out += t;
  }
  return out;
}

NotificationGateway::NotificationGateway(DeviceStore& store,
                                         HttpClient& http,
                                         std::string base_url,
                                         long timeout_ms,
                                         Clock clock)
  : _store(store),
    _http(http),
    _baseUrl(std::move(base_url)),
    _timeoutMs(timeout_ms),
    _clock(std::move(clock)) {
  while (!_baseUrl.empty() && _baseUrl.back() == '/') _baseUrl.pop_back();
}

int64_t NotificationGateway::now() const {
  return _clock ? _clock() : (int64_t)std::time(nullptr);
}

// ----------------------------- Lifecycle -----------------------------

void NotificationGateway::start() {
  NotificationSettings s = _store.getSettings();
  std::vector<Device> watched = _store.getWatchedDevices();

  std::lock_guard<std::mutex> lock(_mutex);
  _settings = std::move(s);
  _watched.clear();
  for (const auto& d : watched) {
    if (d.last_seen_s > 0) _watched[d.mac].last_seen_s = d.last_seen_s;
  }
  spdlog::info("Notification gateway started (enabled={}, watched={})", _settings.ntfy_enabled, _watched.size());
}

void NotificationGateway::stop() {
  spdlog::debug("Notification gateway stopped");
}

void NotificationGateway::reloadSettings() {
  NotificationSettings s = _store.getSettings();
  std::lock_guard<std::mutex> lock(_mutex);
  _settings = std::move(s);
  spdlog::info("Notification settings reloaded (enabled={})", _settings.ntfy_enabled);
}

NotificationSettings NotificationGateway::settings() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _settings;
}

// ----------------------------- Delivery -----------------------------

bool NotificationGateway::send(const std::string& title,
                               const std::string& message,
                               int priority,
                               const std::vector<std::string>& tags) {
  NotificationSettings s = settings();
  if (!s.ntfy_enabled) return false;
  if (s.ntfy_topic.empty()) {
    spdlog::warn("Notifications enabled but no topic configured");
    return false;
  }

  if (priority < 1) priority = 1;
  if (priority > 5) priority = 5;

  HttpHeaders headers = {
    { "Title", title },
    { "Priority", std::to_string(priority) },
  };
  if (!tags.empty()) headers.emplace_back("Tags", join_tags(tags));

  HttpResponse resp;
  try {
    if (!_http.post(_baseUrl + "/" + s.ntfy_topic, headers, message, _timeoutMs, resp)) {
      spdlog::warn("Notification failed: transport error or timeout");
      return false;
    }
  } catch (const std::exception& e) {
    spdlog::error("Notification error: {}", e.what());
    return false;
  }

  if (resp.status < 200 || resp.status >= 300) {
    spdlog::warn("Notification failed: {}", resp.status);
    return false;
  }
  spdlog::info("Notification sent: {}", title);
  return true;
}

// ----------------------------- Triggers -----------------------------

void NotificationGateway::onDeviceSeen(const Device& device, bool is_new) {
  std::vector<Alert> alerts;
  const int64_t t = now();
  {
    std::lock_guard<std::mutex> lock(_mutex);

    if (is_new && _settings.ntfy_enabled && _settings.notify_new_device) {
      alerts.push_back({
        "New Device Detected",
        device.displayName() + " (" + device.mac + ")\nType: " + type_label(device.device_type),
        3,
        { "new", "bluetooth" },
      });
    } else if (device.watched) {
      WatchState& ws = _watched[device.mac];
      if (ws.last_seen_s > 0) {
        const double minutes_absent = (double)(t - ws.last_seen_s) / 60.0;
        if (_settings.ntfy_enabled && _settings.notify_watched_return &&
            minutes_absent >= _settings.watched_return_minutes) {
          alerts.push_back({
            "Watched Device Returned",
            device.displayName() + " is back\nWas absent for " + FormatDuration(minutes_absent),
            4,
            { "loudspeaker", "bluetooth" },
          });
        }
      }
      ws.last_seen_s = t;
    }
  }

  for (const auto& a : alerts) send(a.title, a.message, a.priority, a.tags);
}

void NotificationGateway::checkAbsentDevices() {
  NotificationSettings s = settings();
  if (!s.ntfy_enabled || !s.notify_watched_leave) return;

  std::vector<Device> watched;
  try {
    watched = _store.getWatchedDevices();
  } catch (const std::exception& e) {
    spdlog::error("Absence check failed: {}", e.what());
    return;
  }

  const int64_t t = now();
  const int64_t threshold_s = (int64_t)s.watched_absence_minutes * 60;
  std::vector<Alert> alerts;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& d : watched) {
      if (d.last_seen_s <= 0) continue;
      if (t - d.last_seen_s < threshold_s) continue;

      WatchState& ws = _watched[d.mac];
      if (ws.last_absence_alert_s > 0 && t - ws.last_absence_alert_s < ABSENCE_ALERT_SUPPRESS_S) continue;

      alerts.push_back({
        "Watched Device Left",
        d.displayName() + " hasn't been seen for " + FormatDuration((double)(t - d.last_seen_s) / 60.0),
        3,
        { "wave", "bluetooth" },
      });
      ws.last_absence_alert_s = t;
    }
  }

  for (const auto& a : alerts) send(a.title, a.message, a.priority, a.tags);
}

void NotificationGateway::updateWatchedState(const std::string& mac, bool watched) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (watched) {
    _watched[mac].last_seen_s = now();
  } else {
    _watched.erase(mac);
  }
}

// ----------------------------- Formatting -----------------------------

std::string NotificationGateway::FormatDuration(double minutes) {
  char buf[48];
  if (minutes < 60) {
    const int m = (int)minutes;
    std::snprintf(buf, sizeof(buf), "%d minute%s", m, m == 1 ? "" : "s");
  } else if (minutes < 1440) {
    std::snprintf(buf, sizeof(buf), "%.1f hours", minutes / 60.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f days", minutes / 1440.0);
  }
  return buf;
}
