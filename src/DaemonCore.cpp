#include "DaemonCore.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <vector>

#include <spdlog/spdlog.h>

#include "DeviceClassifier.h"
#include "MacAddress.h"

using nlohmann::json;

static constexpr int DEFAULT_DAYS = 30;
static constexpr int MAX_DAYS = 3650;
static constexpr int64_t MAX_MINUTES = 7 * 24 * 60;
static constexpr int64_t CLEANUP_INTERVAL_S = 24 * 60 * 60;

// ----------------------------- JSON helpers -----------------------------

static json ok() {
  return json{ { "status", "ok" } };
}

static json error_response(const std::string& message) {
  return json{ { "status", "error" }, { "message", message } };
}

static json optional_text(const std::string& s) {
  return s.empty() ? json(nullptr) : json(s);
}

// Non-empty string field, normalized as an address.
static bool get_mac(const json& req, std::string& mac) {
  auto it = req.find("mac");
  if (it == req.end() || !it->is_string()) return false;
  mac = MacAddress::Normalize(it->get<std::string>());
  return !mac.empty();
}

// Missing or non-positive means the default; larger than MAX_DAYS is clamped.
static int get_days(const json& req) {
  auto it = req.find("days");
  if (it == req.end() || !it->is_number_integer()) return DEFAULT_DAYS;
  if (it->is_number_unsigned()) {
    return it->get<uint64_t>() > (uint64_t)MAX_DAYS ? MAX_DAYS : (int)it->get<uint64_t>();
  }
  const int64_t d = it->get<int64_t>();
  if (d <= 0) return DEFAULT_DAYS;
  return d > MAX_DAYS ? MAX_DAYS : (int)d;
}

static bool get_flag(const json& req, const char* key, bool fallback) {
  auto it = req.find(key);
  if (it == req.end() || !it->is_boolean()) return fallback;
  return it->get<bool>();
}

static json distribution_json(const std::map<int, int>& dist) {
  json out = json::object();
  for (const auto& kv : dist) out[std::to_string(kv.first)] = kv.second;
  return out;
}

static json settings_json(const NotificationSettings& s) {
  return json{
    { "ntfy_enabled", s.ntfy_enabled },
    { "ntfy_topic", s.ntfy_topic },
    { "notify_new_device", s.notify_new_device },
    { "notify_watched_return", s.notify_watched_return },
    { "notify_watched_leave", s.notify_watched_leave },
    { "watched_return_minutes", s.watched_return_minutes },
    { "watched_absence_minutes", s.watched_absence_minutes },
  };
}

// Applies the recognised keys of `patch`; false with `why` on a type mismatch.
static bool apply_settings(const json& patch, NotificationSettings& s, std::string& why) {
  auto flag = [&](const char* key, bool& out) {
    auto it = patch.find(key);
    if (it == patch.end()) return true;
    if (!it->is_boolean()) { why = std::string("Invalid value for ") + key; return false; }
    out = it->get<bool>();
    return true;
  };
  auto minutes = [&](const char* key, int& out) {
    auto it = patch.find(key);
    if (it == patch.end()) return true;
    const bool in_range = it->is_number_unsigned()
      ? it->get<uint64_t>() <= (uint64_t)MAX_MINUTES
      : it->is_number_integer() && it->get<int64_t>() >= 0 && it->get<int64_t>() <= MAX_MINUTES;
    if (!in_range) {
      why = std::string("Invalid value for ") + key;
      return false;
    }
    out = (int)it->get<int64_t>();
    return true;
  };

  auto topic = patch.find("ntfy_topic");
  if (topic != patch.end()) {
    if (!topic->is_string()) { why = "Invalid value for ntfy_topic"; return false; }
    s.ntfy_topic = topic->get<std::string>();
  }

  return flag("ntfy_enabled", s.ntfy_enabled) &&
         flag("notify_new_device", s.notify_new_device) &&
         flag("notify_watched_return", s.notify_watched_return) &&
         flag("notify_watched_leave", s.notify_watched_leave) &&
         minutes("watched_return_minutes", s.watched_return_minutes) &&
         minutes("watched_absence_minutes", s.watched_absence_minutes);
}

// "phone class=phone/smartphone services=Battery,Heart Rate"
static std::string describe_device(const ScannedDevice& sd, DeviceType type) {
  std::string text = DeviceClassifier::DeviceTypeName(type);
  if (sd.has_device_class) {
    const DeviceClassInfo info = DeviceClassifier::DecodeDeviceClass(sd.device_class);
    text += std::string(" class=") + info.major;
    if (info.minor) text += std::string("/") + info.minor;
  }
  const std::vector<std::string> services = DeviceClassifier::UuidNames(sd.service_uuids);
  for (size_t i = 0; i < services.size(); i++) {
    text += (i == 0 ? " services=" : ",");
    text += services[i];
  }
  return text;
}

json DaemonCore::IsoTimestamp(int64_t epoch_s) {
  if (epoch_s <= 0) return nullptr;
  const time_t t = (time_t)epoch_s;
  struct tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf);
}

json DaemonCore::DeviceToJson(const Device& d) {
  return json{
    { "mac", d.mac },
    { "vendor", optional_text(d.vendor) },
    { "friendly_name", optional_text(d.friendly_name) },
    { "device_type", d.device_type },
    { "ignored", d.ignored },
    { "watched", d.watched },
    { "first_seen", IsoTimestamp(d.first_seen_s) },
    { "last_seen", IsoTimestamp(d.last_seen_s) },
    { "total_sightings", d.total_sightings },
  };
}

// ----------------------------- Lifecycle -----------------------------

DaemonCore::DaemonCore(const DaemonConfig& config,
                       DualBackendScanner& scanner,
                       DeviceStore& store,
                       NotificationGateway& gateway)
  : _config(config),
    _scanner(scanner),
    _store(store),
    _gateway(gateway),
    _server(config.socket_path, config.socket_permissions,
            [this](const json& req) { return handleRequest(req); }) {}

DaemonCore::~DaemonCore() {
  stop();
}

bool DaemonCore::start() {
  if (_running) return true;
  spdlog::info("Starting bluehood daemon...");

  try {
    _gateway.start();
  } catch (const std::exception& e) {
    spdlog::critical("Cannot load notification state: {}", e.what());
    return false;
  }

  _running = true;
  if (!_server.start()) {
    _running = false;
    return false;
  }

  _scanThread = std::thread(&DaemonCore::scanLoop, this);
  _monitorThread = std::thread(&DaemonCore::monitorLoop, this);
  return true;
}

void DaemonCore::stop() {
  {
    std::lock_guard<std::mutex> lock(_waitMutex);
    if (!_running && !_scanThread.joinable() && !_monitorThread.joinable()) return;
    _running = false;
  }
  spdlog::info("Stopping bluehood daemon...");
  _wake.notify_all();

  // Clients go first so no connection can hold up a cycle's broadcast.
  _server.stop();

  if (_scanThread.joinable()) _scanThread.join();
  if (_monitorThread.joinable()) _monitorThread.join();

  _gateway.stop();
  spdlog::info("Daemon stopped");
}

// true if still running after the wait
bool DaemonCore::waitFor(int seconds) {
  std::unique_lock<std::mutex> lock(_waitMutex);
  _wake.wait_for(lock, std::chrono::seconds(seconds), [this] { return !_running; });
  return _running;
}

// ----------------------------- Loops -----------------------------

size_t DaemonCore::runCycle() {
  size_t count = 0;
  try {
    const std::vector<ScannedDevice> devices = _scanner.scan();

    for (const auto& sd : devices) {
      const DeviceType type = DeviceClassifier::Classify(
        sd.vendor, sd.name, sd.service_uuids, sd.has_device_class, sd.device_class);
      if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
        spdlog::debug("{} ({}, {} dBm): {}", sd.mac, ScanBackendName(sd.backend), sd.rssi,
                      describe_device(sd, type));
      }

      const Device dev = _store.upsert(sd.mac, sd.vendor, sd.rssi, DeviceClassifier::DeviceTypeName(type));
      _gateway.onDeviceSeen(dev, dev.total_sightings == 1);
    }
    count = devices.size();

    _server.broadcast(json{ { "event", "scan_complete" }, { "count", count } });
  } catch (const std::exception& e) {
    spdlog::error("Scan error: {}", e.what());
  }
  return count;
}

void DaemonCore::scanLoop() {
  spdlog::info("Starting scan loop (interval: {}s)", _config.scan_interval_s);
  while (_running) {
    runCycle();
    if (!waitFor(_config.scan_interval_s)) break;
  }
}

void DaemonCore::monitorLoop() {
  int64_t last_cleanup = 0;
  while (waitFor(_config.absence_check_interval_s)) {
    _gateway.checkAbsentDevices();

    const int64_t now = (int64_t)std::time(nullptr);
    if (now - last_cleanup >= CLEANUP_INTERVAL_S) {
      try {
        const int removed = _store.cleanupOldSightings(_config.sighting_retention_days);
        if (removed > 0) spdlog::info("Removed {} sightings older than {} days", removed, _config.sighting_retention_days);
      } catch (const std::exception& e) {
        spdlog::error("Sighting cleanup failed: {}", e.what());
      }
      last_cleanup = now;
    }
  }
}

// ----------------------------- Requests -----------------------------

json DaemonCore::handleRequest(const json& request) {
  if (!request.is_object()) return error_response("Invalid JSON");

  std::string cmd;
  auto it = request.find("cmd");
  if (it != request.end()) cmd = it->is_string() ? it->get<std::string>() : it->dump();

  try {
    return dispatch(cmd, request);
  } catch (const std::exception& e) {
    spdlog::error("Error handling request '{}': {}", cmd, e.what());
    return error_response("Internal error");
  }
}

json DaemonCore::dispatch(const std::string& cmd, const json& req) {
  std::string mac;

  if (cmd == "list") {
    json devices = json::array();
    for (const auto& d : _store.getAllDevices(get_flag(req, "include_ignored", true))) {
      devices.push_back(DeviceToJson(d));
    }
    return json{ { "status", "ok" }, { "devices", std::move(devices) } };
  }

  if (cmd == "get_device") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    Device d;
    if (!_store.getDevice(mac, d)) return error_response("Unknown device: " + mac);
    return json{ { "status", "ok" }, { "device", DeviceToJson(d) } };
  }

  if (cmd == "set_name") {
    auto name = req.find("name");
    if (!get_mac(req, mac) || name == req.end() || !name->is_string()) return error_response("Missing mac or name");
    if (!_store.setFriendlyName(mac, name->get<std::string>())) return error_response("Unknown device: " + mac);
    return ok();
  }

  if (cmd == "set_ignored") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    if (!_store.setIgnored(mac, get_flag(req, "ignored", false))) return error_response("Unknown device: " + mac);
    return ok();
  }

  if (cmd == "set_watched") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    const bool watched = get_flag(req, "watched", false);
    if (!_store.setWatched(mac, watched)) return error_response("Unknown device: " + mac);
    _gateway.updateWatchedState(mac, watched);
    return ok();
  }

  if (cmd == "get_sightings") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    json sightings = json::array();
    for (const auto& s : _store.getSightings(mac, get_days(req))) {
      sightings.push_back(json{ { "timestamp", IsoTimestamp(s.timestamp_s) }, { "rssi", s.rssi } });
    }
    return json{ { "status", "ok" }, { "sightings", std::move(sightings) } };
  }

  if (cmd == "get_hourly") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    return json{ { "status", "ok" }, { "hourly", distribution_json(_store.getHourlyDistribution(mac, get_days(req))) } };
  }

  if (cmd == "get_daily") {
    if (!get_mac(req, mac)) return error_response("Missing mac");
    return json{ { "status", "ok" }, { "daily", distribution_json(_store.getDailyDistribution(mac, get_days(req))) } };
  }

  if (cmd == "status") {
    return json{ { "status", "ok" }, { "running", isRunning() }, { "clients", clientCount() } };
  }

  if (cmd == "get_settings") {
    return json{ { "status", "ok" }, { "settings", settings_json(_store.getSettings()) } };
  }

  if (cmd == "set_settings") {
    auto patch = req.find("settings");
    const json& src = (patch != req.end() && patch->is_object()) ? *patch : req;

    NotificationSettings s = _store.getSettings();
    std::string why;
    if (!apply_settings(src, s, why)) return error_response(why);

    _store.saveSettings(s);
    _gateway.reloadSettings();
    return json{ { "status", "ok" }, { "settings", settings_json(s) } };
  }

  return error_response("Unknown command: " + cmd);
}
