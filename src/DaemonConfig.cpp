#include "DaemonConfig.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

static std::string home_dir() {
  const char* home = std::getenv("HOME");
  if (home && *home) return home;

  struct passwd* pw = getpwuid(getuid());
  if (pw && pw->pw_dir) return pw->pw_dir;
  return "/tmp";
}

// mkdir -p
static bool make_dirs(const std::string& path) {
  if (path.empty()) return false;

  std::string cur;
  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    cur = path.substr(0, pos);
    if (cur.empty()) continue;
    if (mkdir(cur.c_str(), 0755) < 0 && errno != EEXIST) {
      spdlog::error("Cannot create directory {}: {}", cur, std::strerror(errno));
      return false;
    }
  }
  return true;
}

template <typename T>
static void read_field(const json& obj, const char* key, T& out) {
  if (obj.contains(key) && !obj[key].is_null()) out = obj[key].get<T>();
}

DaemonConfig DaemonConfig::Defaults() {
  DaemonConfig c;

  const char* data = std::getenv("BLUEHOOD_DATA_DIR");
  c.data_dir = (data && *data) ? data : home_dir() + "/.local/share/bluehood";

  c.db_path        = c.data_dir + "/bluehood.db";
  c.config_path    = c.data_dir + "/config.json";
  c.oui_cache_path = c.data_dir + "/mac-vendors.txt";

  const char* adapter = std::getenv("BLUEHOOD_ADAPTER");
  if (adapter) c.adapter = adapter;

  return c;
}

bool DaemonConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::info("Config file not found at {}, using defaults", path);
    return true;
  }

  try {
    const json cfg = json::parse(file);

    if (cfg.contains("scan")) {
      const auto& s = cfg["scan"];
      read_field(s, "adapter", adapter);
      read_field(s, "interval_s", scan_interval_s);
      read_field(s, "ble_duration_s", ble_scan_duration_s);
      read_field(s, "classic_inquiry_length", classic_inquiry_length);
      read_field(s, "classic_name_timeout_ms", classic_name_timeout_ms);
    }

    if (cfg.contains("socket")) {
      const auto& s = cfg["socket"];
      read_field(s, "path", socket_path);
      if (s.contains("permissions")) {
        socket_permissions = static_cast<mode_t>(s["permissions"].get<int>());
      }
    }

    if (cfg.contains("vendor")) {
      const auto& v = cfg["vendor"];
      read_field(v, "api_url", vendor_api_url);
      read_field(v, "api_cooldown_ms", vendor_api_cooldown_ms);
      read_field(v, "api_timeout_ms", vendor_api_timeout_ms);
      read_field(v, "oui_db_url", oui_db_url);
      read_field(v, "oui_cache_path", oui_cache_path);
      read_field(v, "oui_download_timeout_ms", oui_download_timeout_ms);
    }

    if (cfg.contains("notify")) {
      const auto& n = cfg["notify"];
      read_field(n, "base_url", notify_base_url);
      read_field(n, "timeout_ms", notify_timeout_ms);
      read_field(n, "absence_check_interval_s", absence_check_interval_s);
    }

    if (cfg.contains("storage")) {
      const auto& s = cfg["storage"];
      read_field(s, "db_path", db_path);
      read_field(s, "retention_days", sighting_retention_days);
    }

    read_field(cfg, "log_level", log_level);
  } catch (const json::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path, e.what());
    return false;
  }

  config_path = path;
  spdlog::info("Configuration loaded from {}", path);
  return true;
}

bool DaemonConfig::ensureDataDir() const {
  return make_dirs(data_dir);
}

void DaemonConfig::logConfig() const {
  spdlog::info("=== Daemon Configuration ===");
  spdlog::info("Data: {} (db={})", data_dir, db_path);
  spdlog::info("Socket: {} (perms=0{:o})", socket_path, socket_permissions);
  spdlog::info("Scan: adapter={} interval={}s ble={}s inquiry={}",
               adapter.empty() ? "default" : adapter,
               scan_interval_s, ble_scan_duration_s, classic_inquiry_length);
  spdlog::info("Vendor: api={} cooldown={}ms timeout={}ms cache={}",
               vendor_api_url, vendor_api_cooldown_ms, vendor_api_timeout_ms, oui_cache_path);
  spdlog::info("Notify: base={} timeout={}ms absence_check={}s",
               notify_base_url, notify_timeout_ms, absence_check_interval_s);
  spdlog::info("============================");
}
