#pragma once

#include <cstdint>
#include <string>

#include <sys/types.h>

// Daemon tunables. Defaults are usable as-is; a JSON file may override any of
// them (see loadFromFile()).
struct DaemonConfig {
  // Paths
  std::string data_dir;
  std::string db_path;
  std::string config_path;
  std::string socket_path = "/tmp/bluehood.sock";
  mode_t      socket_permissions = 0666;

  // Scanning
  std::string adapter;                     // "hci0"...; empty = first adapter
  int         scan_interval_s = 10;
  int         ble_scan_duration_s = 5;
  int         classic_inquiry_length = 8;  // units of 1.28 s
  int         classic_name_timeout_ms = 5000;

  // Vendor resolution
  std::string vendor_api_url = "https://api.macvendors.com/";
  int         vendor_api_cooldown_ms = 1000;
  int         vendor_api_timeout_ms = 5000;
  std::string oui_db_url = "https://standards-oui.ieee.org/oui/oui.txt";
  std::string oui_cache_path;
  int         oui_download_timeout_ms = 60000;

  // Notifications
  std::string notify_base_url = "https://ntfy.sh";
  int         notify_timeout_ms = 10000;
  int         absence_check_interval_s = 60;

  // Storage
  int         sighting_retention_days = 90;

  std::string log_level = "info";

  // Fills path defaults from $BLUEHOOD_DATA_DIR / $HOME and $BLUEHOOD_ADAPTER.
  static DaemonConfig Defaults();

  // Applies overrides from a JSON file. A missing file keeps the defaults and
  // returns true; a malformed one is logged and returns false.
  bool loadFromFile(const std::string& path);

  // Creates data_dir if needed.
  bool ensureDataDir() const;

  void logConfig() const;
};
