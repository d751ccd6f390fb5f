#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "AdapterList.h"
#include "BleScanBackend.h"
#include "ClassicScanBackend.h"
#include "CommandRunner.h"
#include "DaemonConfig.h"
#include "DaemonCore.h"
#include "DualBackendScanner.h"
#include "HttpClient.h"
#include "Log.h"
#include "NotificationGateway.h"
#include "OuiDatabase.h"
#include "SqliteDeviceStore.h"
#include "VendorResolver.h"

#define VERSION "1.0.00"

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
  g_running = false;
}

static int list_adapters() {
  PosixCommandRunner runner;
  const std::vector<BluetoothAdapter> adapters = AdapterList::List(runner);
  if (adapters.empty()) {
    std::printf("No Bluetooth adapters found\n");
    return 1;
  }
  for (const auto& a : adapters) {
    std::printf("%-6s %s  %s%s\n", a.name.c_str(), a.address.c_str(), a.alias.c_str(),
                a.is_default ? " (default)" : "");
  }
  return 0;
}

static void print_usage(const char* argv0) {
  std::printf("bluehoodd %s - Bluetooth presence daemon\n\n", VERSION);
  std::printf("Usage: %s [--config PATH] [--verbose] [--list-adapters] [--help]\n\n", argv0);
  std::printf("  --config PATH    JSON configuration file (default: <data dir>/config.json)\n");
  std::printf("  --verbose        debug logging\n");
  std::printf("  --list-adapters  print the local Bluetooth adapters and exit\n");
  std::printf("  --help           show this message\n\n");
  std::printf("Environment: BLUEHOOD_DATA_DIR, BLUEHOOD_ADAPTER\n");
}

int main(int argc, char** argv) {
  std::string config_path;
  bool verbose = false;
  bool show_adapters = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
    if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
      verbose = true;
    } else if (std::strcmp(argv[i], "--list-adapters") == 0) {
      show_adapters = true;
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      std::fprintf(stderr, "Unknown argument: %s\n\n", argv[i]);
      print_usage(argv[0]);
      return 1;
    }
  }

  SetupLogging(verbose ? spdlog::level::debug : spdlog::level::info);
  if (show_adapters) return list_adapters();

  DaemonConfig config = DaemonConfig::Defaults();
  if (config_path.empty()) config_path = config.config_path;
  if (!config.loadFromFile(config_path)) {
    // Keep going on defaults; the reason was logged.
    config = DaemonConfig::Defaults();
  }
  if (!verbose) spdlog::set_level(ParseLogLevel(config.log_level));

  if (!config.ensureDataDir()) {
    spdlog::critical("Cannot create data directory {}", config.data_dir);
    return 1;
  }
  config.logConfig();

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);

  CurlGlobal curl;
  if (!curl.ok()) {
    spdlog::critical("libcurl initialisation failed");
    return 1;
  }
  CurlHttpClient http;

  SqliteDeviceStore store(config.db_path);
  if (!store.begin()) return 1;

  OuiDatabase oui(http, config.oui_cache_path, config.oui_db_url, config.oui_download_timeout_ms);
  if (!oui.load()) {
    spdlog::info("No local vendor database yet; it will be downloaded on first lookup");
  }

  VendorResolver::Options vopts;
  vopts.api_url = config.vendor_api_url;
  vopts.cooldown_ms = config.vendor_api_cooldown_ms;
  vopts.timeout_ms = config.vendor_api_timeout_ms;
  VendorResolver vendors(http, &oui, vopts);

  PosixCommandRunner runner;
  BleScanBackend ble(config.adapter, config.ble_scan_duration_s);
  ClassicScanBackend classic(runner, config.adapter, config.classic_inquiry_length, config.classic_name_timeout_ms);
  DualBackendScanner scanner(ble, classic, vendors);

  NotificationGateway gateway(store, http, config.notify_base_url, config.notify_timeout_ms);

  DaemonCore daemon(config, scanner, store, gateway);
  if (!daemon.start()) {
    spdlog::critical("Daemon startup failed");
    return 1;
  }
  spdlog::info("bluehoodd {} ready on {}", VERSION, config.socket_path);

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  spdlog::info("Received shutdown signal");
  daemon.stop();
  oui.waitForRefresh();
  return 0;
}
