#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "ControlServer.h"
#include "DaemonConfig.h"
#include "DeviceStore.h"
#include "DualBackendScanner.h"
#include "NotificationGateway.h"

// Owns the scan loop, the maintenance loop and the control socket.
//
// Stopped --start()--> Running --stop()--> Stopped. A cycle already in
// progress when stop() is called runs to completion.
class DaemonCore {
public:
  DaemonCore(const DaemonConfig& config,
             DualBackendScanner& scanner,
             DeviceStore& store,
             NotificationGateway& gateway);
  ~DaemonCore();

  DaemonCore(const DaemonCore&) = delete;
  DaemonCore& operator=(const DaemonCore&) = delete;

  bool start();
  void stop();
  bool isRunning() const { return _running; }

  // One scan cycle: scan, classify, persist, notify, fan out. Never throws.
  // Returns the number of devices seen.
  size_t runCycle();

  // Dispatches one control-plane request.
  nlohmann::json handleRequest(const nlohmann::json& request);

  size_t clientCount() const { return _server.clientCount(); }

  // "2026-01-02T03:04:05Z"; null for 0.
  static nlohmann::json IsoTimestamp(int64_t epoch_s);
  static nlohmann::json DeviceToJson(const Device& d);

private:
  void scanLoop();
  void monitorLoop();
  bool waitFor(int seconds);

  nlohmann::json dispatch(const std::string& cmd, const nlohmann::json& request);

  const DaemonConfig& _config;
  DualBackendScanner& _scanner;
  DeviceStore& _store;
  NotificationGateway& _gateway;
  ControlServer _server;

  std::atomic<bool> _running{false};
  std::mutex _waitMutex;
  std::condition_variable _wake;

  std::thread _scanThread;
  std::thread _monitorThread;
};
