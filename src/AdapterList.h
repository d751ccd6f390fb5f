#pragma once

#include <string>
#include <vector>

#include "CommandRunner.h"

struct BluetoothAdapter {
  std::string name;      // "hci0"; assigned in listing order
  std::string address;
  std::string alias;
  bool        is_default = false;
};

// Local controllers as reported by `bluetoothctl list`.
class AdapterList {
public:
  static constexpr long LIST_TIMEOUT_MS = 5000;

  // Empty when the tool is missing or fails; the reason is logged.
  static std::vector<BluetoothAdapter> List(CommandRunner& runner);

  // "Controller 00:1A:7D:DA:71:13 myhost [default]" lines.
  static std::vector<BluetoothAdapter> ParseControllerList(const std::string& text);
};
