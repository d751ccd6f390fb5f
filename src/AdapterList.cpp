#include "AdapterList.h"

#include <array>
#include <cstdint>
#include <sstream>

#include <spdlog/spdlog.h>

#include "MacAddress.h"

static constexpr const char* DEFAULT_TAG = "[default]";

std::vector<BluetoothAdapter> AdapterList::ParseControllerList(const std::string& text) {
  std::vector<BluetoothAdapter> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream words(line);
    std::string keyword, address;
    if (!(words >> keyword >> address) || keyword != "Controller") continue;

    std::array<uint8_t, 6> bytes{};
    if (!MacAddress::TryParse(address, bytes)) continue;

    BluetoothAdapter a;
    a.name = "hci" + std::to_string(out.size());
    a.address = MacAddress::Normalize(address);

    std::string word;
    while (words >> word) {
      if (word == DEFAULT_TAG) {
        a.is_default = true;
        continue;
      }
      if (!a.alias.empty()) a.alias += ' ';
      a.alias += word;
    }
    if (a.alias.empty()) continue;
    out.push_back(a);
  }
  return out;
}

std::vector<BluetoothAdapter> AdapterList::List(CommandRunner& runner) {
  CommandResult res;
  if (!runner.run({ "bluetoothctl", "list" }, LIST_TIMEOUT_MS, res) || res.exit_code != 0) {
    if (res.not_found) {
      spdlog::warn("bluetoothctl not found - install bluez-utils");
    } else {
      spdlog::warn("Could not list adapters (exit {}{})", res.exit_code, res.timed_out ? ", timed out" : "");
    }
    return {};
  }
  return ParseControllerList(res.out);
}
