#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class ScanBackendKind : uint8_t { Ble = 1, Classic = 2 };

// One scan cycle's worth of data about a single device. Discarded once it has
// been merged and persisted.
struct ScannedDevice {
  std::string mac;                        // normalized (upper-case) address
  std::string name;                       // empty when the device did not advertise one
  int         rssi = -100;                // dBm
  std::string vendor;                     // empty when unresolved

  std::vector<std::string> service_uuids; // advertised services (BLE only)

  ScanBackendKind backend = ScanBackendKind::Ble;

  // Classic inquiry only
  bool        has_device_class = false;
  uint32_t    device_class = 0;
};

inline const char* ScanBackendName(ScanBackendKind k) {
  switch (k) {
    case ScanBackendKind::Ble:     return "ble";
    case ScanBackendKind::Classic: return "classic";
    default:                       return "unknown";
  }
}
