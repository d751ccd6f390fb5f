#pragma once

#include <string>
#include <vector>

#include "ScanBackend.h"

// BLE advertisement scan through a raw BlueZ HCI socket. Each pass enables
// active LE scanning for a fixed duration and collects address, name, RSSI
// and advertised service UUIDs per device.
class BleScanBackend : public ScanBackend {
public:
  // `adapter` is an HCI name ("hci0"); empty picks the first available one.
  BleScanBackend(std::string adapter, int duration_s);

  ScanBackendKind kind() const override { return ScanBackendKind::Ble; }
  bool scan(std::vector<ScannedDevice>& out) override;

private:
  std::string _adapter;
  int _durationS;
};
