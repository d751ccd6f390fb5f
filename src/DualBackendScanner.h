#pragma once

#include <vector>

#include "ScanBackend.h"
#include "ScannedDevice.h"
#include "VendorResolver.h"

// Runs the BLE and classic backends concurrently and merges their results
// into one list per cycle. A failing backend contributes nothing; vendor
// resolution is applied to every surviving device.
class DualBackendScanner {
public:
  DualBackendScanner(ScanBackend& primary, ScanBackend& secondary, VendorResolver& vendors);

  std::vector<ScannedDevice> scan();

  // Deduplicate by address. The first occurrence wins, primary before secondary.
  static std::vector<ScannedDevice> Merge(std::vector<ScannedDevice> primary,
                                          std::vector<ScannedDevice> secondary);

private:
  static std::vector<ScannedDevice> RunBackend(ScanBackend& backend);

  ScanBackend& _primary;
  ScanBackend& _secondary;
  VendorResolver& _vendors;
};
