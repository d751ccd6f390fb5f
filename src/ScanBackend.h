#pragma once

#include <vector>

#include "ScannedDevice.h"

// One discovery source. scan() runs a single bounded pass and reports whether
// the backend worked at all; on false the caller discards `out`.
class ScanBackend {
public:
  virtual ~ScanBackend() = default;

  virtual ScanBackendKind kind() const = 0;
  virtual bool scan(std::vector<ScannedDevice>& out) = 0;
};
