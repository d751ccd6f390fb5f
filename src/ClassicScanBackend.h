#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CommandRunner.h"
#include "ScanBackend.h"

// Classic (BR/EDR) inquiry through the `hcitool` command-line tool:
// `hcitool inq` for addresses and device classes, then `hcitool name` per
// device for its friendly name.
class ClassicScanBackend : public ScanBackend {
public:
  struct InquiryResult {
    std::string mac;
    uint32_t    device_class = 0;
  };

  ClassicScanBackend(CommandRunner& runner,
                     std::string adapter,
                     int inquiry_length,
                     long name_timeout_ms);

  ScanBackendKind kind() const override { return ScanBackendKind::Classic; }
  bool scan(std::vector<ScannedDevice>& out) override;

  // "\tAA:BB:CC:DD:EE:FF\tclock offset: 0x1234\tclass: 0x5a020c" lines.
  static std::vector<InquiryResult> ParseInquiryOutput(const std::string& text);

  // hcitool does not report signal strength for inquiry results.
  static constexpr int PLACEHOLDER_RSSI = -60;

private:
  std::vector<std::string> baseArgs() const;
  std::string readName(const std::string& mac);

  CommandRunner& _runner;
  std::string _adapter;
  int _inquiryLength;
  long _nameTimeoutMs;
};
