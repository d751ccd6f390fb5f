#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Fields pulled out of a BLE advertising / scan-response payload (AD structures).
struct AdvertisingFields {
  std::string name;                        // complete name preferred over shortened
  std::vector<std::string> service_uuids;  // 128-bit lower-case textual form
};

// Appends to `out`; a malformed AD structure stops parsing at that point.
void ParseAdvertisingData(const uint8_t* data, size_t len, AdvertisingFields& out);

// 16/32-bit short UUID expanded onto the Bluetooth base UUID.
std::string ExpandShortUuid(uint32_t short_uuid);
