#include "AdvertisingData.h"

#include <algorithm>
#include <cstdio>

// AD types (Bluetooth Core Supplement, part A)
static constexpr uint8_t AD_UUID16_INCOMPLETE  = 0x02;
static constexpr uint8_t AD_UUID16_COMPLETE    = 0x03;
static constexpr uint8_t AD_UUID32_INCOMPLETE  = 0x04;
static constexpr uint8_t AD_UUID32_COMPLETE    = 0x05;
static constexpr uint8_t AD_UUID128_INCOMPLETE = 0x06;
static constexpr uint8_t AD_UUID128_COMPLETE   = 0x07;
static constexpr uint8_t AD_NAME_SHORT         = 0x08;
static constexpr uint8_t AD_NAME_COMPLETE      = 0x09;

static void add_uuid(std::vector<std::string>& uuids, const std::string& u) {
  if (std::find(uuids.begin(), uuids.end(), u) == uuids.end()) uuids.push_back(u);
}

std::string ExpandShortUuid(uint32_t short_uuid) {
  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-0000-1000-8000-00805f9b34fb", short_uuid);
  return buf;
}

// 128-bit UUIDs are carried little-endian.
static std::string uuid128_to_string(const uint8_t* p) {
  char buf[37];
  std::snprintf(buf, sizeof(buf),
    "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
    p[15], p[14], p[13], p[12], p[11], p[10], p[9], p[8],
    p[7], p[6], p[5], p[4], p[3], p[2], p[1], p[0]);
  return buf;
}

void ParseAdvertisingData(const uint8_t* data, size_t len, AdvertisingFields& out) {
  if (!data) return;

  bool have_complete_name = false;
  size_t i = 0;
  while (i + 2 <= len) {
    const uint8_t field_len = data[i];
    if (field_len == 0) break;
    if (i + 1 + field_len > len) break; // malformed AD list

    const uint8_t type = data[i + 1];
    const uint8_t* val = &data[i + 2];
    const size_t vlen = field_len - 1;

    switch (type) {
      case AD_UUID16_INCOMPLETE:
      case AD_UUID16_COMPLETE:
        for (size_t k = 0; k + 2 <= vlen; k += 2) {
          add_uuid(out.service_uuids, ExpandShortUuid((uint32_t)val[k] | ((uint32_t)val[k + 1] << 8)));
        }
        break;

      case AD_UUID32_INCOMPLETE:
      case AD_UUID32_COMPLETE:
        for (size_t k = 0; k + 4 <= vlen; k += 4) {
          const uint32_t u = (uint32_t)val[k] | ((uint32_t)val[k + 1] << 8) |
                             ((uint32_t)val[k + 2] << 16) | ((uint32_t)val[k + 3] << 24);
          add_uuid(out.service_uuids, ExpandShortUuid(u));
        }
        break;

      case AD_UUID128_INCOMPLETE:
      case AD_UUID128_COMPLETE:
        for (size_t k = 0; k + 16 <= vlen; k += 16) {
          add_uuid(out.service_uuids, uuid128_to_string(val + k));
        }
        break;

      case AD_NAME_COMPLETE:
        out.name.assign(reinterpret_cast<const char*>(val), vlen);
        have_complete_name = true;
        break;

      case AD_NAME_SHORT:
        if (!have_complete_name) out.name.assign(reinterpret_cast<const char*>(val), vlen);
        break;

      default:
        break;
    }

    i += 1 + field_len;
  }
}
