#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class DeviceType : uint8_t {
  Unknown = 0,
  Phone,
  Tablet,
  Laptop,
  Computer,
  Watch,
  Audio,
  Speaker,
  Tv,
  Vehicle,
  SmartHome,
  Wearable,
  Gaming,
  Camera,
  Printer,
  Network,
};

// Major/minor categories decoded from a classic Class of Device code.
struct DeviceClassInfo {
  const char* major = "unknown";
  const char* minor = nullptr;   // only for audio and phone majors
};

class DeviceClassifier {
public:
  // Priority: service UUIDs > name patterns > classic device class > vendor patterns.
  // Every table is first-match-wins; the table order matters.
  static DeviceType Classify(const std::string& vendor,
                             const std::string& name,
                             const std::vector<std::string>& service_uuids,
                             bool has_device_class,
                             uint32_t device_class);

  static bool ClassifyByUuids(const std::vector<std::string>& service_uuids, DeviceType& out);
  static bool ClassifyByName(const std::string& name, DeviceType& out);
  static bool ClassifyByDeviceClass(uint32_t device_class, DeviceType& out);
  static bool ClassifyByVendor(const std::string& vendor, DeviceType& out);

  static DeviceClassInfo DecodeDeviceClass(uint32_t device_class);

  // Human-readable names of the well-known services in `service_uuids`.
  static std::vector<std::string> UuidNames(const std::vector<std::string>& service_uuids);

  // Stable lower-case key ("phone", "audio", "smart", ...) as persisted.
  static const char* DeviceTypeName(DeviceType t);
  static const char* DeviceTypeLabel(DeviceType t);
  static bool ParseDeviceType(const char* s, DeviceType& out);

private:
  static bool IContains(const std::string& haystack, const char* needle);
  static std::string CompactUuid(const std::string& uuid);
};
