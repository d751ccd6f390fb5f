#include "DeviceClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {

struct Pattern {
  const char* needle;
  DeviceType  type;
};

// Matched against the vendor name, case-insensitively.
const Pattern VENDOR_PATTERNS[] = {
  // Phones / mobile
  { "apple",               DeviceType::Phone },  // could be anything Apple makes
  { "samsung electronics", DeviceType::Phone },
  { "xiaomi",              DeviceType::Phone },
  { "huawei",              DeviceType::Phone },
  { "oneplus",             DeviceType::Phone },
  { "oppo",                DeviceType::Phone },
  { "vivo",                DeviceType::Phone },
  { "realme",              DeviceType::Phone },
  { "motorola",            DeviceType::Phone },
  { "nokia",               DeviceType::Phone },
  { "lg electronics",      DeviceType::Phone },
  { "zte",                 DeviceType::Phone },
  { "google",              DeviceType::Phone },
  { "fairphone",           DeviceType::Phone },
  { "nothing",             DeviceType::Phone },

  // Computers
  { "dell",                DeviceType::Laptop },
  { "lenovo",              DeviceType::Laptop },
  { "hewlett packard",     DeviceType::Laptop },
  { "hp inc",              DeviceType::Laptop },
  { "asus",                DeviceType::Laptop },
  { "acer",                DeviceType::Laptop },
  { "microsoft",           DeviceType::Computer },
  { "intel corporate",     DeviceType::Computer },
  { "gigabyte",            DeviceType::Computer },
  { "msi",                 DeviceType::Computer },

  // Audio
  { "bose",                DeviceType::Audio },
  { "sony",                DeviceType::Audio },
  { "sennheiser",          DeviceType::Audio },
  { "jabra",               DeviceType::Audio },
  { "beats",               DeviceType::Audio },
  { "jbl",                 DeviceType::Speaker },
  { "harman",              DeviceType::Speaker },
  { "bang & olufsen",      DeviceType::Speaker },
  { "sonos",               DeviceType::Speaker },
  { "skullcandy",          DeviceType::Audio },
  { "audio-technica",      DeviceType::Audio },
  { "plantronics",         DeviceType::Audio },
  { "anker",               DeviceType::Audio },

  // Watches / wearables
  { "fitbit",              DeviceType::Watch },
  { "garmin",              DeviceType::Watch },
  { "polar",               DeviceType::Watch },
  { "suunto",              DeviceType::Watch },
  { "whoop",               DeviceType::Wearable },
  { "oura",                DeviceType::Wearable },

  // Smart home
  { "amazon",              DeviceType::SmartHome },
  { "ring",                DeviceType::SmartHome },
  { "nest",                DeviceType::SmartHome },
  { "philips",             DeviceType::SmartHome },
  { "ikea",                DeviceType::SmartHome },
  { "tuya",                DeviceType::SmartHome },
  { "shelly",              DeviceType::SmartHome },
  { "switchbot",           DeviceType::SmartHome },
  { "aqara",               DeviceType::SmartHome },
  { "wyze",                DeviceType::SmartHome },
  { "eufy",                DeviceType::SmartHome },
  { "ecobee",              DeviceType::SmartHome },
  { "hue",                 DeviceType::SmartHome },
  { "smartthings",         DeviceType::SmartHome },
  { "tp-link",             DeviceType::SmartHome },
  { "meross",              DeviceType::SmartHome },
  { "govee",               DeviceType::SmartHome },
  { "lifx",                DeviceType::SmartHome },
  { "nanoleaf",            DeviceType::SmartHome },
  { "yale",                DeviceType::SmartHome },
  { "august",              DeviceType::SmartHome },
  { "schlage",             DeviceType::SmartHome },

  // TVs / displays
  { "roku",                DeviceType::Tv },
  { "vizio",               DeviceType::Tv },
  { "tcl",                 DeviceType::Tv },
  { "hisense",             DeviceType::Tv },
  { "chromecast",          DeviceType::Tv },
  { "fire tv",             DeviceType::Tv },

  // Vehicles
  { "tesla",               DeviceType::Vehicle },
  { "ford",                DeviceType::Vehicle },
  { "gm",                  DeviceType::Vehicle },
  { "volkswagen",          DeviceType::Vehicle },
  { "bmw",                 DeviceType::Vehicle },
  { "mercedes",            DeviceType::Vehicle },
  { "audi",                DeviceType::Vehicle },
  { "toyota",              DeviceType::Vehicle },
  { "honda",               DeviceType::Vehicle },
  { "nissan",              DeviceType::Vehicle },
  { "hyundai",             DeviceType::Vehicle },
  { "kia",                 DeviceType::Vehicle },
  { "volvo",               DeviceType::Vehicle },
  { "rivian",              DeviceType::Vehicle },
  { "lucid",               DeviceType::Vehicle },
  { "harley",              DeviceType::Vehicle },
  { "continental auto",    DeviceType::Vehicle },
  { "bosch",               DeviceType::Vehicle },
  { "denso",               DeviceType::Vehicle },

  // Gaming
  { "nintendo",            DeviceType::Gaming },
  { "playstation",         DeviceType::Gaming },
  { "xbox",                DeviceType::Gaming },
  { "valve",               DeviceType::Gaming },
  { "razer",               DeviceType::Gaming },
  { "steelseries",         DeviceType::Gaming },
  { "logitech",            DeviceType::Gaming },

  // Cameras
  { "gopro",               DeviceType::Camera },
  { "canon",               DeviceType::Camera },
  { "nikon",               DeviceType::Camera },
  { "dji",                 DeviceType::Camera },
  { "insta360",            DeviceType::Camera },

  // Printers
  { "epson",               DeviceType::Printer },
  { "brother",             DeviceType::Printer },
  { "xerox",               DeviceType::Printer },

  // Network equipment
  { "cisco",               DeviceType::Network },
  { "netgear",             DeviceType::Network },
  { "ubiquiti",            DeviceType::Network },
  { "aruba",               DeviceType::Network },
  { "linksys",             DeviceType::Network },
  { "asus router",         DeviceType::Network },
  { "eero",                DeviceType::Network },
  { "orbi",                DeviceType::Network },
};

// Matched as substrings of the lower-case, dash-free UUID.
const Pattern UUID_PATTERNS[] = {
  // Fitness
  { "0000180d", DeviceType::Wearable },  // Heart Rate
  { "0000181c", DeviceType::Wearable },  // User Data
  { "00001814", DeviceType::Wearable },  // Running Speed and Cadence
  { "00001816", DeviceType::Wearable },  // Cycling Speed and Cadence
  { "00001818", DeviceType::Wearable },  // Cycling Power
  { "0000181b", DeviceType::Wearable },  // Body Composition
  { "0000181d", DeviceType::Wearable },  // Weight Scale

  // Health
  { "00001810", DeviceType::Wearable },  // Blood Pressure
  { "00001808", DeviceType::Wearable },  // Glucose
  { "00001809", DeviceType::Wearable },  // Health Thermometer

  // Audio
  { "0000110b", DeviceType::Audio },     // A2DP Sink
  { "0000110a", DeviceType::Audio },     // A2DP Source
  { "0000111e", DeviceType::Audio },     // Handsfree
  { "0000111f", DeviceType::Audio },     // Handsfree Audio Gateway
  { "00001108", DeviceType::Audio },     // Headset
  { "0000110d", DeviceType::Audio },     // Advanced Audio
  { "00001203", DeviceType::Audio },     // Generic Audio
  { "0000184e", DeviceType::Audio },     // Audio Stream Control
  { "0000184f", DeviceType::Audio },     // Broadcast Audio Scan
  { "00001850", DeviceType::Audio },     // Published Audio Capabilities
  { "00001853", DeviceType::Audio },     // Common Audio

  // HID
  { "00001812", DeviceType::Gaming },
  { "00001124", DeviceType::Gaming },

  // Apple
  { "d0611e78", DeviceType::Phone },     // Continuity
  { "7905f431", DeviceType::Phone },     // Notification Center
  { "89d3502b", DeviceType::Phone },     // Media Service
  { "0000fd6f", DeviceType::Phone },

  // Google
  { "0000fe9f", DeviceType::Phone },     // Fast Pair
  { "0000fe2c", DeviceType::Phone },     // Nearby

  // IoT
  { "0000181a", DeviceType::SmartHome }, // Environmental Sensing
  { "0000fef5", DeviceType::SmartHome },
  { "0000fee7", DeviceType::SmartHome },
  { "0000feaa", DeviceType::SmartHome }, // Eddystone
  { "0000feab", DeviceType::SmartHome },

  // Finders
  { "0000feed", DeviceType::SmartHome }, // Tile
  { "0000febe", DeviceType::SmartHome },
  { "0000feec", DeviceType::SmartHome }, // Tile

  { "00001819", DeviceType::Wearable },  // Location and Navigation

  // Watches
  { "cba20d00", DeviceType::Watch },
  { "0000fee0", DeviceType::Watch },     // Mi Band / Amazfit
  { "0000feea", DeviceType::Watch },

  // Printers
  { "00001118", DeviceType::Printer },
  { "00001119", DeviceType::Printer },

  { "00001822", DeviceType::Camera },
};

struct UuidName {
  const char* needle;
  const char* name;
};

const UuidName UUID_NAMES[] = {
  { "0000180d", "Heart Rate" },
  { "0000180f", "Battery" },
  { "00001800", "Generic Access" },
  { "00001801", "Generic Attribute" },
  { "0000180a", "Device Info" },
  { "00001812", "HID" },
  { "0000181a", "Environmental" },
  { "0000110b", "A2DP Sink" },
  { "0000110a", "A2DP Source" },
  { "0000fd6f", "Apple Continuity" },
  { "0000fe9f", "Google Fast Pair" },
  { "0000fee0", "Mi Band" },
};

struct NameRule {
  DeviceType  type;
  const char* needles[6];   // nullptr-terminated
};

const NameRule NAME_RULES[] = {
  { DeviceType::Phone,    { "iphone", "android", "pixel", "galaxy s", "galaxy z", nullptr } },
  { DeviceType::Tablet,   { "ipad", "tab", "tablet", nullptr } },
  { DeviceType::Laptop,   { "macbook", "thinkpad", "xps", "laptop", nullptr } },
  { DeviceType::Computer, { "imac", "mac mini", "mac pro", "desktop", nullptr } },
  { DeviceType::Watch,    { "watch", "band", "mi band", nullptr } },
  { DeviceType::Audio,    { "airpod", "buds", "earbuds", "headphone", nullptr } },
  { DeviceType::Speaker,  { "homepod", "echo", "speaker", nullptr } },
  { DeviceType::Tv,       { "tv", "roku", "firestick", "chromecast", nullptr } },
  { DeviceType::Vehicle,  { "car", "vehicle", "model 3", "model y", "model s", nullptr } },
};

// Class of Device major numbers (bits 8-12).
DeviceType major_to_type(uint32_t major, bool& ok) {
  ok = true;
  switch (major) {
    case 0x01: return DeviceType::Computer;
    case 0x02: return DeviceType::Phone;
    case 0x03: return DeviceType::Network;
    case 0x04: return DeviceType::Audio;
    case 0x05: return DeviceType::Gaming;    // peripheral
    case 0x06: return DeviceType::Printer;   // imaging
    case 0x07: return DeviceType::Wearable;
    case 0x08: return DeviceType::Gaming;    // toy
    case 0x09: return DeviceType::Wearable;  // health
    default:   ok = false; return DeviceType::Unknown;
  }
}

bool ieq(const char* a, const char* b) {
  if (!a || !b) return false;
  while (*a && *b) {
    char ca = *a++, cb = *b++;
    if (ca >= 'A' && ca <= 'Z') ca = (char)(ca - 'A' + 'a');
    if (cb >= 'A' && cb <= 'Z') cb = (char)(cb - 'A' + 'a');
    if (ca != cb) return false;
  }
  return *a == 0 && *b == 0;
}

} // namespace

bool DeviceClassifier::IContains(const std::string& haystack, const char* needle) {
  if (!needle || !*needle) return true;
  auto it = std::search(
    haystack.begin(), haystack.end(),
    needle, needle + std::strlen(needle),
    [](char a, char b) { return std::tolower((unsigned char)a) == std::tolower((unsigned char)b); }
  );
  return it != haystack.end();
}

std::string DeviceClassifier::CompactUuid(const std::string& uuid) {
  std::string out;
  out.reserve(uuid.size());
  for (char c : uuid) {
    if (c == '-') continue;
    out.push_back((char)std::tolower((unsigned char)c));
  }
  return out;
}

bool DeviceClassifier::ClassifyByUuids(const std::vector<std::string>& service_uuids, DeviceType& out) {
  for (const auto& raw : service_uuids) {
    const std::string uuid = CompactUuid(raw);
    for (const auto& p : UUID_PATTERNS) {
      if (uuid.find(p.needle) != std::string::npos) {
        out = p.type;
        return true;
      }
    }
  }
  return false;
}

bool DeviceClassifier::ClassifyByName(const std::string& name, DeviceType& out) {
  if (name.empty()) return false;
  for (const auto& rule : NAME_RULES) {
    for (const char* const* n = rule.needles; *n; ++n) {
      if (IContains(name, *n)) {
        out = rule.type;
        return true;
      }
    }
  }
  return false;
}

bool DeviceClassifier::ClassifyByDeviceClass(uint32_t device_class, DeviceType& out) {
  bool ok = false;
  const DeviceType t = major_to_type((device_class >> 8) & 0x1F, ok);
  if (ok) out = t;
  return ok;
}

bool DeviceClassifier::ClassifyByVendor(const std::string& vendor, DeviceType& out) {
  if (vendor.empty()) return false;
  for (const auto& p : VENDOR_PATTERNS) {
    if (IContains(vendor, p.needle)) {
      out = p.type;
      return true;
    }
  }
  return false;
}

DeviceType DeviceClassifier::Classify(const std::string& vendor,
                                      const std::string& name,
                                      const std::vector<std::string>& service_uuids,
                                      bool has_device_class,
                                      uint32_t device_class) {
  DeviceType t = DeviceType::Unknown;
  if (ClassifyByUuids(service_uuids, t)) return t;
  if (ClassifyByName(name, t)) return t;
  if (has_device_class && ClassifyByDeviceClass(device_class, t)) return t;
  if (ClassifyByVendor(vendor, t)) return t;
  return DeviceType::Unknown;
}

DeviceClassInfo DeviceClassifier::DecodeDeviceClass(uint32_t device_class) {
  DeviceClassInfo info;
  const uint32_t major = (device_class >> 8) & 0x1F;
  const uint32_t minor = (device_class >> 2) & 0x3F;

  switch (major) {
    case 0x01: info.major = "computer"; break;
    case 0x02: info.major = "phone"; break;
    case 0x03: info.major = "network"; break;
    case 0x04: info.major = "audio"; break;
    case 0x05: info.major = "peripheral"; break;
    case 0x06: info.major = "imaging"; break;
    case 0x07: info.major = "wearable"; break;
    case 0x08: info.major = "toy"; break;
    case 0x09: info.major = "health"; break;
    default:   info.major = "unknown"; break;
  }

  if (major == 0x04) {
    switch (minor) {
      case 0x01: info.minor = "headset"; break;
      case 0x02: info.minor = "handsfree"; break;
      case 0x04: info.minor = "microphone"; break;
      case 0x05: info.minor = "speaker"; break;
      case 0x06: info.minor = "headphones"; break;
      case 0x07: info.minor = "portable_audio"; break;
      case 0x08: info.minor = "car_audio"; break;
      default: break;
    }
  } else if (major == 0x02) {
    switch (minor) {
      case 0x01: info.minor = "cellular"; break;
      case 0x02: info.minor = "cordless"; break;
      case 0x03: info.minor = "smartphone"; break;
      default: break;
    }
  }
  return info;
}

std::vector<std::string> DeviceClassifier::UuidNames(const std::vector<std::string>& service_uuids) {
  std::vector<std::string> names;
  for (const auto& raw : service_uuids) {
    const std::string uuid = CompactUuid(raw);
    for (const auto& n : UUID_NAMES) {
      if (uuid.find(n.needle) != std::string::npos) {
        names.emplace_back(n.name);
        break;
      }
    }
  }
  return names;
}

const char* DeviceClassifier::DeviceTypeName(DeviceType t) {
  switch (t) {
    case DeviceType::Phone:     return "phone";
    case DeviceType::Tablet:    return "tablet";
    case DeviceType::Laptop:    return "laptop";
    case DeviceType::Computer:  return "computer";
    case DeviceType::Watch:     return "watch";
    case DeviceType::Audio:     return "audio";
    case DeviceType::Speaker:   return "speaker";
    case DeviceType::Tv:        return "tv";
    case DeviceType::Vehicle:   return "vehicle";
    case DeviceType::SmartHome: return "smart";
    case DeviceType::Wearable:  return "wearable";
    case DeviceType::Gaming:    return "gaming";
    case DeviceType::Camera:    return "camera";
    case DeviceType::Printer:   return "printer";
    case DeviceType::Network:   return "network";
    case DeviceType::Unknown:
    default:                    return "unknown";
  }
}

const char* DeviceClassifier::DeviceTypeLabel(DeviceType t) {
  switch (t) {
    case DeviceType::Phone:     return "Phone";
    case DeviceType::Tablet:    return "Tablet";
    case DeviceType::Laptop:    return "Laptop";
    case DeviceType::Computer:  return "Computer";
    case DeviceType::Watch:     return "Watch";
    case DeviceType::Audio:     return "Audio";
    case DeviceType::Speaker:   return "Speaker";
    case DeviceType::Tv:        return "TV/Display";
    case DeviceType::Vehicle:   return "Vehicle";
    case DeviceType::SmartHome: return "Smart Home";
    case DeviceType::Wearable:  return "Wearable";
    case DeviceType::Gaming:    return "Gaming";
    case DeviceType::Camera:    return "Camera";
    case DeviceType::Printer:   return "Printer";
    case DeviceType::Network:   return "Network";
    case DeviceType::Unknown:
    default:                    return "Unknown";
  }
}

bool DeviceClassifier::ParseDeviceType(const char* s, DeviceType& out) {
  out = DeviceType::Unknown;
  if (!s || !*s) return false;

  for (uint8_t i = 0; i <= (uint8_t)DeviceType::Network; ++i) {
    const DeviceType t = (DeviceType)i;
    if (ieq(s, DeviceTypeName(t))) { out = t; return true; }
  }
  return false;
}
