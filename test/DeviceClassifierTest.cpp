#include <gtest/gtest.h>

#include "DeviceClassifier.h"

static DeviceType classify(const std::string& vendor, const std::string& name = {},
                           const std::vector<std::string>& uuids = {},
                           bool has_class = false, uint32_t cls = 0) {
  return DeviceClassifier::Classify(vendor, name, uuids, has_class, cls);
}

TEST(DeviceClassifier, UuidBeatsEverythingElse) {
  const std::vector<std::string> hr{ "0000180D-0000-1000-8000-00805F9B34FB" };
  EXPECT_EQ(classify("Apple, Inc.", "iPhone", hr, true, 0x5a020c), DeviceType::Wearable);
}

TEST(DeviceClassifier, UuidMatchIgnoresDashesAndCase) {
  DeviceType t;
  ASSERT_TRUE(DeviceClassifier::ClassifyByUuids({ "0000FE9F-0000-1000-8000-00805F9B34FB" }, t));
  EXPECT_EQ(t, DeviceType::Phone);
  EXPECT_FALSE(DeviceClassifier::ClassifyByUuids({ "0000180f-0000-1000-8000-00805f9b34fb" }, t));
}

TEST(DeviceClassifier, NameBeatsDeviceClassAndVendor) {
  EXPECT_EQ(classify("Samsung Electronics", "Galaxy Tab S8"), DeviceType::Tablet);
  EXPECT_EQ(classify("Bose", "Living room TV", {}, true, 0x240404), DeviceType::Tv);
}

TEST(DeviceClassifier, NameRulesAreOrdered) {
  // "galaxy s" (phone) is checked before "watch"
  EXPECT_EQ(classify("", "Galaxy S23 watch companion"), DeviceType::Phone);
  // "tab" hits before "watch"
  EXPECT_EQ(classify("", "Stable Watch"), DeviceType::Tablet);
}

TEST(DeviceClassifier, DeviceClassBeatsVendor) {
  // major 0x04 audio/video
  EXPECT_EQ(classify("Apple, Inc.", "", {}, true, 0x240404), DeviceType::Audio);
  // major 0x1f uncategorized falls through to the vendor
  EXPECT_EQ(classify("Apple, Inc.", "", {}, true, 0x001f00), DeviceType::Phone);
}

TEST(DeviceClassifier, VendorTableIsFirstMatchWins) {
  EXPECT_EQ(classify("ASUSTek COMPUTER INC."), DeviceType::Laptop);
  // "asus router" would be Network, but the broader "asus" comes first
  EXPECT_EQ(classify("Asus Router Division"), DeviceType::Laptop);
  EXPECT_EQ(classify("Sonos, Inc."), DeviceType::Speaker);
  EXPECT_EQ(classify("Nobody Ltd"), DeviceType::Unknown);
  EXPECT_EQ(classify(""), DeviceType::Unknown);
}

TEST(DeviceClassifier, DecodesDeviceClass) {
  DeviceClassInfo phone = DeviceClassifier::DecodeDeviceClass(0x5a020c);
  EXPECT_STREQ(phone.major, "phone");
  ASSERT_NE(phone.minor, nullptr);
  EXPECT_STREQ(phone.minor, "smartphone");

  DeviceClassInfo headphones = DeviceClassifier::DecodeDeviceClass(0x240418);
  EXPECT_STREQ(headphones.major, "audio");
  ASSERT_NE(headphones.minor, nullptr);
  EXPECT_STREQ(headphones.minor, "headphones");

  DeviceClassInfo computer = DeviceClassifier::DecodeDeviceClass(0x00010c);
  EXPECT_STREQ(computer.major, "computer");
  EXPECT_EQ(computer.minor, nullptr);
}

TEST(DeviceClassifier, TypeNamesRoundTrip) {
  EXPECT_STREQ(DeviceClassifier::DeviceTypeName(DeviceType::SmartHome), "smart");
  EXPECT_STREQ(DeviceClassifier::DeviceTypeName(DeviceType::Audio), "audio");
  EXPECT_STREQ(DeviceClassifier::DeviceTypeLabel(DeviceType::Tv), "TV/Display");

  DeviceType t;
  ASSERT_TRUE(DeviceClassifier::ParseDeviceType("SMART", t));
  EXPECT_EQ(t, DeviceType::SmartHome);
  EXPECT_FALSE(DeviceClassifier::ParseDeviceType("toaster", t));
  EXPECT_EQ(t, DeviceType::Unknown);
}

TEST(DeviceClassifier, UuidNames) {
  auto names = DeviceClassifier::UuidNames({
    "0000180f-0000-1000-8000-00805f9b34fb",
    "12345678-0000-1000-8000-00805f9b34fb",
    "0000fd6f-0000-1000-8000-00805f9b34fb",
  });
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "Battery");
  EXPECT_EQ(names[1], "Apple Continuity");
}
