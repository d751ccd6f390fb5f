#include <gtest/gtest.h>

#include "AdvertisingData.h"

TEST(AdvertisingData, ExpandsShortUuids) {
  EXPECT_EQ(ExpandShortUuid(0x180D), "0000180d-0000-1000-8000-00805f9b34fb");
  EXPECT_EQ(ExpandShortUuid(0xFD6F), "0000fd6f-0000-1000-8000-00805f9b34fb");
}

TEST(AdvertisingData, ParsesNameAndServices) {
  const uint8_t adv[] = {
    0x02, 0x01, 0x06,                    // flags
    0x05, 0x03, 0x0D, 0x18, 0x0F, 0x18,  // 16-bit UUIDs 180D, 180F
    0x05, 0x08, 'B', 'a', 'n', 'd',      // shortened name
    0x07, 0x09, 'M', 'i', 'B', 'a', 'n', 'd',  // complete name
  };

  AdvertisingFields f;
  ParseAdvertisingData(adv, sizeof(adv), f);

  EXPECT_EQ(f.name, "MiBand");
  ASSERT_EQ(f.service_uuids.size(), 2u);
  EXPECT_EQ(f.service_uuids[0], "0000180d-0000-1000-8000-00805f9b34fb");
  EXPECT_EQ(f.service_uuids[1], "0000180f-0000-1000-8000-00805f9b34fb");
}

TEST(AdvertisingData, CompleteNameBeatsLaterShortName) {
  const uint8_t adv[] = {
    0x04, 0x09, 'A', 'B', 'C',
    0x02, 0x08, 'A',
  };
  AdvertisingFields f;
  ParseAdvertisingData(adv, sizeof(adv), f);
  EXPECT_EQ(f.name, "ABC");
}

TEST(AdvertisingData, Reads128BitLittleEndian) {
  // d0611e78-bbb4-4591-a5f8-487910ae4366, reversed on the wire
  const uint8_t adv[] = {
    0x11, 0x07,
    0x66, 0x43, 0xae, 0x10, 0x79, 0x48, 0xf8, 0xa5,
    0x91, 0x45, 0xb4, 0xbb, 0x78, 0x1e, 0x61, 0xd0,
  };
  AdvertisingFields f;
  ParseAdvertisingData(adv, sizeof(adv), f);
  ASSERT_EQ(f.service_uuids.size(), 1u);
  EXPECT_EQ(f.service_uuids[0], "d0611e78-bbb4-4591-a5f8-487910ae4366");
}

TEST(AdvertisingData, StopsAtTruncatedStructure) {
  const uint8_t adv[] = {
    0x03, 0x03, 0xFE, 0xFE,     // UUID FEFE
    0x09, 0x09, 'x', 'y',       // claims 8 bytes, only 2 present
  };
  AdvertisingFields f;
  ParseAdvertisingData(adv, sizeof(adv), f);
  EXPECT_EQ(f.service_uuids.size(), 1u);
  EXPECT_TRUE(f.name.empty());
}
