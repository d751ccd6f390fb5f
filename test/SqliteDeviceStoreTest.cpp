#include <gtest/gtest.h>

#include <ctime>
#include <numeric>

#include "SqliteDeviceStore.h"

class SqliteDeviceStoreTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(store.begin()); }

  SqliteDeviceStore store{ ":memory:" };
};

TEST_F(SqliteDeviceStoreTest, UpsertCreatesThenUpdates) {
  const int64_t before = (int64_t)std::time(nullptr);

  Device d = store.upsert("AA:BB:CC:DD:EE:FF", "Acme", -50, "phone");
  EXPECT_EQ(d.mac, "AA:BB:CC:DD:EE:FF");
  EXPECT_EQ(d.vendor, "Acme");
  EXPECT_EQ(d.device_type, "phone");
  EXPECT_EQ(d.total_sightings, 1);
  EXPECT_GE(d.first_seen_s, before - 1);
  EXPECT_EQ(d.first_seen_s, d.last_seen_s);

  d = store.upsert("AA:BB:CC:DD:EE:FF", "", -60, "unknown");
  EXPECT_EQ(d.total_sightings, 2);
  EXPECT_EQ(d.vendor, "Acme");
  EXPECT_EQ(d.device_type, "phone");

  EXPECT_EQ(store.getSightings("AA:BB:CC:DD:EE:FF", 30).size(), 2u);
}

TEST_F(SqliteDeviceStoreTest, KnownTypeReplacesUnknown) {
  store.upsert("11:22:33:44:55:66", "", -70, "unknown");
  Device d = store.upsert("11:22:33:44:55:66", "Bose", -70, "audio");
  EXPECT_EQ(d.device_type, "audio");
  EXPECT_EQ(d.vendor, "Bose");

  d = store.upsert("11:22:33:44:55:66", "Other", -70, "speaker");
  EXPECT_EQ(d.device_type, "audio");
  EXPECT_EQ(d.vendor, "Bose");
}

TEST_F(SqliteDeviceStoreTest, FlagsAndFilters) {
  store.upsert("AA:AA:AA:AA:AA:AA", "", -50, "unknown");
  store.upsert("BB:BB:BB:BB:BB:BB", "", -50, "unknown");

  EXPECT_TRUE(store.setIgnored("AA:AA:AA:AA:AA:AA", true));
  EXPECT_TRUE(store.setWatched("BB:BB:BB:BB:BB:BB", true));
  EXPECT_TRUE(store.setFriendlyName("BB:BB:BB:BB:BB:BB", "Car keys"));
  EXPECT_FALSE(store.setWatched("CC:CC:CC:CC:CC:CC", true));

  EXPECT_EQ(store.getAllDevices(true).size(), 2u);
  auto visible = store.getAllDevices(false);
  ASSERT_EQ(visible.size(), 1u);
  EXPECT_EQ(visible[0].mac, "BB:BB:BB:BB:BB:BB");

  auto watched = store.getWatchedDevices();
  ASSERT_EQ(watched.size(), 1u);
  EXPECT_EQ(watched[0].friendly_name, "Car keys");
  EXPECT_EQ(watched[0].displayName(), "Car keys");

  Device d;
  ASSERT_TRUE(store.getDevice("AA:AA:AA:AA:AA:AA", d));
  EXPECT_TRUE(d.ignored);
  EXPECT_FALSE(store.getDevice("CC:CC:CC:CC:CC:CC", d));
}

TEST_F(SqliteDeviceStoreTest, DistributionsCountEverySighting) {
  for (int i = 0; i < 3; ++i) store.upsert("AA:BB:CC:DD:EE:FF", "", -50, "unknown");

  auto hourly = store.getHourlyDistribution("AA:BB:CC:DD:EE:FF", 30);
  auto daily = store.getDailyDistribution("AA:BB:CC:DD:EE:FF", 30);

  auto sum = [](const std::map<int, int>& m) {
    return std::accumulate(m.begin(), m.end(), 0, [](int a, const std::pair<const int, int>& kv) { return a + kv.second; });
  };
  EXPECT_EQ(sum(hourly), 3);
  EXPECT_EQ(sum(daily), 3);
  for (const auto& kv : hourly) {
    EXPECT_GE(kv.first, 0);
    EXPECT_LE(kv.first, 23);
  }
  for (const auto& kv : daily) {
    EXPECT_GE(kv.first, 0);
    EXPECT_LE(kv.first, 6);
  }
  EXPECT_TRUE(store.getHourlyDistribution("00:00:00:00:00:00", 30).empty());
}

TEST_F(SqliteDeviceStoreTest, CleanupKeepsRecentSightings) {
  store.upsert("AA:BB:CC:DD:EE:FF", "", -50, "unknown");
  EXPECT_EQ(store.cleanupOldSightings(90), 0);
  EXPECT_EQ(store.getSightings("AA:BB:CC:DD:EE:FF", 30).size(), 1u);
}

TEST_F(SqliteDeviceStoreTest, SettingsDefaultsAndPersistence) {
  NotificationSettings s = store.getSettings();
  EXPECT_FALSE(s.ntfy_enabled);
  EXPECT_TRUE(s.ntfy_topic.empty());
  EXPECT_TRUE(s.notify_watched_return);
  EXPECT_EQ(s.watched_return_minutes, 5);
  EXPECT_EQ(s.watched_absence_minutes, 30);

  s.ntfy_enabled = true;
  s.ntfy_topic = "my-topic";
  s.notify_new_device = true;
  s.watched_absence_minutes = 45;
  store.saveSettings(s);

  NotificationSettings r = store.getSettings();
  EXPECT_TRUE(r.ntfy_enabled);
  EXPECT_EQ(r.ntfy_topic, "my-topic");
  EXPECT_TRUE(r.notify_new_device);
  EXPECT_EQ(r.watched_absence_minutes, 45);
}

TEST(SqliteTimestamps, FormatAndParse) {
  EXPECT_EQ(SqliteDeviceStore::FormatTimestamp(0), "");
  EXPECT_EQ(SqliteDeviceStore::FormatTimestamp(1700000000), "2023-11-14 22:13:20");
  EXPECT_EQ(SqliteDeviceStore::ParseTimestamp("2023-11-14 22:13:20"), 1700000000);
  EXPECT_EQ(SqliteDeviceStore::ParseTimestamp("2023-11-14T22:13:20"), 1700000000);
  EXPECT_EQ(SqliteDeviceStore::ParseTimestamp(""), 0);
}

TEST(SqliteDeviceStore, OperationsBeforeBeginThrow) {
  SqliteDeviceStore store(":memory:");
  EXPECT_THROW(store.getAllDevices(true), std::runtime_error);
}
