#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "DaemonConfig.h"

static std::string temp_path(const std::string& name) {
  return "/tmp/bluehood-config-" + std::to_string(getpid()) + "-" + name;
}

static std::string write_file(const std::string& name, const std::string& text) {
  const std::string path = temp_path(name);
  std::ofstream(path) << text;
  return path;
}

class DaemonConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("BLUEHOOD_DATA_DIR");
    unsetenv("BLUEHOOD_ADAPTER");
  }

  void TearDown() override {
    unsetenv("BLUEHOOD_DATA_DIR");
    unsetenv("BLUEHOOD_ADAPTER");
  }
};

TEST_F(DaemonConfigTest, DefaultsFollowEnvironment) {
  setenv("BLUEHOOD_DATA_DIR", "/var/lib/bluehood", 1);
  setenv("BLUEHOOD_ADAPTER", "hci1", 1);

  DaemonConfig c = DaemonConfig::Defaults();
  EXPECT_EQ(c.data_dir, "/var/lib/bluehood");
  EXPECT_EQ(c.db_path, "/var/lib/bluehood/bluehood.db");
  EXPECT_EQ(c.config_path, "/var/lib/bluehood/config.json");
  EXPECT_EQ(c.oui_cache_path, "/var/lib/bluehood/mac-vendors.txt");
  EXPECT_EQ(c.adapter, "hci1");
  EXPECT_EQ(c.socket_path, "/tmp/bluehood.sock");
  EXPECT_EQ(c.scan_interval_s, 10);
}

TEST_F(DaemonConfigTest, DefaultDataDirIsUnderHome) {
  DaemonConfig c = DaemonConfig::Defaults();
  const std::string suffix = "/.local/share/bluehood";
  ASSERT_GE(c.data_dir.size(), suffix.size());
  EXPECT_EQ(c.data_dir.substr(c.data_dir.size() - suffix.size()), suffix);
  EXPECT_TRUE(c.adapter.empty());
}

TEST_F(DaemonConfigTest, MissingFileKeepsDefaults) {
  DaemonConfig c = DaemonConfig::Defaults();
  EXPECT_TRUE(c.loadFromFile(temp_path("does-not-exist.json")));
  EXPECT_EQ(c.scan_interval_s, 10);
  EXPECT_EQ(c.vendor_api_url, "https://api.macvendors.com/");
}

TEST_F(DaemonConfigTest, GroupedOverrides) {
  const std::string path = write_file("grouped.json", R"({
    "scan":    { "adapter": "hci2", "interval_s": 30, "ble_duration_s": 8,
                 "classic_inquiry_length": 4, "classic_name_timeout_ms": 2500 },
    "socket":  { "path": "/run/bluehood.sock", "permissions": 384 },
    "vendor":  { "api_url": "http://localhost:9000/", "api_cooldown_ms": 250,
                 "oui_cache_path": "/srv/oui.txt" },
    "notify":  { "base_url": "https://ntfy.example", "absence_check_interval_s": 15 },
    "storage": { "db_path": "/srv/bluehood.db", "retention_days": 14 },
    "log_level": "debug"
  })");

  DaemonConfig c = DaemonConfig::Defaults();
  ASSERT_TRUE(c.loadFromFile(path));
  EXPECT_EQ(c.adapter, "hci2");
  EXPECT_EQ(c.scan_interval_s, 30);
  EXPECT_EQ(c.ble_scan_duration_s, 8);
  EXPECT_EQ(c.classic_inquiry_length, 4);
  EXPECT_EQ(c.classic_name_timeout_ms, 2500);
  EXPECT_EQ(c.socket_path, "/run/bluehood.sock");
  EXPECT_EQ(c.socket_permissions, (mode_t)0600);
  EXPECT_EQ(c.vendor_api_url, "http://localhost:9000/");
  EXPECT_EQ(c.vendor_api_cooldown_ms, 250);
  EXPECT_EQ(c.vendor_api_timeout_ms, 5000);
  EXPECT_EQ(c.oui_cache_path, "/srv/oui.txt");
  EXPECT_EQ(c.notify_base_url, "https://ntfy.example");
  EXPECT_EQ(c.absence_check_interval_s, 15);
  EXPECT_EQ(c.db_path, "/srv/bluehood.db");
  EXPECT_EQ(c.sighting_retention_days, 14);
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_EQ(c.config_path, path);
  std::remove(path.c_str());
}

TEST_F(DaemonConfigTest, MalformedFileFailsAndLogs) {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("config-test", sink));

  const std::string broken = write_file("broken.json", "{ \"scan\": { \"interval_s\": ");
  const std::string mistyped = write_file("mistyped.json", R"({ "scan": { "interval_s": "often" } })");

  DaemonConfig c = DaemonConfig::Defaults();
  EXPECT_FALSE(c.loadFromFile(broken));
  EXPECT_FALSE(DaemonConfig::Defaults().loadFromFile(mistyped));

  const auto lines = sink->last_formatted();
  spdlog::set_default_logger(previous);

  size_t failures = 0;
  for (const auto& l : lines) {
    if (l.find("Failed to parse config file") != std::string::npos) failures++;
  }
  EXPECT_EQ(failures, 2u);
  std::remove(broken.c_str());
  std::remove(mistyped.c_str());
}

TEST_F(DaemonConfigTest, EnsureDataDirCreatesNestedDirectories) {
  DaemonConfig c = DaemonConfig::Defaults();
  const std::string root = temp_path("dirs");
  c.data_dir = root + "/a/b";
  ASSERT_TRUE(c.ensureDataDir());

  struct stat st{};
  ASSERT_EQ(stat(c.data_dir.c_str(), &st), 0);
  EXPECT_TRUE(S_ISDIR(st.st_mode));
  EXPECT_TRUE(c.ensureDataDir());

  rmdir(c.data_dir.c_str());
  rmdir((root + "/a").c_str());
  rmdir(root.c_str());
}
