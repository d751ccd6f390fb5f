#include <gtest/gtest.h>

#include "ClassicScanBackend.h"
#include "Fakes.h"

static const char* INQ_OUTPUT =
  "Inquiring ...\n"
  "\t00:1A:7D:DA:71:13\tclock offset: 0x5a3c\tclass: 0x5a020c\n"
  "\tf8:4d:89:00:11:22\tclock offset: 0x1b2d\tclass: 0x240404\n"
  "\t00:1A:7D:DA:71:13\tclock offset: 0x5a3c\tclass: 0x5a020c\n"
  "garbage line\n";

TEST(ClassicScanBackend, ParsesInquiryOutput) {
  auto results = ClassicScanBackend::ParseInquiryOutput(INQ_OUTPUT);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].mac, "00:1A:7D:DA:71:13");
  EXPECT_EQ(results[0].device_class, 0x5a020cu);
  EXPECT_EQ(results[1].mac, "F8:4D:89:00:11:22");
  EXPECT_EQ(results[1].device_class, 0x240404u);
}

TEST(ClassicScanBackend, ScansAndReadsNames) {
  FakeCommandRunner runner;
  CommandResult inq;
  inq.exit_code = 0;
  inq.out = INQ_OUTPUT;
  runner.on("hcitool -i hci1 inq --length 4", inq);

  CommandResult name;
  name.exit_code = 0;
  name.out = "Pixel 7\n";
  runner.on("hcitool -i hci1 name 00:1A:7D:DA:71:13", name);

  ClassicScanBackend backend(runner, "hci1", 4, 2000);
  std::vector<ScannedDevice> out;
  ASSERT_TRUE(backend.scan(out));
  ASSERT_EQ(out.size(), 2u);

  EXPECT_EQ(out[0].name, "Pixel 7");
  EXPECT_EQ(out[0].backend, ScanBackendKind::Classic);
  EXPECT_TRUE(out[0].has_device_class);
  EXPECT_EQ(out[0].device_class, 0x5a020cu);
  EXPECT_EQ(out[0].rssi, ClassicScanBackend::PLACEHOLDER_RSSI);
  // name lookup for the second device is not configured in the fake
  EXPECT_TRUE(out[1].name.empty());

  const auto timeouts = runner.timeouts();
  ASSERT_FALSE(timeouts.empty());
  EXPECT_EQ(timeouts[0], 4 * 1280 + 5000);
}

TEST(ClassicScanBackend, MissingToolIsAFailedScan) {
  FakeCommandRunner runner;  // every command is "not found"
  ClassicScanBackend backend(runner, "", 8, 5000);
  std::vector<ScannedDevice> out;
  EXPECT_FALSE(backend.scan(out));
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(runner.calls().front(), "hcitool inq --length 8");
}

TEST(ClassicScanBackend, NonZeroExitIsAFailedScan) {
  FakeCommandRunner runner;
  CommandResult res;
  res.exit_code = 1;
  res.err = "Device is not available: No such device";
  runner.on("hcitool inq --length 8", res);

  ClassicScanBackend backend(runner, "", 8, 5000);
  std::vector<ScannedDevice> out;
  EXPECT_FALSE(backend.scan(out));
}
