#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "Fakes.h"
#include "OuiDatabase.h"

static const char* REGISTRY_URL = "https://registry.test/oui.txt";

static const char* REGISTRY =
  "OUI/MA-L                                                    Organization\n"
  "company_id                                                  Organization\n"
  "                                                            Address\n"
  "\n"
  "28-6F-B9   (hex)\t\tNokia Shanghai Bell Co., Ltd.\n"
  "286FB9     (base 16)\t\tNokia Shanghai Bell Co., Ltd.\n"
  "\t\t\t\tNo.388 Ning Qiao Road,Jin Qiao Pudong Shanghai\n"
  "\n"
  "08-EA-44   (hex)\t\tExtreme Networks Headquarters\n"
  "08EA44     (base 16)\t\tExtreme Networks Headquarters\n";

TEST(OuiDatabase, ParsesRegistryBase16Lines) {
  std::unordered_map<std::string, std::string> table;
  EXPECT_EQ(OuiDatabase::ParseRegistry(REGISTRY, table), 2u);
  EXPECT_EQ(table["286FB9"], "Nokia Shanghai Bell Co., Ltd.");
  EXPECT_EQ(table["08EA44"], "Extreme Networks Headquarters");
}

TEST(OuiDatabase, ParsesCacheLines) {
  std::istringstream in("286fb9:Nokia\nnot a line\n08EA44:Extreme\nABCDEF:\n");
  std::unordered_map<std::string, std::string> table;
  EXPECT_EQ(OuiDatabase::ParseCache(in, table), 2u);
  EXPECT_EQ(table["286FB9"], "Nokia");
}

TEST(OuiDatabase, CleanVendorNameReplacesInvalidUtf8) {
  EXPECT_EQ(OuiDatabase::CleanVendorName("  Acme \xff\xfe Corp\r\n"), "Acme ?? Corp");
  EXPECT_EQ(OuiDatabase::CleanVendorName("Soci\xc3\xa9t\xc3\xa9 G\xc3\xa9n\xc3\xa9rale"),
            "Soci\xc3\xa9t\xc3\xa9 G\xc3\xa9n\xc3\xa9rale");
  EXPECT_EQ(OuiDatabase::CleanVendorName("Cut\xc3"), "Cut?");
  EXPECT_EQ(OuiDatabase::CleanVendorName("Overlong\xc0\xaf"), "Overlong??");
  EXPECT_EQ(OuiDatabase::CleanVendorName("Surrogate\xed\xa0\x80"), "Surrogate???");
}

TEST(OuiDatabase, ParsersCleanVendorText) {
  std::unordered_map<std::string, std::string> table;
  EXPECT_EQ(OuiDatabase::ParseRegistry("ABCDEF     (base 16)\t\tBad \xff Bytes Inc\n", table), 1u);
  EXPECT_EQ(table["ABCDEF"], "Bad ? Bytes Inc");

  std::istringstream in("123456:Also \xfe Bad\n");
  EXPECT_EQ(OuiDatabase::ParseCache(in, table), 1u);
  EXPECT_EQ(table["123456"], "Also ? Bad");
}

TEST(OuiDatabase, FirstLookupRefreshesOnceAndRewritesCache) {
  FakeHttpClient http;
  http.respond(REGISTRY_URL, 200, REGISTRY);

  const std::string path = ::testing::TempDir() + "oui_refresh_cache.txt";
  std::remove(path.c_str());

  OuiDatabase db(http, path, REGISTRY_URL, 1000);
  EXPECT_FALSE(db.load());

  std::string vendor;
  db.lookup("28:6F:B9:00:00:01", vendor);  // may or may not see the new table yet
  db.waitForRefresh();

  EXPECT_TRUE(db.refreshAttempted());
  ASSERT_TRUE(db.lookup("28:6f:b9:00:00:01", vendor));
  EXPECT_EQ(vendor, "Nokia Shanghai Bell Co., Ltd.");
  EXPECT_EQ(http.getsFor(REGISTRY_URL), 1u);

  // The rewritten cache is usable by a fresh instance.
  OuiDatabase reloaded(http, path, REGISTRY_URL, 1000);
  ASSERT_TRUE(reloaded.load());
  EXPECT_EQ(reloaded.size(), 2u);
  reloaded.waitForRefresh();
}

TEST(OuiDatabase, FailedRefreshKeepsCachedTable) {
  FakeHttpClient http;
  http.respond(REGISTRY_URL, 503, "");

  const std::string path = ::testing::TempDir() + "oui_failed_cache.txt";
  {
    std::ofstream f(path, std::ios::trunc);
    f << "08EA44:Extreme Networks Headquarters\n";
  }

  OuiDatabase db(http, path, REGISTRY_URL, 1000);
  ASSERT_TRUE(db.load());

  std::string vendor;
  EXPECT_TRUE(db.lookup("08:EA:44:12:34:56", vendor));
  db.waitForRefresh();
  EXPECT_TRUE(db.lookup("08:EA:44:12:34:56", vendor));
  EXPECT_EQ(vendor, "Extreme Networks Headquarters");

  EXPECT_FALSE(db.lookup("00:00:00:00:00:00", vendor));
  EXPECT_EQ(http.getsFor(REGISTRY_URL), 1u);
}
