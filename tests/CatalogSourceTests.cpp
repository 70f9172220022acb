// tests/CatalogSourceTests.cpp
#include "TestSupport.hpp"

#include <DriverFetch/Config.hpp>
#include <DriverFetch/Sources/CatalogSource.hpp>
#include <DriverFetch/Types/ChromeForTestingCatalog.hpp>

#include <gtest/gtest.h>

using namespace DriverFetch;
using namespace DriverFetch::Testing;

namespace {

    const std::string kCatalogUrl = "https://googlechromelabs.github.io/chrome-for-testing/known-good-versions-with-downloads.json";

    const std::string kCatalog = R"({
  "timestamp": "2023-11-20T10:09:52.839Z",
  "versions": [
    {
      "version": "113.0.5672.0",
      "revision": "1121455",
      "downloads": {
        "chrome": [
          {"platform": "linux64", "url": "https://example.com/113.0.5672.0/linux64/chrome-linux64.zip"}
        ]
      }
    },
    {
      "version": "115.0.5763.0",
      "revision": "1141961",
      "downloads": {
        "chrome": [],
        "chromedriver": [
          {"platform": "linux64", "url": "https://example.com/115.0.5763.0/linux64/chromedriver-linux64.zip"},
          {"platform": "win64", "url": "https://example.com/115.0.5763.0/win64/chromedriver-win64.zip"}
        ]
      }
    },
    {
      "version": "116.0.5845.96",
      "revision": "1160321",
      "downloads": {
        "chromedriver": [
          {"platform": "win32", "url": "https://example.com/116.0.5845.96/win32/chromedriver-win32.zip"},
          {"platform": "win64", "url": "https://example.com/116.0.5845.96/win64/chromedriver-win64.zip"},
          {"platform": "mac-arm64", "url": "https://example.com/116.0.5845.96/mac-arm64/chromedriver-mac-arm64.zip"}
        ]
      }
    },
    {
      "version": "not-a-version",
      "downloads": {
        "chromedriver": [
          {"platform": "win64", "url": "https://example.com/bogus/chromedriver-win64.zip"}
        ]
      }
    },
    {
      "revision": "0",
      "downloads": {}
    }
  ]
})";

    class CatalogSourceTest : public ::testing::Test {
    protected:
        TempDir dir;
        Config config{"driverfetch-tests", dir.path()};
        FakeHttpManager http{config};
    };

} // namespace

TEST(ChromeForTestingCatalog, ParsesEntriesAndSkipsMalformedOnes) {
    ChromeForTestingCatalog catalog = ChromeForTestingCatalog::from_json(json::parse(kCatalog));
    EXPECT_EQ(catalog.timestamp, "2023-11-20T10:09:52.839Z");
    // The entry without "version" is dropped, the rest are kept even without drivers.
    ASSERT_EQ(catalog.versions.size(), 4u);
    EXPECT_TRUE(catalog.versions[0].chromedriver.empty());
    EXPECT_EQ(catalog.versions[1].revision, "1141961");
    EXPECT_EQ(catalog.versions[2].driverUrlFor("mac-arm64"),
              std::optional<std::string>("https://example.com/116.0.5845.96/mac-arm64/chromedriver-mac-arm64.zip"));
    EXPECT_FALSE(catalog.versions[2].driverUrlFor("linux64").has_value());
}

TEST(ChromeForTestingCatalog, VersionsMustBeAnArray) {
    EXPECT_THROW(ChromeForTestingCatalog::from_json(json::parse(R"({"versions": {}})")), json::exception);
    EXPECT_THROW(ChromeForTestingCatalog::from_json(json::parse(R"({"timestamp": "x"})")), json::exception);
}

TEST_F(CatalogSourceTest, FiltersByPlatform) {
    CatalogSource source(http, kCatalogUrl, "win64");
    std::vector<DriverCandidate> candidates = source.parseCatalog(kCatalog);

    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].version, VersionNumber::parse("115.0.5763.0"));
    EXPECT_EQ(candidates[0].downloadUrl, "https://example.com/115.0.5763.0/win64/chromedriver-win64.zip");
    EXPECT_EQ(candidates[1].version, VersionNumber::parse("116.0.5845.96"));
    EXPECT_EQ(candidates[1].source, "ChromeLabs");
    EXPECT_FALSE(candidates[1].md5.has_value());
}

TEST_F(CatalogSourceTest, PlatformWithoutDriversYieldsNothing) {
    CatalogSource source(http, kCatalogUrl, "mac-x64");
    EXPECT_TRUE(source.parseCatalog(kCatalog).empty());
}

TEST_F(CatalogSourceTest, UnparseableDocumentThrowsFromParseCatalog) {
    CatalogSource source(http, kCatalogUrl, "win64");
    EXPECT_THROW(source.parseCatalog("{ not json"), json::exception);
}

TEST_F(CatalogSourceTest, FetchesThroughHttp) {
    http.reply(kCatalogUrl, {200, kCatalog});
    CatalogSource source(http, kCatalogUrl, "linux64");

    std::vector<DriverCandidate> candidates = source.fetchCandidates({});
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].downloadUrl, "https://example.com/115.0.5763.0/linux64/chromedriver-linux64.zip");
}

TEST_F(CatalogSourceTest, BadPayloadOrStatusYieldsEmptyList) {
    CatalogSource source(http, kCatalogUrl, "win64");

    http.reply(kCatalogUrl, {200, "<html>rate limited</html>"});
    EXPECT_TRUE(source.fetchCandidates({}).empty());

    http.reply(kCatalogUrl, {404, "Not Found"});
    EXPECT_TRUE(source.fetchCandidates({}).empty());
}
