// tests/ZipFileTests.cpp
#include "TestSupport.hpp"

#include <DriverFetch/Utils/ZipFile.hpp>

#include <gtest/gtest.h>

using namespace DriverFetch;
using namespace DriverFetch::Testing;

namespace {

    class ZipFileTest : public ::testing::Test {
    protected:
        TempDir dir;
        std::filesystem::path archive = dir.path() / "chromedriver_linux64.zip";

        void SetUp() override {
            writeZip(archive, {
                {"chromedriver-linux64/LICENSE.chromedriver", "license text"},
                {"chromedriver-linux64/ChromeDriver", "driver bytes"},
                {"chromedriver-linux64/THIRD_PARTY_NOTICES.chromedriver", "notices"},
            });
        }
    };

} // namespace

TEST_F(ZipFileTest, ListsEntriesInArchiveOrder) {
    Utils::ZipFile zip(archive);
    ASSERT_TRUE(zip.open());
    EXPECT_TRUE(zip.isOpen());
    std::vector<std::string> names = zip.entryNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[1], "chromedriver-linux64/ChromeDriver");
}

TEST_F(ZipFileTest, ExtractsNestedEntryByFileNameIgnoringCase) {
    Utils::ZipFile zip(archive);
    std::filesystem::path out = dir.path() / "chromedriver";
    ASSERT_TRUE(zip.extractEntry("chromedriver", out)) << zip.getLastError();
    EXPECT_EQ(readTextFile(out), "driver bytes");
}

TEST_F(ZipFileTest, ReplacesExistingOutput) {
    std::filesystem::path out = dir.path() / "chromedriver";
    writeTextFile(out, "old driver that is longer than the new one");

    Utils::ZipFile zip(archive);
    ASSERT_TRUE(zip.extractEntry("CHROMEDRIVER", out)) << zip.getLastError();
    EXPECT_EQ(readTextFile(out), "driver bytes");
}

TEST_F(ZipFileTest, MissingEntryFails) {
    Utils::ZipFile zip(archive);
    std::filesystem::path out = dir.path() / "chromedriver.exe";
    EXPECT_FALSE(zip.extractEntry("chromedriver.exe", out));
    EXPECT_FALSE(zip.getLastError().empty());
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(ZipFileTest, NotAnArchive) {
    std::filesystem::path bogus = dir.path() / "bogus.zip";
    writeTextFile(bogus, "<Error><Code>NoSuchKey</Code></Error>");

    Utils::ZipFile zip(bogus);
    EXPECT_FALSE(zip.open());
    EXPECT_FALSE(zip.extractEntry("chromedriver", dir.path() / "chromedriver"));
    EXPECT_FALSE(zip.getLastError().empty());
}
