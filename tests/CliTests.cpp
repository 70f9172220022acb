// tests/CliTests.cpp
#include "TestSupport.hpp"

#include <DriverFetch/BrowserVersionDetector.hpp>
#include <DriverFetch/Cli.hpp>
#include <DriverFetch/Config.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/Sources/IndexListingSource.hpp>
#include <DriverFetch/VersionReconciler.hpp>

#include <gtest/gtest.h>

using namespace DriverFetch;
using namespace DriverFetch::Testing;

namespace {

    const std::string kIndexUrl = "https://index.example.com/";
    const std::string kListing =
        "<ListBucketResult><Contents><Key>114.0.5735.90/chromedriver_linux64.zip</Key></Contents></ListBucketResult>";

    CliOptions parseArgs(const std::vector<std::string>& args) {
        CLI::App app{"driverfetch test", "driverfetch"};
        CliOptions cli;
        addCliOptions(app, cli);
        std::vector<const char*> argv{"driverfetch"};
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
        return cli;
    }

    class CliTest : public ::testing::Test {
    protected:
        TempDir dir;
        Config config = makeConfig(dir.path());
        FakeHttpManager http{config};
        VersionReconciler reconciler;
        ContentVersionReader reader;
        std::filesystem::path destination = dir.path() / "bin";

        static Config makeConfig(const std::filesystem::path& root) {
            Config c("driverfetch-tests", root);
            c.indexPlatform = "linux64";
            c.driverExecutableName = "chromedriver";
            return c;
        }

        void SetUp() override {
            reconciler.addSource(std::make_unique<IndexListingSource>(http, kIndexUrl, config.indexPlatform));
            http.reply(kIndexUrl, {200, kListing});
            http.reply(kIndexUrl + "114.0.5735.90/chromedriver_linux64.zip",
                       {200, makeZip(dir.path(), {{"chromedriver-linux64/chromedriver", "114.0.5735.90"}})});
        }

        std::filesystem::path browser(const std::string& version) {
            std::filesystem::path path = dir.path() / "chrome";
            writeTextFile(path, version);
            return path;
        }

        int run(std::vector<std::string> args, BrowserLocator& locator) {
            args.push_back("-d");
            args.push_back(destination.string());
            CliOptions cli = parseArgs(args);
            BrowserVersionDetector detector(locator, reader);
            DriverInstaller installer(config, http, reconciler, reader, &detector);
            return runInstall(installer, cli, Utils::CancellationToken{});
        }
    };

} // namespace

TEST(CliExitCode, InstallStatuses) {
    EXPECT_EQ(exitCodeFor(InstallStatus::Installed), 0);
    EXPECT_EQ(exitCodeFor(InstallStatus::UpToDate), 0);
    EXPECT_EQ(exitCodeFor(InstallStatus::Failed), 1);
}

TEST(CliOptionsParsing, EmptyVersionIsKept) {
    CliOptions cli = parseArgs({"-V", ""});
    ASSERT_TRUE(cli.version.has_value());
    EXPECT_EQ(*cli.version, "");
    EXPECT_THROW(toInstallOptions(cli, {}), InvalidVersionFormat);
}

TEST(CliOptionsParsing, VersionAbsentMeansDetect) {
    CliOptions cli = parseArgs({"--data-dir", "/tmp/x"});
    EXPECT_FALSE(cli.version.has_value());
    EXPECT_FALSE(toInstallOptions(cli, {}).version.has_value());
}

TEST(CliOptionsParsing, MissingBrowserPathIsLeftToTheDetector) {
    CliOptions cli;
    EXPECT_NO_THROW(cli = parseArgs({"--browser", "/definitely/not/here/chrome"}));
    EXPECT_EQ(cli.browserPath, "/definitely/not/here/chrome");
}

TEST_F(CliTest, InstallThenUpToDateExitZero) {
    FixedBrowserLocator locator(std::nullopt);
    EXPECT_EQ(run({"-V", "114.0.5735.90"}, locator), kExitOk);
    EXPECT_EQ(run({"-V", "114.0.5735.90"}, locator), kExitOk);
    EXPECT_EQ(http.downloadCount(), 1);
}

TEST_F(CliTest, NoMatchExitsOne) {
    FixedBrowserLocator locator(std::nullopt);
    EXPECT_EQ(run({"-V", "120"}, locator), kExitFailed);
}

TEST_F(CliTest, MissingExplicitBrowserExitsTwo) {
    FixedBrowserLocator locator(browser("114.0.5735.90"));
    EXPECT_EQ(run({"--browser", (dir.path() / "missing" / "chrome").string()}, locator), kExitBrowserNotFound);
    EXPECT_EQ(http.getCount(), 0);
}

TEST_F(CliTest, StaleBrowserPathIgnoredWithExplicitVersion) {
    FixedBrowserLocator locator(std::nullopt);
    EXPECT_EQ(run({"-V", "114", "--browser", (dir.path() / "missing" / "chrome").string()}, locator), kExitOk);
}

TEST_F(CliTest, UnlocatableOrUnreadableBrowserExitsTwo) {
    FixedBrowserLocator nowhere(std::nullopt);
    EXPECT_EQ(run({}, nowhere), kExitBrowserNotFound);

    FixedBrowserLocator garbled(browser("Chrome/dev"));
    EXPECT_EQ(run({}, garbled), kExitBrowserNotFound);
    EXPECT_EQ(http.getCount(), 0);
}

TEST_F(CliTest, DetectedBrowserVersionInstalls) {
    FixedBrowserLocator locator(browser("114.0.5735.199"));
    EXPECT_EQ(run({}, locator), kExitOk);
    EXPECT_EQ(readTextFile(destination / "chromedriver"), "114.0.5735.90");
}

TEST_F(CliTest, MalformedVersionExitsThreeWithoutDetectionOrRequests) {
    FixedBrowserLocator locator(browser("114.0.5735.90"));
    EXPECT_EQ(run({"-V", ""}, locator), kExitBadVersion);
    EXPECT_EQ(run({"-V", "114.x"}, locator), kExitBadVersion);
    EXPECT_EQ(run({"-V", "1.2.3.4.5"}, locator), kExitBadVersion);
    EXPECT_EQ(locator.calls, 0);
    EXPECT_EQ(http.getCount(), 0);
    EXPECT_FALSE(std::filesystem::exists(destination));
}
