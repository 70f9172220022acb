// include/DriverFetch/Config.hpp
#ifndef DRIVERFETCH_CONFIG_HPP
#define DRIVERFETCH_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <string>

namespace DriverFetch {

    struct Config {
        std::string appName;
        std::filesystem::path baseDataPath;   // <user data dir>/<appName> unless overridden
        std::filesystem::path downloadsDir;   // Temporary archives, emptied after every install
        std::filesystem::path logsDir;

        std::string indexListingUrl = "https://chromedriver.storage.googleapis.com/";
        std::string catalogUrl = "https://googlechromelabs.github.io/chrome-for-testing/known-good-versions-with-downloads.json";

        std::string indexPlatform;        // Derived from the running OS/arch
        std::string catalogPlatform;
        std::string driverExecutableName;

        std::chrono::milliseconds httpTimeout{60000};
        std::string userAgent;

        // An empty dataRoot resolves to the platform's per-user data directory.
        // Creates baseDataPath, downloadsDir and logsDir.
        explicit Config(const std::string& appName = "driverfetch",
                        const std::filesystem::path& dataRoot = {});
    };

}
#endif // DRIVERFETCH_CONFIG_HPP
