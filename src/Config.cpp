// src/Config.cpp
#include <DriverFetch/Config.hpp>
#include <DriverFetch/Utils/OS.hpp>
#include <iostream> // Runs before the logger exists

namespace DriverFetch {

Config::Config(const std::string& name, const std::filesystem::path& dataRoot) : appName(name) {
    std::filesystem::path root = dataRoot.empty() ? Utils::getUserDataDirectory() : dataRoot;
    // Only the last path element of the name is used as folder name.
    std::filesystem::path folder = std::filesystem::path(appName).filename();
    if (folder.empty()) {
        folder = "driverfetch";
    }
    baseDataPath = root / folder;
    downloadsDir = baseDataPath / "downloads";
    logsDir = baseDataPath / "logs";

    Utils::OperatingSystem os = Utils::getCurrentOS();
    Utils::Architecture arch = Utils::getCurrentArch();
    indexPlatform = Utils::getIndexPlatform(os, arch);
    catalogPlatform = Utils::getCatalogPlatform(os, arch);
    driverExecutableName = Utils::getDriverExecutableName(os);
    userAgent = folder.string() + "/1.0";

    auto create_dir_if_not_exists = [](const std::filesystem::path& p, const std::string& what) {
        std::error_code ec;
        if (std::filesystem::exists(p, ec)) {
            return;
        }
        if (!std::filesystem::create_directories(p, ec) && ec) {
            std::cerr << "Failed to create " << what << " directory " << p.string() << ": " << ec.message() << std::endl;
        }
    };

    create_dir_if_not_exists(baseDataPath, "data");
    create_dir_if_not_exists(downloadsDir, "downloads");
    create_dir_if_not_exists(logsDir, "logs");
}

} // namespace DriverFetch
