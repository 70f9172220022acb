// src/BrowserVersionDetector.cpp
#include <DriverFetch/BrowserVersionDetector.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/Platform/BrowserLocator.hpp>
#include <DriverFetch/Platform/FileVersionReader.hpp>
#include <DriverFetch/Utils/Logger.hpp>

namespace DriverFetch {

BrowserVersionDetector::BrowserVersionDetector(BrowserLocator& locator, FileVersionReader& versionReader)
    : m_locator(locator), m_versionReader(versionReader) {
    m_logger = Utils::Logger::GetOrCreateLogger("BrowserDetector");
}

VersionNumber BrowserVersionDetector::detect(const std::optional<std::filesystem::path>& explicitPath) {
    std::filesystem::path browserPath;
    if (explicitPath) {
        std::error_code ec;
        if (!std::filesystem::exists(*explicitPath, ec)) {
            throw BrowserNotFound("Browser executable '" + explicitPath->string() + "' does not exist");
        }
        browserPath = *explicitPath;
    } else {
        std::optional<std::filesystem::path> located = m_locator.findDefaultBrowserPath();
        if (!located) {
            throw BrowserNotFound("Cannot locate the Chrome executable. Pass its path explicitly.");
        }
        browserPath = *located;
    }
    m_logger->info("Reading browser version from {}", browserPath.string());

    std::optional<std::string> versionText = m_versionReader.readVersion(browserPath);
    if (!versionText) {
        throw VersionUnreadable("No version information in '" + browserPath.string() + "'");
    }
    std::optional<VersionNumber> version = VersionNumber::tryParse(*versionText);
    if (!version) {
        throw VersionUnreadable("Unparseable version '" + *versionText + "' in '" + browserPath.string() + "'");
    }

    m_logger->info("Detected browser version {}", version->toString());
    return *version;
}

} // namespace DriverFetch
