// src/Types/ChromeForTestingCatalog.cpp
#include <DriverFetch/Types/ChromeForTestingCatalog.hpp>
#include <DriverFetch/Utils/Logger.hpp>

namespace DriverFetch {

CatalogDownload CatalogDownload::from_json(const json& j) {
    CatalogDownload download;
    download.platform = j.at("platform").get<std::string>();
    download.url = j.at("url").get<std::string>();
    return download;
}

std::optional<std::string> CatalogVersion::driverUrlFor(const std::string& platform) const {
    for (const auto& download : chromedriver) {
        if (download.platform == platform) {
            return download.url;
        }
    }
    return std::nullopt;
}

CatalogVersion CatalogVersion::from_json(const json& j) {
    CatalogVersion entry;
    entry.version = j.at("version").get<std::string>();
    if (j.contains("revision")) entry.revision = j.at("revision").get<std::string>();

    if (j.contains("downloads") && j.at("downloads").contains("chromedriver") &&
        j.at("downloads").at("chromedriver").is_array()) {
        for (const auto& download_json : j.at("downloads").at("chromedriver")) {
            entry.chromedriver.push_back(CatalogDownload::from_json(download_json));
        }
    }
    return entry;
}

ChromeForTestingCatalog ChromeForTestingCatalog::from_json(const json& j) {
    ChromeForTestingCatalog catalog;
    if (j.contains("timestamp") && j.at("timestamp").is_string()) {
        catalog.timestamp = j.at("timestamp").get<std::string>();
    }

    // get_ref throws type_error when 'versions' is not an array
    const auto& versions = j.at("versions").get_ref<const json::array_t&>();

    for (const auto& version_json : versions) {
        try {
            catalog.versions.push_back(CatalogVersion::from_json(version_json));
        } catch (const json::exception& e) {
            CORE_LOG_WARN("[CatalogParser] Skipping malformed version entry: {}", e.what());
        }
    }
    CORE_LOG_TRACE("[CatalogParser] Parsed {} version entries (timestamp {})", catalog.versions.size(), catalog.timestamp);
    return catalog;
}

} // namespace DriverFetch
