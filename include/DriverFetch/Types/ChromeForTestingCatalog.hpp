// include/DriverFetch/Types/ChromeForTestingCatalog.hpp
#ifndef CHROME_FOR_TESTING_CATALOG_HPP
#define CHROME_FOR_TESTING_CATALOG_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace DriverFetch {
    using json = nlohmann::json;

    struct CatalogDownload {
        std::string platform;
        std::string url;

        static CatalogDownload from_json(const json& j);
    };

    struct CatalogVersion {
        std::string version;
        std::string revision;
        std::vector<CatalogDownload> chromedriver; // Empty for releases before 115

        std::optional<std::string> driverUrlFor(const std::string& platform) const;

        static CatalogVersion from_json(const json& j);
    };

    // known-good-versions-with-downloads.json
    struct ChromeForTestingCatalog {
        std::string timestamp;
        std::vector<CatalogVersion> versions;

        // Throws nlohmann::json::exception when the document itself is unusable;
        // individual malformed version entries are skipped.
        static ChromeForTestingCatalog from_json(const json& j);
    };
}

#endif // CHROME_FOR_TESTING_CATALOG_HPP
