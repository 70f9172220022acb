// src/Sources/CatalogSource.cpp
#include <DriverFetch/Sources/CatalogSource.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/Types/ChromeForTestingCatalog.hpp>

namespace DriverFetch {

CatalogSource::CatalogSource(HttpManager& httpManager, std::string catalogUrl, std::string platform)
    : DriverSource("ChromeLabs", httpManager), m_catalogUrl(std::move(catalogUrl)), m_platform(std::move(platform)) {}

std::vector<DriverCandidate> CatalogSource::fetch(const Utils::CancellationToken& cancel) {
    if (m_platform.empty()) {
        throw SourceError("no catalog platform configured for this system");
    }
    m_logger->debug("Fetching catalog from {}", m_catalogUrl);
    return parseCatalog(fetchText(m_catalogUrl, cancel));
}

std::vector<DriverCandidate> CatalogSource::parseCatalog(const std::string& document) const {
    ChromeForTestingCatalog catalog = ChromeForTestingCatalog::from_json(json::parse(document));

    std::vector<DriverCandidate> candidates;
    for (const auto& entry : catalog.versions) {
        std::optional<std::string> url = entry.driverUrlFor(m_platform);
        if (!url) {
            continue;
        }
        std::optional<VersionNumber> version = VersionNumber::tryParse(entry.version);
        if (!version) {
            m_logger->warn("Skipping catalog entry with unparseable version '{}'", entry.version);
            continue;
        }

        DriverCandidate candidate;
        candidate.version = *version;
        candidate.downloadUrl = *url;
        candidate.source = name();
        candidates.push_back(std::move(candidate));
    }

    m_logger->debug("Catalog {}: {} of {} entries have a '{}' driver", catalog.timestamp,
                    candidates.size(), catalog.versions.size(), m_platform);
    return candidates;
}

} // namespace DriverFetch
