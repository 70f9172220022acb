// include/DriverFetch/Sources/CatalogSource.hpp
#ifndef CATALOG_SOURCE_HPP
#define CATALOG_SOURCE_HPP

#include <DriverFetch/Sources/DriverSource.hpp>

namespace DriverFetch {

    // Chrome for Testing JSON catalog (drivers from 115 on).
    class CatalogSource : public DriverSource {
    public:
        CatalogSource(HttpManager& httpManager, std::string catalogUrl, std::string platform);

        // Throws nlohmann::json::exception if the document cannot be parsed at all.
        std::vector<DriverCandidate> parseCatalog(const std::string& document) const;

    protected:
        std::vector<DriverCandidate> fetch(const Utils::CancellationToken& cancel) override;

    private:
        std::string m_catalogUrl;
        std::string m_platform;
    };

} // namespace DriverFetch

#endif // CATALOG_SOURCE_HPP
