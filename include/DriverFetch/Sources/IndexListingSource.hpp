// include/DriverFetch/Sources/IndexListingSource.hpp
#ifndef INDEX_LISTING_SOURCE_HPP
#define INDEX_LISTING_SOURCE_HPP

#include <DriverFetch/Sources/DriverSource.hpp>

namespace DriverFetch {

    // Legacy chromedriver.storage.googleapis.com bucket listing (drivers up to 114).
    // Keys look like "114.0.5735.90/chromedriver_linux64.zip".
    class IndexListingSource : public DriverSource {
    public:
        IndexListingSource(HttpManager& httpManager, std::string baseUrl, std::string platform);

        // Scans <Key> entries ending in "_<platform>.zip". Entries whose leading path
        // segment is not a version are skipped, the rest of the listing is still used.
        std::vector<DriverCandidate> parseListing(const std::string& listing) const;

    protected:
        std::vector<DriverCandidate> fetch(const Utils::CancellationToken& cancel) override;

    private:
        std::string m_baseUrl;
        std::string m_suffix;
    };

} // namespace DriverFetch

#endif // INDEX_LISTING_SOURCE_HPP
