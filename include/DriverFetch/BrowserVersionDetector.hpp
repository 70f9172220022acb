// include/DriverFetch/BrowserVersionDetector.hpp
#ifndef BROWSER_VERSION_DETECTOR_HPP
#define BROWSER_VERSION_DETECTOR_HPP

#include <DriverFetch/Types/VersionNumber.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/logger.h>

namespace DriverFetch {

    class BrowserLocator;
    class FileVersionReader;

    class BrowserVersionDetector {
    public:
        BrowserVersionDetector(BrowserLocator& locator, FileVersionReader& versionReader);

        /**
         * @brief Version of the installed browser.
         * @param explicitPath Browser executable to use instead of the platform lookup.
         * @throws BrowserNotFound if no executable could be resolved (or the explicit one does not exist).
         * @throws VersionUnreadable if the executable reports no parseable version.
         */
        VersionNumber detect(const std::optional<std::filesystem::path>& explicitPath = std::nullopt);

    private:
        BrowserLocator& m_locator;
        FileVersionReader& m_versionReader;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace DriverFetch

#endif // BROWSER_VERSION_DETECTOR_HPP
