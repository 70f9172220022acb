// include/DriverFetch/DriverInstaller.hpp
#ifndef DRIVER_INSTALLER_HPP
#define DRIVER_INSTALLER_HPP

#include <DriverFetch/Types/DriverCandidate.hpp>
#include <DriverFetch/Types/VersionNumber.hpp>
#include <DriverFetch/Utils/Cancellation.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace DriverFetch {

    struct Config;
    class HttpManager;
    class VersionReconciler;
    class FileVersionReader;
    class BrowserVersionDetector;

    enum class InstallStatus {
        Installed,
        UpToDate,
        Failed
    };

    std::string install_status_to_string(InstallStatus status);

    struct InstallOptions {
        std::optional<std::filesystem::path> destinationDir;  // Current directory when unset
        std::optional<VersionNumber> version;                  // Detected browser version when unset
        std::optional<std::filesystem::path> browserPath;      // Only used for detection
        Utils::CancellationToken cancel;
    };

    struct InstallResult {
        InstallStatus status = InstallStatus::Failed;
        std::filesystem::path driverPath;
        std::optional<VersionNumber> version;  // Matched candidate, if any
        std::string message;

        bool ok() const { return status != InstallStatus::Failed; }
    };

    // Installs or updates chromedriver in a directory.
    // Concurrent installs into the same directory are not serialized; callers must not overlap them.
    class DriverInstaller {
    public:
        DriverInstaller(const Config& config, HttpManager& httpManager, VersionReconciler& reconciler,
                        FileVersionReader& versionReader, BrowserVersionDetector* detector = nullptr);

        /**
         * @brief Matches, and when needed downloads and extracts, the driver for options.version.
         *
         * Network, checksum and archive failures come back as InstallStatus::Failed.
         * @throws BrowserNotFound, VersionUnreadable when options.version is unset and detection fails.
         */
        InstallResult install(const InstallOptions& options = {});

    private:
        const Config& m_config;
        HttpManager& m_httpManager;
        VersionReconciler& m_reconciler;
        FileVersionReader& m_versionReader;
        BrowserVersionDetector* m_detector;
        std::shared_ptr<spdlog::logger> m_logger;

        bool isUpToDate(const std::filesystem::path& driverPath, const VersionNumber& expected);
        InstallResult downloadAndExtract(const DriverCandidate& candidate, const std::filesystem::path& driverPath,
                                         const Utils::CancellationToken& cancel);
        InstallResult fail(InstallResult result, const std::string& message);
    };

} // namespace DriverFetch

#endif // DRIVER_INSTALLER_HPP
