// include/DriverFetch/Cli.hpp
#ifndef DRIVERFETCH_CLI_HPP
#define DRIVERFETCH_CLI_HPP

#include <DriverFetch/DriverInstaller.hpp>
#include <DriverFetch/Utils/Cancellation.hpp>
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace DriverFetch {

    constexpr int kExitOk = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitBrowserNotFound = 2;  // BrowserNotFound or VersionUnreadable
    constexpr int kExitBadVersion = 3;       // InvalidVersionFormat

    // Command line of the driverfetch executable.
    struct CliOptions {
        std::string destination;
        std::optional<std::string> version;  // Set whenever -V was given, even to ""
        std::string browserPath;
        std::string indexPlatform;
        std::string catalogPlatform;
        std::string dataDir;
        int timeoutSeconds = 60;
        bool verbose = false;
        bool quiet = false;
        bool listOnly = false;
    };

    // Registers every option on app, writing into options on parse.
    void addCliOptions(CLI::App& app, CliOptions& options);

    /**
     * @brief InstallOptions for a parsed command line.
     * @throws InvalidVersionFormat when -V was given with malformed text.
     */
    InstallOptions toInstallOptions(const CliOptions& cli, const Utils::CancellationToken& cancel);

    // 0 Installed / UpToDate, 1 Failed.
    int exitCodeFor(InstallStatus status);

    // Runs one install and maps every outcome, detection and version errors included, to an exit code.
    int runInstall(DriverInstaller& installer, const CliOptions& cli, const Utils::CancellationToken& cancel);

} // namespace DriverFetch

#endif // DRIVERFETCH_CLI_HPP
