// src/Cli.cpp
#include <DriverFetch/Cli.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/Utils/Logger.hpp>

namespace DriverFetch {

void addCliOptions(CLI::App& app, CliOptions& options) {
    app.add_option("-d,--destination", options.destination, "Directory to install chromedriver into (default: current directory)");
    // Records -V even when its value is empty.
    app.add_option_function<std::string>("-V,--version",
        [&options](const std::string& text) { options.version = text; },
        "Driver version to match: major[.minor[.build[.revision]]] (default: installed Chrome)");
    // Existence is checked by the detector (BrowserNotFound).
    app.add_option("--browser", options.browserPath, "Chrome executable to read the version from");
    app.add_option("--platform", options.indexPlatform, "Platform suffix in the legacy bucket listing, e.g. linux64, win32, mac_arm64");
    app.add_option("--catalog-platform", options.catalogPlatform, "Platform id in the Chrome for Testing catalog, e.g. linux64, win64, mac-arm64");
    app.add_option("--timeout", options.timeoutSeconds, "HTTP timeout in seconds")->check(CLI::PositiveNumber);
    app.add_option("--data-dir", options.dataDir, "Parent directory for downloads and logs (default: per-user data directory)");
    app.add_flag("-v,--verbose", options.verbose, "Debug output on the console");
    app.add_flag("-q,--quiet", options.quiet, "Only warnings and errors on the console");
    app.add_flag("--list", options.listOnly, "Print the available drivers instead of installing");
}

InstallOptions toInstallOptions(const CliOptions& cli, const Utils::CancellationToken& cancel) {
    InstallOptions options;
    if (cli.version) {
        options.version = VersionNumber::parse(*cli.version);
    }
    if (!cli.destination.empty()) options.destinationDir = cli.destination;
    if (!cli.browserPath.empty()) options.browserPath = cli.browserPath;
    options.cancel = cancel;
    return options;
}

int exitCodeFor(InstallStatus status) {
    switch (status) {
        case InstallStatus::Installed:
        case InstallStatus::UpToDate:
            return kExitOk;
        case InstallStatus::Failed:
            return kExitFailed;
    }
    return kExitFailed;
}

int runInstall(DriverInstaller& installer, const CliOptions& cli, const Utils::CancellationToken& cancel) {
    InstallOptions options;
    try {
        options = toInstallOptions(cli, cancel);
    } catch (const InvalidVersionFormat& e) {
        CORE_LOG_CRITICAL("{}", e.what());
        return kExitBadVersion;
    }

    InstallResult result;
    try {
        result = installer.install(options);
    } catch (const BrowserNotFound& e) {
        CORE_LOG_CRITICAL("{}", e.what());
        return kExitBrowserNotFound;
    } catch (const VersionUnreadable& e) {
        CORE_LOG_CRITICAL("{}", e.what());
        return kExitBrowserNotFound;
    }

    if (result.ok()) {
        CORE_LOG_INFO("{} ({})", result.message, result.driverPath.string());
    } else {
        CORE_LOG_ERROR("ChromeDriver {}: {}", install_status_to_string(result.status), result.message);
    }
    return exitCodeFor(result.status);
}

} // namespace DriverFetch
