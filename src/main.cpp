// src/main.cpp
#include <DriverFetch/BrowserVersionDetector.hpp>
#include <DriverFetch/Cli.hpp>
#include <DriverFetch/Config.hpp>
#include <DriverFetch/DriverInstaller.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/HttpManager.hpp>
#include <DriverFetch/Platform/BrowserLocator.hpp>
#include <DriverFetch/Platform/FileVersionReader.hpp>
#include <DriverFetch/Sources/CatalogSource.hpp>
#include <DriverFetch/Sources/IndexListingSource.hpp>
#include <DriverFetch/VersionReconciler.hpp>
#include <DriverFetch/Utils/Logger.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

    DriverFetch::Utils::CancellationToken g_cancel;

    void onInterrupt(int) {
        g_cancel.cancel();
    }

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Installs the ChromeDriver build that matches the installed Chrome.", "driverfetch"};
    DriverFetch::CliOptions cli;
    DriverFetch::addCliOptions(app, cli);
    CLI11_PARSE(app, argc, argv);

    DriverFetch::Config config("driverfetch", cli.dataDir);
    if (!cli.indexPlatform.empty()) config.indexPlatform = cli.indexPlatform;
    if (!cli.catalogPlatform.empty()) config.catalogPlatform = cli.catalogPlatform;
    config.httpTimeout = std::chrono::seconds(cli.timeoutSeconds);

    spdlog::level::level_enum consoleLevel = cli.verbose ? spdlog::level::debug : (cli.quiet ? spdlog::level::warn : spdlog::level::info);
    DriverFetch::Utils::Logger::Init(config.logsDir, "driverfetch.log", consoleLevel, spdlog::level::trace);
    CORE_LOG_DEBUG("Data directory: {}", config.baseDataPath.string());
    CORE_LOG_DEBUG("Platforms: listing '{}', catalog '{}'", config.indexPlatform, config.catalogPlatform);

    std::signal(SIGINT, onInterrupt);

    DriverFetch::HttpManager httpManager(config);
    DriverFetch::VersionReconciler reconciler;
    reconciler.addSource(std::make_unique<DriverFetch::IndexListingSource>(httpManager, config.indexListingUrl, config.indexPlatform));
    reconciler.addSource(std::make_unique<DriverFetch::CatalogSource>(httpManager, config.catalogUrl, config.catalogPlatform));

    if (cli.listOnly) {
        DriverFetch::InstallOptions options;
        try {
            options = DriverFetch::toInstallOptions(cli, g_cancel);
        } catch (const DriverFetch::InvalidVersionFormat& e) {
            CORE_LOG_CRITICAL("{}", e.what());
            spdlog::shutdown();
            return DriverFetch::kExitBadVersion;
        }
        DriverFetch::CandidatePool pool = reconciler.collectCandidates(options.cancel);
        for (const auto& candidate : pool) {
            std::cout << candidate.version << "\t" << candidate.source << "\t" << candidate.downloadUrl << "\n";
        }
        if (options.version) {
            std::optional<DriverFetch::DriverCandidate> best = DriverFetch::VersionReconciler::match(pool, *options.version);
            CORE_LOG_INFO("Best match for v{}: {}", options.version->toString(), best ? best->toString() : std::string("none"));
        }
        spdlog::shutdown();
        return DriverFetch::kExitOk;
    }

    DriverFetch::NativeFileVersionReader versionReader;
    DriverFetch::NativeBrowserLocator browserLocator;
    DriverFetch::BrowserVersionDetector detector(browserLocator, versionReader);
    DriverFetch::DriverInstaller installer(config, httpManager, reconciler, versionReader, &detector);

    int exitCode = DriverFetch::runInstall(installer, cli, g_cancel);
    spdlog::shutdown();
    return exitCode;
}
