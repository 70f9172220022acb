// src/DriverInstaller.cpp
#include <DriverFetch/DriverInstaller.hpp>
#include <DriverFetch/BrowserVersionDetector.hpp>
#include <DriverFetch/Config.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/HttpManager.hpp>
#include <DriverFetch/Platform/FileVersionReader.hpp>
#include <DriverFetch/VersionReconciler.hpp>
#include <DriverFetch/Utils/Crypto.hpp>
#include <DriverFetch/Utils/Logger.hpp>
#include <DriverFetch/Utils/TempFile.hpp>
#include <DriverFetch/Utils/ZipFile.hpp>

namespace DriverFetch {

std::string install_status_to_string(InstallStatus status) {
    switch (status) {
        case InstallStatus::Installed: return "installed";
        case InstallStatus::UpToDate: return "up-to-date";
        case InstallStatus::Failed: return "failed";
    }
    return "unknown";
}

DriverInstaller::DriverInstaller(const Config& config, HttpManager& httpManager, VersionReconciler& reconciler,
                                 FileVersionReader& versionReader, BrowserVersionDetector* detector)
    : m_config(config), m_httpManager(httpManager), m_reconciler(reconciler),
      m_versionReader(versionReader), m_detector(detector) {
    m_logger = Utils::Logger::GetOrCreateLogger("Installer");
}

InstallResult DriverInstaller::fail(InstallResult result, const std::string& message) {
    m_logger->error("{}", message);
    result.status = InstallStatus::Failed;
    result.message = message;
    return result;
}

InstallResult DriverInstaller::install(const InstallOptions& options) {
    VersionNumber requested;
    if (options.version) {
        requested = *options.version;
    } else {
        if (m_detector == nullptr) {
            throw BrowserNotFound("No driver version given and browser detection is not available");
        }
        requested = m_detector->detect(options.browserPath);
    }

    std::filesystem::path destinationDir = options.destinationDir.value_or(std::filesystem::current_path());
    InstallResult result;
    result.driverPath = destinationDir / m_config.driverExecutableName;
    m_logger->info("Looking for a ChromeDriver matching v{} for {}", requested.toString(), result.driverPath.string());

    if (options.cancel.isCancelled()) {
        return fail(result, "Cancelled");
    }

    CandidatePool pool = m_reconciler.collectCandidates(options.cancel);
    if (options.cancel.isCancelled()) {
        return fail(result, "Cancelled");
    }

    std::optional<DriverCandidate> matched = VersionReconciler::match(pool, requested);
    if (!matched) {
        return fail(result, "No downloads available for v" + requested.toString());
    }
    result.version = matched->version;
    m_logger->info("Matched v{} from {}", matched->version.toString(), matched->source);

    if (isUpToDate(result.driverPath, matched->version)) {
        m_logger->info("ChromeDriver is up-to-date");
        result.status = InstallStatus::UpToDate;
        result.message = "ChromeDriver v" + matched->version.toString() + " is up-to-date";
        return result;
    }

    try {
        InstallResult installed = downloadAndExtract(*matched, result.driverPath, options.cancel);
        installed.version = result.version;
        return installed;
    } catch (const std::exception& e) {
        return fail(result, std::string("Install failed: ") + e.what());
    }
}

bool DriverInstaller::isUpToDate(const std::filesystem::path& driverPath, const VersionNumber& expected) {
    std::error_code ec;
    if (!std::filesystem::exists(driverPath, ec)) {
        return false;
    }
    std::optional<std::string> installedText = m_versionReader.readVersion(driverPath);
    if (!installedText) {
        m_logger->warn("Existing driver {} reports no version, replacing it", driverPath.string());
        return false;
    }
    std::optional<VersionNumber> installed = VersionNumber::tryParse(*installedText);
    if (!installed) {
        m_logger->warn("Existing driver {} reports unparseable version '{}', replacing it", driverPath.string(), *installedText);
        return false;
    }
    m_logger->debug("Existing driver is v{}", installed->toString());
    return *installed == expected;
}

InstallResult DriverInstaller::downloadAndExtract(const DriverCandidate& candidate, const std::filesystem::path& driverPath,
                                                  const Utils::CancellationToken& cancel) {
    InstallResult result;
    result.driverPath = driverPath;

    std::error_code ec;
    std::filesystem::create_directories(m_config.downloadsDir, ec);
    if (ec) {
        return fail(result, "Cannot create download directory " + m_config.downloadsDir.string() + ": " + ec.message());
    }
    std::filesystem::path destinationDir = driverPath.parent_path();
    if (!destinationDir.empty()) {
        std::filesystem::create_directories(destinationDir, ec);
        if (ec) {
            return fail(result, "Cannot create destination directory " + destinationDir.string() + ": " + ec.message());
        }
    }

    // Both are deleted on every way out of this function.
    Utils::ScopedTempFile archive(m_config.downloadsDir, ".zip");
    Utils::ScopedTempFile staged(destinationDir.empty() ? std::filesystem::path(".") : destinationDir, ".part");

    m_logger->info("Downloading v{} from `{}`", candidate.version.toString(), candidate.downloadUrl);
    cpr::Response response = m_httpManager.Download(archive.path(), cpr::Url{candidate.downloadUrl}, cancel);
    if (cancel.isCancelled()) {
        return fail(result, "Cancelled");
    }
    if (!HttpManager::IsSuccess(response)) {
        std::string reason = response.error.message.empty()
            ? "HTTP status " + std::to_string(response.status_code)
            : response.error.message;
        return fail(result, "Download of " + candidate.downloadUrl + " failed: " + reason);
    }

    if (candidate.md5) {
        std::string actualMd5 = Utils::calculateFileMD5(archive.path());
        if (actualMd5.empty()) {
            return fail(result, "MD5 calculation failed for " + archive.path().string());
        }
        if (actualMd5 != *candidate.md5) {
            return fail(result, "MD5 mismatch for " + candidate.downloadUrl + ". Expected: " + *candidate.md5 + ", Actual: " + actualMd5);
        }
        m_logger->debug("MD5 verified: {}", actualMd5);
    }

    Utils::ZipFile zip(archive.path());
    if (!zip.extractEntry(m_config.driverExecutableName, staged.path())) {
        return fail(result, "Extracting " + m_config.driverExecutableName + " failed: " + zip.getLastError());
    }

#if !defined(_WIN32) && !defined(_WIN64)
    std::filesystem::permissions(staged.path(),
        std::filesystem::perms::owner_exec | std::filesystem::perms::group_exec | std::filesystem::perms::others_exec,
        std::filesystem::perm_options::add, ec);
    if (ec) {
        m_logger->warn("Could not mark {} executable: {}", staged.path().string(), ec.message());
    }
#endif

    std::filesystem::rename(staged.path(), driverPath, ec);
    if (ec) {
        return fail(result, "Cannot replace " + driverPath.string() + ": " + ec.message());
    }

    m_logger->info("Installed ChromeDriver v{} at {}", candidate.version.toString(), driverPath.string());
    result.status = InstallStatus::Installed;
    result.message = "Installed ChromeDriver v" + candidate.version.toString();
    return result;
}

} // namespace DriverFetch
