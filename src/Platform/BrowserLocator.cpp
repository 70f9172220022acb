// src/Platform/BrowserLocator.cpp
#include <DriverFetch/Platform/BrowserLocator.hpp>
#include <DriverFetch/Utils/Logger.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace DriverFetch {

NativeBrowserLocator::NativeBrowserLocator() {
    m_logger = Utils::Logger::GetOrCreateLogger("BrowserLocator");
}

#if defined(_WIN32) || defined(_WIN64)

namespace {

    const wchar_t* kChromeAppPathKey = L"Software\\Microsoft\\Windows\\CurrentVersion\\App Paths\\chrome.exe";

    std::optional<std::filesystem::path> readDefaultValue(HKEY root) {
        DWORD size = 0;
        LSTATUS status = RegGetValueW(root, kChromeAppPathKey, nullptr, RRF_RT_REG_SZ, nullptr, nullptr, &size);
        if (status != ERROR_SUCCESS || size == 0) {
            return std::nullopt;
        }
        std::wstring value(size / sizeof(wchar_t), L'\0');
        status = RegGetValueW(root, kChromeAppPathKey, nullptr, RRF_RT_REG_SZ, nullptr, value.data(), &size);
        if (status != ERROR_SUCCESS) {
            return std::nullopt;
        }
        value.resize(wcsnlen(value.c_str(), value.size()));
        if (value.empty()) {
            return std::nullopt;
        }
        return std::filesystem::path(value);
    }

} // namespace

std::optional<std::filesystem::path> NativeBrowserLocator::findDefaultBrowserPath() {
    for (HKEY root : {HKEY_LOCAL_MACHINE, HKEY_CURRENT_USER}) {
        std::optional<std::filesystem::path> path = readDefaultValue(root);
        if (path) {
            m_logger->debug("Registry App Paths entry: {}", path->string());
            return path;
        }
    }
    m_logger->warn("chrome.exe is not registered under App Paths");
    return std::nullopt;
}

#else

namespace {

    bool isExecutableFile(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    }

    std::optional<std::filesystem::path> searchPath(const std::vector<std::string>& names) {
        const char* pathEnv = std::getenv("PATH");
        if (pathEnv == nullptr) {
            return std::nullopt;
        }
        std::string paths = pathEnv;
        for (const auto& name : names) {
            std::string::size_type start = 0;
            while (start <= paths.size()) {
                std::string::size_type colon = paths.find(':', start);
                std::string dir = paths.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
                if (!dir.empty()) {
                    std::filesystem::path candidate = std::filesystem::path(dir) / name;
                    if (isExecutableFile(candidate)) {
                        return candidate;
                    }
                }
                if (colon == std::string::npos) break;
                start = colon + 1;
            }
        }
        return std::nullopt;
    }

} // namespace

std::optional<std::filesystem::path> NativeBrowserLocator::findDefaultBrowserPath() {
#if defined(__APPLE__)
    std::vector<std::filesystem::path> bundles = {"/Applications/Google Chrome.app/Contents/MacOS/Google Chrome"};
    if (const char* home = std::getenv("HOME")) {
        bundles.push_back(std::filesystem::path(home) / "Applications/Google Chrome.app/Contents/MacOS/Google Chrome");
    }
    for (const auto& bundle : bundles) {
        if (isExecutableFile(bundle)) {
            m_logger->debug("Found Chrome app bundle: {}", bundle.string());
            return bundle;
        }
    }
#endif
    std::optional<std::filesystem::path> found =
        searchPath({"google-chrome", "google-chrome-stable", "chromium", "chromium-browser"});
    if (found) {
        m_logger->debug("Found browser on PATH: {}", found->string());
    } else {
        m_logger->warn("No Chrome or Chromium executable found");
    }
    return found;
}

#endif

} // namespace DriverFetch
