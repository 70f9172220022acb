// include/DriverFetch/Platform/BrowserLocator.hpp
#ifndef BROWSER_LOCATOR_HPP
#define BROWSER_LOCATOR_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/logger.h>

namespace DriverFetch {

    // Finds the default Chrome installation when no explicit path is given.
    class BrowserLocator {
    public:
        virtual ~BrowserLocator() = default;
        virtual std::optional<std::filesystem::path> findDefaultBrowserPath() = 0;
    };

    // Windows: App Paths\chrome.exe registry value (HKLM, then HKCU).
    // macOS: the Google Chrome app bundle, then PATH.
    // Linux: google-chrome, google-chrome-stable, chromium, chromium-browser on PATH.
    class NativeBrowserLocator : public BrowserLocator {
    public:
        NativeBrowserLocator();
        std::optional<std::filesystem::path> findDefaultBrowserPath() override;

    private:
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace DriverFetch

#endif // BROWSER_LOCATOR_HPP
