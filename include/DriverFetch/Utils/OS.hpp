// include/DriverFetch/Utils/OS.hpp
#ifndef OS_UTIL_HPP
#define OS_UTIL_HPP

#include <filesystem>
#include <string>

namespace DriverFetch {
    namespace Utils {

        enum class OperatingSystem {
            WINDOWS,
            MACOS,
            LINUX,
            UNKNOWN
        };

        enum class Architecture {
            X86,        // 32-bit x86
            X64,        // 64-bit x86_64/amd64
            ARM64,      // 64-bit ARM (aarch64)
            ARM32,      // 32-bit ARM
            UNKNOWN
        };

        OperatingSystem getCurrentOS();
        Architecture getCurrentArch();

        // Suffix platform in the legacy bucket listing, e.g. "linux64" for chromedriver_linux64.zip
        std::string getIndexPlatform(OperatingSystem os, Architecture arch);

        // Platform id in the Chrome for Testing catalog, e.g. "mac-arm64"
        std::string getCatalogPlatform(OperatingSystem os, Architecture arch);

        // chromedriver.exe on Windows, chromedriver elsewhere
        std::string getDriverExecutableName(OperatingSystem os);

        // %APPDATA%, ~/Library/Application Support or $XDG_DATA_HOME (~/.local/share).
        // Falls back to the current directory when none can be determined.
        std::filesystem::path getUserDataDirectory();

    } // namespace Utils
} // namespace DriverFetch

#endif //OS_UTIL_HPP
