// src/OSUtil.cpp
#include <DriverFetch/Utils/OS.hpp>
#include <cstdlib>

namespace DriverFetch {
namespace Utils {

OperatingSystem getCurrentOS() {
    #if defined(_WIN32) || defined(_WIN64)
        return OperatingSystem::WINDOWS;
    #elif defined(__APPLE__) || defined(__MACH__)
        return OperatingSystem::MACOS;
    #elif defined(__linux__)
        return OperatingSystem::LINUX;
    #else
        return OperatingSystem::UNKNOWN;
    #endif
}

Architecture getCurrentArch() {
    #if defined(_M_AMD64) || defined(__amd64__) || defined(__x86_64__)
        return Architecture::X64;
    #elif defined(_M_IX86) || defined(__i386__)
        return Architecture::X86;
    #elif defined(__aarch64__) || defined(_M_ARM64)
        return Architecture::ARM64;
    #elif defined(__arm__)
        return Architecture::ARM32;
    #else
        return Architecture::UNKNOWN;
    #endif
}

std::string getIndexPlatform(OperatingSystem os, Architecture arch) {
    switch (os) {
        case OperatingSystem::WINDOWS:
            // The bucket only ever published a 32-bit Windows build.
            return "win32";
        case OperatingSystem::MACOS:
            if (arch == Architecture::ARM64) return "mac_arm64";
            return "mac64";
        case OperatingSystem::LINUX:
            if (arch == Architecture::X64) return "linux64";
            break;
        default:
            break;
    }
    return "";
}

std::string getCatalogPlatform(OperatingSystem os, Architecture arch) {
    switch (os) {
        case OperatingSystem::WINDOWS:
            if (arch == Architecture::X86) return "win32";
            return "win64";
        case OperatingSystem::MACOS:
            if (arch == Architecture::ARM64) return "mac-arm64";
            return "mac-x64";
        case OperatingSystem::LINUX:
            if (arch == Architecture::X64) return "linux64";
            break;
        default:
            break;
    }
    return "";
}

std::string getDriverExecutableName(OperatingSystem os) {
    return os == OperatingSystem::WINDOWS ? "chromedriver.exe" : "chromedriver";
}

std::filesystem::path getUserDataDirectory() {
    auto fromEnv = [](const char* name) -> std::filesystem::path {
        const char* value = std::getenv(name);
        return (value != nullptr && *value != '\0') ? std::filesystem::path(value) : std::filesystem::path();
    };

    switch (getCurrentOS()) {
        case OperatingSystem::WINDOWS: {
            std::filesystem::path appData = fromEnv("APPDATA");
            if (!appData.empty()) return appData;
            break;
        }
        case OperatingSystem::MACOS: {
            std::filesystem::path home = fromEnv("HOME");
            if (!home.empty()) return home / "Library" / "Application Support";
            break;
        }
        default: {
            std::filesystem::path xdg = fromEnv("XDG_DATA_HOME");
            if (!xdg.empty()) return xdg;
            std::filesystem::path home = fromEnv("HOME");
            if (!home.empty()) return home / ".local" / "share";
            break;
        }
    }
    return std::filesystem::current_path();
}

} // namespace Utils
} // namespace DriverFetch
