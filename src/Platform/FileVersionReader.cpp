// src/Platform/FileVersionReader.cpp
#include <DriverFetch/Platform/FileVersionReader.hpp>
#include <DriverFetch/Utils/Logger.hpp>

#include <array>
#include <cstdio>
#include <regex>

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#include <vector>
#endif

namespace DriverFetch {

std::optional<std::string> findVersionToken(const std::string& text) {
    static const std::regex versionPattern(R"((^|[^0-9A-Za-z.])([0-9]+(\.[0-9]+){1,3})(?![0-9A-Za-z.]))");
    std::smatch match;
    if (std::regex_search(text, match, versionPattern)) {
        return match[2].str();
    }
    return std::nullopt;
}

NativeFileVersionReader::NativeFileVersionReader() {
    m_logger = Utils::Logger::GetOrCreateLogger("FileVersion");
}

#if defined(_WIN32) || defined(_WIN64)

std::optional<std::string> NativeFileVersionReader::readVersion(const std::filesystem::path& file) {
    std::wstring widePath = file.wstring();
    DWORD handle = 0;
    DWORD size = GetFileVersionInfoSizeW(widePath.c_str(), &handle);
    if (size == 0) {
        m_logger->debug("No version resource in {} (error {})", file.string(), GetLastError());
        return std::nullopt;
    }

    std::vector<BYTE> data(size);
    if (!GetFileVersionInfoW(widePath.c_str(), 0, size, data.data())) {
        m_logger->warn("GetFileVersionInfoW failed for {} (error {})", file.string(), GetLastError());
        return std::nullopt;
    }

    VS_FIXEDFILEINFO* info = nullptr;
    UINT length = 0;
    if (!VerQueryValueW(data.data(), L"\\", reinterpret_cast<LPVOID*>(&info), &length) || info == nullptr || length == 0) {
        m_logger->warn("No fixed file info in {}", file.string());
        return std::nullopt;
    }

    std::string version = std::to_string(HIWORD(info->dwFileVersionMS)) + "." +
                          std::to_string(LOWORD(info->dwFileVersionMS)) + "." +
                          std::to_string(HIWORD(info->dwFileVersionLS)) + "." +
                          std::to_string(LOWORD(info->dwFileVersionLS));
    m_logger->debug("{} has file version {}", file.string(), version);
    return version;
}

#else

std::optional<std::string> NativeFileVersionReader::readVersion(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        m_logger->debug("{} is not a regular file", file.string());
        return std::nullopt;
    }

    // Single-quote the path for /bin/sh; embedded quotes become '\''
    std::string quoted = "'";
    for (char c : file.string()) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    std::string command = quoted + " --version 2>/dev/null";

    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        m_logger->warn("Could not run {}", command);
        return std::nullopt;
    }
    std::string output;
    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        output += buffer.data();
    }
    int status = pclose(pipe);
    if (status != 0) {
        m_logger->warn("'{} --version' exited with status {}", file.string(), status);
    }

    std::optional<std::string> version = findVersionToken(output);
    if (version) {
        m_logger->debug("{} reports version {}", file.string(), *version);
    } else {
        m_logger->warn("No version in output of '{} --version': {:.200}", file.string(), output);
    }
    return version;
}

#endif

} // namespace DriverFetch
