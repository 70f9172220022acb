// src/Utils/TempFile.cpp
#include <DriverFetch/Utils/TempFile.hpp>
#include <DriverFetch/Utils/Logger.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace DriverFetch::Utils {

    namespace {
        std::atomic<unsigned> s_sequence{0};
    }

    ScopedTempFile::ScopedTempFile(const std::filesystem::path &directory, const std::string &extension) {
        // file_yyyyMMdd_HHmmssfff_<n><extension>
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm utc{};
#if defined(_WIN32)
        gmtime_s(&utc, &seconds);
#else
        gmtime_r(&seconds, &utc);
#endif
        std::ostringstream name;
        name << "file_" << std::put_time(&utc, "%Y%m%d_%H%M%S") << std::setw(3) << std::setfill('0') << millis
             << "_" << s_sequence.fetch_add(1) << extension;
        m_path = directory / name.str();
    }

    ScopedTempFile::~ScopedTempFile() {
        std::error_code ec;
        if (std::filesystem::remove(m_path, ec)) {
            CORE_LOG_TRACE("Removed temporary file: {}", m_path.string());
        } else if (ec) {
            CORE_LOG_WARN("Failed to remove temporary file {}: {}", m_path.string(), ec.message());
        }
    }

} // namespace DriverFetch::Utils
