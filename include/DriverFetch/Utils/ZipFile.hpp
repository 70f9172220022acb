// include/DriverFetch/Utils/ZipFile.hpp
#ifndef ZIP_FILE_UTIL_HPP
#define ZIP_FILE_UTIL_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace DriverFetch::Utils {

    // Read-only view over a zip archive backed by minizip-ng.
    class ZipFile {
    public:
        explicit ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Attempts to open the zip file. Returns true on success.
        bool open();
        bool isOpen() const;

        // Names of all entries, directories included, in archive order.
        std::vector<std::string> entryNames();

        // Extracts the first non-directory entry whose file name (the part after the last
        // separator) equals fileName, ignoring case. outputPath is overwritten.
        // Returns false when no entry matches or extraction fails; see getLastError().
        bool extractEntry(const std::string &fileName, const std::filesystem::path &outputPath);

        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // mz_zip_reader handle
        bool m_isOpen = false;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        void logMzError(int32_t err, const std::string &context);
        void setError(const std::string &message);
    };

} // namespace DriverFetch::Utils

#endif // ZIP_FILE_UTIL_HPP
