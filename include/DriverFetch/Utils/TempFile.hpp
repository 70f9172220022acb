// include/DriverFetch/Utils/TempFile.hpp
#ifndef TEMP_FILE_UTIL_HPP
#define TEMP_FILE_UTIL_HPP

#include <filesystem>
#include <string>

namespace DriverFetch::Utils {

    // Owns a uniquely named path inside a directory and deletes whatever is there on destruction.
    // The file itself is not created.
    class ScopedTempFile {
    public:
        ScopedTempFile(const std::filesystem::path &directory, const std::string &extension = ".tmp");
        ~ScopedTempFile();

        ScopedTempFile(const ScopedTempFile &) = delete;
        ScopedTempFile &operator=(const ScopedTempFile &) = delete;

        const std::filesystem::path &path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

} // namespace DriverFetch::Utils

#endif // TEMP_FILE_UTIL_HPP
