// include/DriverFetch/Platform/FileVersionReader.hpp
#ifndef FILE_VERSION_READER_HPP
#define FILE_VERSION_READER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace DriverFetch {

    // Reads the version a browser or driver executable reports about itself.
    class FileVersionReader {
    public:
        virtual ~FileVersionReader() = default;

        // Raw version text, std::nullopt when the file is missing or carries none.
        virtual std::optional<std::string> readVersion(const std::filesystem::path& file) = 0;
    };

    // Windows: VS_FIXEDFILEINFO of the PE version resource.
    // Elsewhere: runs "<file> --version" and takes the first dotted number it prints.
    class NativeFileVersionReader : public FileVersionReader {
    public:
        NativeFileVersionReader();
        std::optional<std::string> readVersion(const std::filesystem::path& file) override;

    private:
        std::shared_ptr<spdlog::logger> m_logger;
    };

    // First "a.b[.c[.d]]" token in text that is not glued to letters or digits,
    // e.g. "114.0.5735.90" from "ChromeDriver 114.0.5735.90 (386bc09e...)".
    std::optional<std::string> findVersionToken(const std::string& text);

} // namespace DriverFetch

#endif // FILE_VERSION_READER_HPP
