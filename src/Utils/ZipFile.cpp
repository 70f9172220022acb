// src/Utils/ZipFile.cpp
#include <DriverFetch/Utils/Logger.hpp>
#include <DriverFetch/Utils/ZipFile.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

#include <algorithm>
#include <cctype>

namespace DriverFetch::Utils {

    namespace {

        std::string entryBaseName(const std::string &entryName) {
            std::string::size_type sep = entryName.find_last_of("/\\");
            return sep == std::string::npos ? entryName : entryName.substr(sep + 1);
        }

        bool equalsIgnoreCase(const std::string &a, const std::string &b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }

    } // namespace

    ZipFile::ZipFile(const std::filesystem::path &archivePath) : m_archivePath(archivePath), m_zipReader(nullptr) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            setError("Failed to create zip reader instance.");
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            if (m_isOpen) {
                mz_zip_reader_close(m_zipReader);
            }
            mz_zip_reader_delete(&m_zipReader);
            m_logger->trace("[{}] Zip reader deleted.", m_archivePath.filename().string());
        }
    }

    void ZipFile::setError(const std::string &message) {
        m_lastErrorMsg = message;
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        setError(context + ": minizip-ng error " + std::to_string(err));
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            return false; // constructor already recorded the error
        }
        if (m_isOpen) {
            return true;
        }

        m_logger->debug("[{}] Opening archive...", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file");
            return false;
        }
        m_isOpen = true;
        return true;
    }

    bool ZipFile::isOpen() const {
        return m_zipReader != nullptr && m_isOpen && mz_zip_reader_is_open(m_zipReader) == MZ_OK;
    }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    std::vector<std::string> ZipFile::entryNames() {
        std::vector<std::string> names;
        if (!open()) {
            return names;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        while (err == MZ_OK) {
            mz_zip_file *file_info = nullptr;
            // file_info is owned by the reader
            if (mz_zip_reader_entry_get_info(m_zipReader, &file_info) == MZ_OK && file_info && file_info->filename) {
                names.emplace_back(file_info->filename);
            }
            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }
        if (err != MZ_END_OF_LIST) {
            logMzError(err, "An error occurred during entry traversal");
        }
        return names;
    }

    bool ZipFile::extractEntry(const std::string &fileName, const std::filesystem::path &outputPath) {
        if (!open()) {
            return false;
        }

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        while (err == MZ_OK) {
            mz_zip_file *file_info = nullptr;
            err = mz_zip_reader_entry_get_info(m_zipReader, &file_info);
            if (err != MZ_OK || !file_info || !file_info->filename) {
                logMzError(err, "Failed to get entry info");
                return false;
            }

            std::string entryName = file_info->filename;
            if (mz_zip_reader_entry_is_dir(m_zipReader) != MZ_OK && equalsIgnoreCase(entryBaseName(entryName), fileName)) {
                m_logger->debug("[{}] Matched entry '{}' for '{}'", m_archivePath.filename().string(), entryName, fileName);

                std::error_code ec;
                std::filesystem::path parent_dir = outputPath.parent_path();
                if (!parent_dir.empty()) {
                    std::filesystem::create_directories(parent_dir, ec);
                    if (ec) {
                        setError("Failed to create directory " + parent_dir.string() + ": " + ec.message());
                        return false;
                    }
                }
                // Always replace an existing file.
                std::filesystem::remove(outputPath, ec);
                if (ec) {
                    setError("Failed to remove existing file " + outputPath.string() + ": " + ec.message());
                    return false;
                }

                err = mz_zip_reader_entry_save_file(m_zipReader, outputPath.string().c_str());
                if (err != MZ_OK) {
                    logMzError(err, "Failed to save entry " + entryName + " to " + outputPath.string());
                    return false;
                }
                m_logger->info("[{}] Extracted {} to {}", m_archivePath.filename().string(), entryName, outputPath.string());
                return true;
            }

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err == MZ_END_OF_LIST) {
            setError("No entry named '" + fileName + "' in archive");
        } else {
            logMzError(err, "An error occurred during entry traversal");
        }
        return false;
    }

} // namespace DriverFetch::Utils
