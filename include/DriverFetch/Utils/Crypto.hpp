// include/DriverFetch/Utils/Crypto.hpp
#ifndef CRYPTO_UTIL_HPP
#define CRYPTO_UTIL_HPP

#include <filesystem>
#include <string>

namespace DriverFetch {
    namespace Utils {

        /**
         * @brief Calculates the MD5 digest of a file, the checksum the legacy bucket listing publishes as ETag.
         * @param filePath The path to the file.
         * @return Lowercase hex digest. Empty string on error (file not readable, OpenSSL failure).
         */
        std::string calculateFileMD5(const std::filesystem::path& filePath);

        // True for exactly 32 hex digits, the shape of a single-part upload ETag.
        bool isMD5HexDigest(const std::string& text);

    } // namespace Utils
} // namespace DriverFetch

#endif //CRYPTO_UTIL_HPP
