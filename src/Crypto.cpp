// src/Crypto.cpp
#include <DriverFetch/Utils/Crypto.hpp>
#include <DriverFetch/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace DriverFetch::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string calculateFileMD5(const std::filesystem::path &filePath) {
        CORE_LOG_TRACE("[Crypto] Calculating MD5 for file: {}", filePath.string());
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            CORE_LOG_ERROR("[Crypto] Could not open file for MD5 calculation: {}", filePath.string());
            return "";
        }

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!mdctx) {
            CORE_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for MD5 on file: {}", filePath.string());
            return "";
        }

        if (1 != EVP_DigestInit_ex(mdctx.get(), EVP_md5(), nullptr)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestInit_ex for MD5 failed on file: {}", filePath.string());
            return "";
        }

        constexpr size_t bufferSize = 64 * 1024;
        std::vector<char> buffer(bufferSize);

        while (file.good()) {
            file.read(buffer.data(), bufferSize);
            std::streamsize bytesRead = file.gcount();
            if (bytesRead > 0) {
                if (1 != EVP_DigestUpdate(mdctx.get(), buffer.data(), static_cast<size_t>(bytesRead))) {
                    CORE_LOG_ERROR("[Crypto] EVP_DigestUpdate failed for MD5 on file: {}", filePath.string());
                    return "";
                }
            }
        }
        if (file.bad()) {
            CORE_LOG_ERROR("[Crypto] Read error while hashing file: {}", filePath.string());
            return "";
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (1 != EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen)) {
            CORE_LOG_ERROR("[Crypto] EVP_DigestFinal_ex failed for MD5 on file: {}", filePath.string());
            return "";
        }

        std::string hexHash = bytesToHexString(hash, hashLen);
        CORE_LOG_TRACE("[Crypto] MD5 for {}: {}", filePath.string(), hexHash);
        return hexHash;
    }

    bool isMD5HexDigest(const std::string &text) {
        if (text.size() != 32) return false;
        for (unsigned char c : text) {
            if (!std::isxdigit(c)) return false;
        }
        return true;
    }

} // namespace DriverFetch::Utils
