// src/HttpManager.cpp
#include <DriverFetch/HttpManager.hpp>
#include <DriverFetch/Config.hpp>
#include <DriverFetch/Utils/Logger.hpp>
#include <fstream>

namespace DriverFetch {

HttpManager::HttpManager(const Config& config)
    : m_timeout(config.httpTimeout), m_userAgent(config.userAgent) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
    // System CA store; peer and host are always verified.
    m_sslOptions = cpr::Ssl(
        cpr::ssl::VerifyHost{true},
        cpr::ssl::VerifyPeer{true}
    );
    m_logger->debug("HttpManager initialized. Timeout: {} ms, User-Agent: {}",
                    config.httpTimeout.count(), config.userAgent);
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

bool HttpManager::IsSuccess(const cpr::Response& response) {
    return response.error.code == cpr::ErrorCode::OK &&
           response.status_code >= 200 && response.status_code < 300;
}

void HttpManager::ConfigureSession(cpr::Session& session, const cpr::Url& url, const Utils::CancellationToken* cancel) const {
    session.SetUrl(url);
    session.SetSslOptions(m_sslOptions);
    session.SetTimeout(m_timeout);
    session.SetUserAgent(m_userAgent);
    if (cancel != nullptr) {
        Utils::CancellationToken token = *cancel;
        // Returning false from the progress callback makes curl abort the transfer.
        session.SetProgressCallback(cpr::ProgressCallback{
            [token](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
                return !token.isCancelled();
            }});
    }
}

cpr::Response HttpManager::Get(const cpr::Url& url, const Utils::CancellationToken& cancel) {
    m_logger->trace("GET: {}", url.str());
    cpr::Session session;
    ConfigureSession(session, url, &cancel);
    cpr::Response response = session.Get();

    if (!IsSuccess(response)) {
        m_logger->error("GET failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
    } else {
        m_logger->debug("GET {} -> {} ({} bytes)", url.str(), response.status_code, response.text.size());
    }
    return response;
}

cpr::Response HttpManager::Download(const std::filesystem::path& filepath, const cpr::Url& url,
                                    const Utils::CancellationToken& cancel) {
    m_logger->info("DOWNLOAD to file: {} -> {}", url.str(), filepath.string());
    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        cpr::Response r_fail;
        r_fail.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        r_fail.error.message = "HttpManager::Download: Failed to open file for writing: " + filepath.string();
        r_fail.status_code = 0;
        m_logger->error("{}", r_fail.error.message);
        return r_fail;
    }

    cpr::Session session;
    ConfigureSession(session, url, &cancel);
    cpr::Response response = session.Download(file_stream);
    file_stream.close();

    if (!IsSuccess(response)) {
        m_logger->error("Download to file failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
        std::error_code ec;
        if (std::filesystem::remove(filepath, ec)) {
            m_logger->debug("Removed partially downloaded file: {}", filepath.string());
        } else if (ec) {
            m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
        }
    } else {
        m_logger->info("Download to file successful for {} to {}. Size: {}", url.str(), filepath.string(), response.downloaded_bytes);
    }
    return response;
}

cpr::Response HttpManager::GetVerbose(const cpr::Url& url) {
    m_logger->trace("VERBOSE GET: {}", url.str());
    cpr::Session session;
    ConfigureSession(session, url, nullptr);
    session.SetVerbose(cpr::Verbose{true});
    return session.Get();
}

} // namespace DriverFetch
