// src/Sources/DriverSource.cpp
#include <DriverFetch/Sources/DriverSource.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/HttpManager.hpp>
#include <DriverFetch/Utils/Logger.hpp>

namespace DriverFetch {

DriverSource::DriverSource(std::string name, HttpManager& httpManager)
    : m_httpManager(httpManager), m_name(std::move(name)) {
    m_logger = Utils::Logger::GetOrCreateLogger(m_name);
}

std::vector<DriverCandidate> DriverSource::fetchCandidates(const Utils::CancellationToken& cancel) {
    try {
        std::vector<DriverCandidate> candidates = fetch(cancel);
        m_logger->info("{} candidate(s) from {}", candidates.size(), m_name);
        return candidates;
    } catch (const std::exception& e) {
        m_logger->error("{} error: {}", m_name, e.what());
        return {};
    }
}

std::string DriverSource::fetchText(const std::string& url, const Utils::CancellationToken& cancel) {
    if (cancel.isCancelled()) {
        throw SourceError("cancelled before request to " + url);
    }
    cpr::Response response = m_httpManager.Get(cpr::Url{url}, cancel);
    if (!HttpManager::IsSuccess(response)) {
        std::string reason = response.error.message.empty()
            ? "HTTP status " + std::to_string(response.status_code)
            : response.error.message;
        throw SourceError("request to " + url + " failed: " + reason);
    }
    return response.text;
}

} // namespace DriverFetch
