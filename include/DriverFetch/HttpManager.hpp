// include/DriverFetch/HttpManager.hpp
#ifndef HTTP_MANAGER_HPP
#define HTTP_MANAGER_HPP

#include <DriverFetch/Utils/Cancellation.hpp>
#include <cpr/cpr.h>
#include <filesystem>
#include <memory>
#include <spdlog/logger.h>

namespace DriverFetch {

    struct Config;

    // One cpr::Session per request, so a single instance can be shared across threads.
    // Methods are virtual so tests can serve canned payloads.
    class HttpManager {
    public:
        explicit HttpManager(const Config& config);
        virtual ~HttpManager();

        virtual cpr::Response Get(const cpr::Url& url, const Utils::CancellationToken& cancel = {});

        // Writes the body to filepath (truncating). On failure the partial file is removed.
        virtual cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url,
                                       const Utils::CancellationToken& cancel = {});

        // curl verbose output on stderr, for troubleshooting TLS and proxies
        cpr::Response GetVerbose(const cpr::Url& url);

        // No transport error and a 2xx status
        static bool IsSuccess(const cpr::Response& response);

    protected:
        std::shared_ptr<spdlog::logger> m_logger;

    private:
        cpr::SslOptions m_sslOptions;
        cpr::Timeout m_timeout;
        cpr::UserAgent m_userAgent;

        void ConfigureSession(cpr::Session& session, const cpr::Url& url, const Utils::CancellationToken* cancel) const;
    };

} // namespace DriverFetch

#endif // HTTP_MANAGER_HPP
