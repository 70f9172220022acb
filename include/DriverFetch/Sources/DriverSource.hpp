// include/DriverFetch/Sources/DriverSource.hpp
#ifndef DRIVER_SOURCE_HPP
#define DRIVER_SOURCE_HPP

#include <DriverFetch/Types/DriverCandidate.hpp>
#include <DriverFetch/Utils/Cancellation.hpp>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace DriverFetch {

    class HttpManager;

    // One upstream catalog of driver downloads.
    class DriverSource {
    public:
        DriverSource(std::string name, HttpManager& httpManager);
        virtual ~DriverSource() = default;

        const std::string& name() const { return m_name; }

        // Never throws: any failure is logged and yields an empty list, so one broken
        // upstream cannot take the other one down with it.
        std::vector<DriverCandidate> fetchCandidates(const Utils::CancellationToken& cancel);

    protected:
        // May throw; fetchCandidates() absorbs it.
        virtual std::vector<DriverCandidate> fetch(const Utils::CancellationToken& cancel) = 0;

        // Body of a successful GET. Throws SourceError otherwise.
        std::string fetchText(const std::string& url, const Utils::CancellationToken& cancel);

        HttpManager& m_httpManager;
        std::shared_ptr<spdlog::logger> m_logger;

    private:
        std::string m_name;
    };

} // namespace DriverFetch

#endif // DRIVER_SOURCE_HPP
