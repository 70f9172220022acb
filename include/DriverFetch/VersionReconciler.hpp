// include/DriverFetch/VersionReconciler.hpp
#ifndef VERSION_RECONCILER_HPP
#define VERSION_RECONCILER_HPP

#include <DriverFetch/Sources/DriverSource.hpp>
#include <DriverFetch/Types/DriverCandidate.hpp>
#include <DriverFetch/Utils/Cancellation.hpp>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include <spdlog/logger.h>

namespace DriverFetch {

    class VersionReconciler {
    public:
        // Score for a candidate whose major differs; never selected.
        static constexpr int kUnranked = std::numeric_limits<int>::max();

        VersionReconciler();

        // Registration order fixes the pool order and therefore tie-breaking.
        void addSource(std::unique_ptr<DriverSource> source);

        // Queries every source concurrently and concatenates the results in registration order.
        CandidatePool collectCandidates(const Utils::CancellationToken& cancel = {});

        /**
         * @brief Picks the candidate closest to requested.
         *
         * Only candidates sharing the requested major are eligible. Lower score() wins and
         * equal scores resolve to the earliest candidate in the pool.
         * @return std::nullopt when no candidate shares the major.
         */
        static std::optional<DriverCandidate> match(const CandidatePool& pool, const VersionNumber& requested);

        // 0 exact, 1 major.minor.build, 2 major.minor, 3 major, kUnranked otherwise.
        static int score(const VersionNumber& candidate, const VersionNumber& requested);

    private:
        std::vector<std::unique_ptr<DriverSource>> m_sources;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace DriverFetch

#endif // VERSION_RECONCILER_HPP
