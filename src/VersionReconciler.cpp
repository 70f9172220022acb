// src/VersionReconciler.cpp
#include <DriverFetch/VersionReconciler.hpp>
#include <DriverFetch/Utils/Logger.hpp>

#include <future>

namespace DriverFetch {

VersionReconciler::VersionReconciler() {
    m_logger = Utils::Logger::GetOrCreateLogger("Reconciler");
}

void VersionReconciler::addSource(std::unique_ptr<DriverSource> source) {
    m_logger->trace("Registered source {}", source->name());
    m_sources.push_back(std::move(source));
}

CandidatePool VersionReconciler::collectCandidates(const Utils::CancellationToken& cancel) {
    std::vector<std::future<std::vector<DriverCandidate>>> pending;
    pending.reserve(m_sources.size());
    for (auto& source : m_sources) {
        DriverSource* raw = source.get();
        pending.push_back(std::async(std::launch::async, [raw, cancel]() {
            return raw->fetchCandidates(cancel);
        }));
    }

    // Joined in registration order, whichever finished first.
    CandidatePool pool;
    for (size_t i = 0; i < pending.size(); ++i) {
        std::vector<DriverCandidate> found = pending[i].get();
        pool.insert(pool.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    m_logger->info("Candidate pool holds {} driver(s) from {} source(s)", pool.size(), m_sources.size());
    return pool;
}

int VersionReconciler::score(const VersionNumber& candidate, const VersionNumber& requested) {
    if (candidate.major() != requested.major()) return kUnranked;
    if (candidate == requested) return 0;
    if (candidate.minor() != requested.minor()) return 3;
    if (candidate.build() != requested.build()) return 2;
    return 1;
}

std::optional<DriverCandidate> VersionReconciler::match(const CandidatePool& pool, const VersionNumber& requested) {
    const DriverCandidate* best = nullptr;
    int bestScore = kUnranked;

    for (const auto& candidate : pool) {
        if (candidate.version.major() != requested.major()) {
            continue;
        }
        int candidateScore = score(candidate.version, requested);
        // Strictly better only, so the first of equals stays.
        if (best == nullptr || candidateScore < bestScore) {
            best = &candidate;
            bestScore = candidateScore;
            if (bestScore == 0) break;
        }
    }

    if (best == nullptr) {
        CORE_LOG_DEBUG("[Reconciler] No candidate shares major {} among {} candidate(s)", requested.major(), pool.size());
        return std::nullopt;
    }
    CORE_LOG_DEBUG("[Reconciler] Best match for {} is {} (tier {}, {})", requested.toString(),
                   best->version.toString(), bestScore, best->source);
    return *best;
}

} // namespace DriverFetch
