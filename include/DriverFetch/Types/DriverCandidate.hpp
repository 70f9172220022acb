// include/DriverFetch/Types/DriverCandidate.hpp
#ifndef DRIVER_CANDIDATE_HPP
#define DRIVER_CANDIDATE_HPP

#include <DriverFetch/Types/VersionNumber.hpp>
#include <optional>
#include <string>
#include <vector>

namespace DriverFetch {

    struct DriverCandidate {
        VersionNumber version;
        std::string downloadUrl;
        std::string source;              // Name of the DriverSource that produced it
        std::optional<std::string> md5;  // Lowercase hex digest, when the upstream listing advertises one

        std::string toString() const { return version.toString() + " - " + downloadUrl; }
    };

    // Index listing results first, catalog results second; no deduplication.
    using CandidatePool = std::vector<DriverCandidate>;

} // namespace DriverFetch

#endif // DRIVER_CANDIDATE_HPP
