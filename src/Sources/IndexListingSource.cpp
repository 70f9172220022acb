// src/Sources/IndexListingSource.cpp
#include <DriverFetch/Sources/IndexListingSource.hpp>
#include <DriverFetch/Errors.hpp>
#include <DriverFetch/Utils/Crypto.hpp>

#include <algorithm>
#include <cctype>

namespace DriverFetch {

namespace {

    const std::string kKeyOpen = "<Key>";
    const std::string kKeyClose = "</Key>";
    const std::string kETagOpen = "<ETag>";
    const std::string kETagClose = "</ETag>";

    bool endsWithIgnoreCase(const std::string& text, const std::string& suffix) {
        if (suffix.size() > text.size()) return false;
        return std::equal(suffix.rbegin(), suffix.rend(), text.rbegin(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    }

    // ETag of the object described between two <Key> tags, if it is a plain MD5.
    std::optional<std::string> findMd5(const std::string& region) {
        std::string::size_type open = region.find(kETagOpen);
        if (open == std::string::npos) return std::nullopt;
        open += kETagOpen.size();
        std::string::size_type close = region.find(kETagClose, open);
        if (close == std::string::npos) return std::nullopt;

        std::string etag = region.substr(open, close - open);
        for (const std::string quote : {"&quot;", "\""}) {
            std::string::size_type at;
            while ((at = etag.find(quote)) != std::string::npos) {
                etag.erase(at, quote.size());
            }
        }
        std::transform(etag.begin(), etag.end(), etag.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!Utils::isMD5HexDigest(etag)) return std::nullopt; // multipart uploads use "<md5>-<n>"
        return etag;
    }

} // namespace

IndexListingSource::IndexListingSource(HttpManager& httpManager, std::string baseUrl, std::string platform)
    : DriverSource("GoogleApis", httpManager), m_baseUrl(std::move(baseUrl)) {
    if (!m_baseUrl.empty() && m_baseUrl.back() != '/') {
        m_baseUrl += '/';
    }
    if (!platform.empty()) {
        m_suffix = "_" + platform + ".zip";
    }
}

std::vector<DriverCandidate> IndexListingSource::fetch(const Utils::CancellationToken& cancel) {
    if (m_suffix.empty()) {
        throw SourceError("no platform suffix configured for this system");
    }
    // Only the first listing page is read; <IsTruncated>/<NextMarker> are not followed.
    m_logger->debug("Fetching bucket listing from {}", m_baseUrl);
    return parseListing(fetchText(m_baseUrl, cancel));
}

std::vector<DriverCandidate> IndexListingSource::parseListing(const std::string& listing) const {
    std::vector<DriverCandidate> candidates;
    size_t skipped = 0;

    std::string::size_type pos = 0;
    while (true) {
        std::string::size_type open = listing.find(kKeyOpen, pos);
        if (open == std::string::npos) break;
        std::string::size_type keyStart = open + kKeyOpen.size();
        std::string::size_type close = listing.find(kKeyClose, keyStart);
        if (close == std::string::npos) break;

        std::string key = listing.substr(keyStart, close - keyStart);
        pos = close + kKeyClose.size();

        if (!endsWithIgnoreCase(key, m_suffix)) {
            continue;
        }

        std::string versionText = key.substr(0, key.find('/'));
        std::optional<VersionNumber> version = VersionNumber::tryParse(versionText);
        if (!version) {
            m_logger->warn("Skipping listing key '{}': '{}' is not a version", key, versionText);
            ++skipped;
            continue;
        }

        std::string::size_type nextKey = listing.find(kKeyOpen, pos);
        std::string region = listing.substr(pos, nextKey == std::string::npos ? std::string::npos : nextKey - pos);

        DriverCandidate candidate;
        candidate.version = *version;
        candidate.downloadUrl = m_baseUrl + key;
        candidate.source = name();
        candidate.md5 = findMd5(region);
        candidates.push_back(std::move(candidate));
    }

    m_logger->debug("Listing scan: {} matching key(s) for suffix '{}', {} skipped", candidates.size(), m_suffix, skipped);
    return candidates;
}

} // namespace DriverFetch
