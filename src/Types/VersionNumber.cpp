// src/Types/VersionNumber.cpp
#include <DriverFetch/Types/VersionNumber.hpp>
#include <DriverFetch/Errors.hpp>

#include <limits>
#include <tuple>
#include <vector>

namespace DriverFetch {

namespace {

    uint32_t parseComponent(const std::string& text, const std::string& segment) {
        if (segment.empty()) {
            throw InvalidVersionFormat(text, "empty component");
        }
        uint64_t value = 0;
        for (char c : segment) {
            if (c < '0' || c > '9') {
                throw InvalidVersionFormat(text, "component '" + segment + "' is not a non-negative integer");
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
            if (value > std::numeric_limits<uint32_t>::max()) {
                throw InvalidVersionFormat(text, "component '" + segment + "' is out of range");
            }
        }
        return static_cast<uint32_t>(value);
    }

} // namespace

VersionNumber::VersionNumber(uint32_t major, uint32_t minor, uint32_t build, uint32_t revision)
    : m_major(major), m_minor(minor), m_build(build), m_revision(revision) {}

VersionNumber VersionNumber::parse(const std::string& text) {
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (true) {
        std::string::size_type dot = text.find('.', start);
        segments.push_back(text.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    if (segments.size() > 4) {
        throw InvalidVersionFormat(text, "expected 1 to 4 components, got " + std::to_string(segments.size()));
    }

    uint32_t parts[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < segments.size(); ++i) {
        parts[i] = parseComponent(text, segments[i]);
    }
    return VersionNumber(parts[0], parts[1], parts[2], parts[3]);
}

std::optional<VersionNumber> VersionNumber::tryParse(const std::string& text) {
    try {
        return parse(text);
    } catch (const InvalidVersionFormat&) {
        return std::nullopt;
    }
}

std::string VersionNumber::toString() const {
    return std::to_string(m_major) + "." + std::to_string(m_minor) + "." +
           std::to_string(m_build) + "." + std::to_string(m_revision);
}

bool VersionNumber::operator==(const VersionNumber& other) const {
    return std::tie(m_major, m_minor, m_build, m_revision) ==
           std::tie(other.m_major, other.m_minor, other.m_build, other.m_revision);
}

bool VersionNumber::operator<(const VersionNumber& other) const {
    return std::tie(m_major, m_minor, m_build, m_revision) <
           std::tie(other.m_major, other.m_minor, other.m_build, other.m_revision);
}

std::ostream& operator<<(std::ostream& os, const VersionNumber& version) {
    return os << version.toString();
}

} // namespace DriverFetch
