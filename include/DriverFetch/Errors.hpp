// include/DriverFetch/Errors.hpp
#ifndef DRIVERFETCH_ERRORS_HPP
#define DRIVERFETCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace DriverFetch {

    // Version text with the wrong number of segments or a non-numeric segment.
    class InvalidVersionFormat : public std::runtime_error {
    public:
        explicit InvalidVersionFormat(const std::string& text, const std::string& reason)
            : std::runtime_error("Invalid version '" + text + "': " + reason), m_text(text) {}

        const std::string& text() const { return m_text; }

    private:
        std::string m_text;
    };

    // Neither an explicit path nor the platform lookup produced a browser executable.
    class BrowserNotFound : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The browser executable exists but carries no usable version.
    class VersionUnreadable : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Raised inside a source adapter; never leaves DriverSource::fetchCandidates.
    class SourceError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace DriverFetch

#endif // DRIVERFETCH_ERRORS_HPP
