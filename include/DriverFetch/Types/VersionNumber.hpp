// include/DriverFetch/Types/VersionNumber.hpp
#ifndef VERSION_NUMBER_HPP
#define VERSION_NUMBER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace DriverFetch {

    // major.minor.build.revision, missing trailing components are 0.
    class VersionNumber {
    public:
        VersionNumber() = default;
        VersionNumber(uint32_t major, uint32_t minor = 0, uint32_t build = 0, uint32_t revision = 0);

        /**
         * @brief Parses 1 to 4 dot-separated decimal components ("114", "114.0.5735.90").
         * @throws InvalidVersionFormat on an empty or non-numeric segment, a value that does
         *         not fit in 32 bits, or a segment count outside 1..4.
         */
        static VersionNumber parse(const std::string& text);

        // Same rules as parse(), without the exception.
        static std::optional<VersionNumber> tryParse(const std::string& text);

        uint32_t major() const { return m_major; }
        uint32_t minor() const { return m_minor; }
        uint32_t build() const { return m_build; }
        uint32_t revision() const { return m_revision; }

        // Always four components.
        std::string toString() const;

        bool operator==(const VersionNumber& other) const;
        bool operator!=(const VersionNumber& other) const { return !(*this == other); }
        bool operator<(const VersionNumber& other) const;
        bool operator>(const VersionNumber& other) const { return other < *this; }
        bool operator<=(const VersionNumber& other) const { return !(other < *this); }
        bool operator>=(const VersionNumber& other) const { return !(*this < other); }

    private:
        uint32_t m_major = 0;
        uint32_t m_minor = 0;
        uint32_t m_build = 0;
        uint32_t m_revision = 0;
    };

    std::ostream& operator<<(std::ostream& os, const VersionNumber& version);

} // namespace DriverFetch

#endif // VERSION_NUMBER_HPP
