#pragma once

#include <cstdint>
#include <string>

namespace hostext {
namespace core {

/**
 * @brief A semantic version number with major, minor, and patch components.
 *
 * Extension and manifest versions are written as text ("1", "1.2", "1.2.3",
 * optionally followed by a "-QUALIFIER" such as "-SNAPSHOT"). The qualifier
 * is accepted but does not take part in comparisons.
 */
struct Version {
    uint16_t major{0};
    uint16_t minor{0};
    uint16_t patch{0};

    Version() = default;
    Version(uint16_t maj, uint16_t min, uint16_t pat)
        : major(maj), minor(min), patch(pat) {}

    /**
     * @brief Parses a textual version.
     *
     * Missing minor or patch components default to zero.
     *
     * @param text Version text, e.g. "4.1.0" or "1.0-SNAPSHOT"
     * @return The parsed version
     * @throws std::invalid_argument if the text is not a valid version
     */
    static Version parse(const std::string& text);

    /**
     * @brief Checks whether parse() would accept the text.
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Checks if this version is newer than another version.
     */
    bool isNewerThan(const Version& other) const {
        return *this > other;
    }

    /**
     * @brief Creates a string representation of the version.
     *
     * @return A string in the format "major.minor.patch"
     */
    std::string toString() const {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }

    bool operator<(const Version& other) const {
        if (major != other.major) return major < other.major;
        if (minor != other.minor) return minor < other.minor;
        return patch < other.patch;
    }

    bool operator>(const Version& other) const {
        return other < *this;
    }

    bool operator==(const Version& other) const {
        return major == other.major &&
               minor == other.minor &&
               patch == other.patch;
    }

    bool operator!=(const Version& other) const {
        return !(*this == other);
    }

    bool operator<=(const Version& other) const {
        return !(other < *this);
    }

    bool operator>=(const Version& other) const {
        return !(*this < other);
    }
};

} // namespace core
} // namespace hostext
