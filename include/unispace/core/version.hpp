#pragma once

/// @file version.hpp
/// @brief Semantic versioning for unispace (library and model format)

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <string>
#include <sstream>
#include <optional>
#include <compare>
#include <ostream>

namespace unispace_core {

// =============================================================================
// Version
// =============================================================================

/// Semantic version (major.minor.patch)
struct Version {
    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    std::uint16_t patch = 0;

    constexpr Version() noexcept = default;

    constexpr Version(std::uint16_t maj, std::uint16_t min, std::uint16_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    /// Check compatibility with another version
    /// Pre-1.0: minor must match exactly
    /// Post-1.0: major must match, self >= other in minor/patch
    [[nodiscard]] constexpr bool is_compatible_with(const Version& other) const noexcept {
        if (major == 0 && other.major == 0) {
            return minor == other.minor && patch >= other.patch;
        }
        return major == other.major &&
               (minor > other.minor || (minor == other.minor && patch >= other.patch));
    }

    /// Parse version string "major.minor.patch" or "major.minor"
    [[nodiscard]] static std::optional<Version> parse(const std::string& s) {
        Version v;
        char dot1 = 0, dot2 = 0;
        std::istringstream iss(s);

        if (iss >> v.major >> dot1 >> v.minor >> dot2 >> v.patch) {
            if (dot1 == '.' && dot2 == '.' && iss.peek() == std::char_traits<char>::eof()) {
                return v;
            }
        }

        iss.clear();
        iss.str(s);
        v.patch = 0;
        if (iss >> v.major >> dot1 >> v.minor) {
            if (dot1 == '.' && iss.peek() == std::char_traits<char>::eof()) {
                return v;
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    constexpr auto operator<=>(const Version&) const noexcept = default;
    constexpr bool operator==(const Version&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << v.major << '.' << v.minor << '.' << v.patch;
}

// =============================================================================
// Library and Format Versions (Implemented in version.cpp)
// =============================================================================

/// Version of the unispace library
Version library_version();

/// Version of the JSON model format written by this library
Version model_format_version();

/// Parse a version string, reporting malformed input as a ParseError
Result<Version> parse_version(const std::string& str);

} // namespace unispace_core
