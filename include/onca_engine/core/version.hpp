#pragma once

/// @file version.hpp
/// @brief Semantic versioning for onca_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <string>
#include <sstream>
#include <optional>
#include <compare>
#include <functional>

namespace onca_core {

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

    /// Parse version string "major.minor.patch" or "major.minor"
    [[nodiscard]] static std::optional<Version> parse(const std::string& s) {
        Version v;
        char dot1, dot2;
        std::istringstream iss(s);

        if (iss >> v.major >> dot1 >> v.minor >> dot2 >> v.patch) {
            if (dot1 == '.' && dot2 == '.') {
                return v;
            }
        }

        iss.clear();
        iss.str(s);
        v.patch = 0;
        if (iss >> v.major >> dot1 >> v.minor) {
            if (dot1 == '.') {
                return v;
            }
        }

        return std::nullopt;
    }

    /// Parse "x.y.z" treating missing or malformed parts as 0
    [[nodiscard]] static Version parse_lenient(const std::string& s);

    /// Convert to packed 64-bit value
    [[nodiscard]] constexpr std::uint64_t to_u64() const noexcept {
        return (static_cast<std::uint64_t>(major) << 32) |
               (static_cast<std::uint64_t>(minor) << 16) |
               static_cast<std::uint64_t>(patch);
    }

    /// Convert to string
    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    constexpr auto operator<=>(const Version&) const noexcept = default;
    constexpr bool operator==(const Version&) const noexcept = default;
};

/// Output stream operator
inline std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << v.major << '.' << v.minor << '.' << v.patch;
}

/// Get the onca_core module version
Version onca_core_version();

/// Parse version with optional prerelease/build metadata
Result<Version> parse_version_extended(const std::string& str);

} // namespace onca_core

/// Hash specialization
template<>
struct std::hash<onca_core::Version> {
    std::size_t operator()(const onca_core::Version& v) const noexcept {
        return std::hash<std::uint64_t>{}(v.to_u64());
    }
};
