/// @file version.cpp
/// @brief Version utilities implementation for onca_core

#include <onca_engine/core/version.hpp>
#include <charconv>
#include <regex>

namespace onca_core {

static constexpr Version ONCA_CORE_VERSION = Version{0, 1, 0};

Version onca_core_version() {
    return ONCA_CORE_VERSION;
}

Version Version::parse_lenient(const std::string& s) {
    std::uint16_t parts[3] = {0, 0, 0};
    std::size_t start = 0;
    for (int i = 0; i < 3 && start <= s.size(); ++i) {
        std::size_t end = s.find('.', start);
        if (end == std::string::npos) {
            end = s.size();
        }
        std::uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(s.data() + start, s.data() + end, value);
        parts[i] = (ec == std::errc() && ptr == s.data() + end) ? value : 0;
        if (end == s.size()) {
            break;
        }
        start = end + 1;
    }
    return Version{parts[0], parts[1], parts[2]};
}

/// Format: major.minor.patch[-prerelease][+build]
Result<Version> parse_version_extended(const std::string& str) {
    auto simple = Version::parse(str);
    if (simple.has_value()) {
        return Ok(simple.value());
    }

    std::regex version_regex(R"(^(\d+)\.(\d+)\.(\d+)(?:-[a-zA-Z0-9.]+)?(?:\+[a-zA-Z0-9.]+)?$)");
    std::smatch match;

    if (!std::regex_match(str, match, version_regex)) {
        return Err<Version>(Error(ErrorCode::ParseError, "Invalid version format: " + str));
    }

    std::uint16_t values[3];
    for (int i = 0; i < 3; ++i) {
        const std::string part = match[i + 1].str();
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), values[i]);
        if (ec != std::errc()) {
            return Err<Version>(Error(ErrorCode::ParseError, "Version number overflow: " + str));
        }
    }
    return Ok(Version{values[0], values[1], values[2]});
}

} // namespace onca_core
