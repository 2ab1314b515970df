#pragma once

/// @file settings.hpp
/// @brief RAL settings, parsed from a json document
///
/// Schema:
/// @code
/// {
///   "common": { "api": "vulkan" },
///   "debug": { "enable": true, "validation": true, "log-level": "warning" },
///   "vulkan": { ... forwarded to the backend ... }
/// }
/// @endcode

#include "fwd.hpp"
#include "common.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace onca_ral {

/// Native API a RAL backend implements
enum class RalApi : std::uint8_t {
    Dx12,
    Vulkan,
    Software,
    /// Custom backend, resolved to `onca_ral_<name>`
    Other,
};

/// Verbosity of backend debug messages
enum class DebugLogLevel : std::uint8_t {
    Verbose,
    Info,
    Warning,
    Error,
};

[[nodiscard]] const char* ral_api_name(RalApi api);
[[nodiscard]] const char* debug_log_level_name(DebugLogLevel level);

/// Map a debug log level onto the spdlog level backends log at
[[nodiscard]] spdlog::level::level_enum to_spdlog_level(DebugLogLevel level);

/// Render abstraction layer settings
struct Settings {
    RalApi api = RalApi::Vulkan;
    /// Api name, as written in the settings document
    std::string api_name = "vulkan";

    bool debug_enabled = false;
    bool debug_validation = false;
    bool debug_performance = false;
    bool debug_gbv = false;
    bool debug_gbv_state_tracking = false;
    bool debug_dcqs = false;
    bool debug_auto_naming = false;
    DebugLogLevel debug_log_level = DebugLogLevel::Error;

    /// Table named after the api, forwarded opaquely to the backend
    nlohmann::json api_specific = nlohmann::json::object();

    /// Build settings from a json document
    [[nodiscard]] static Result<Settings> from_json(const nlohmann::json& j);

    /// Parse settings from json text
    [[nodiscard]] static Result<Settings> parse(const std::string& text);

    /// Settings for a given api with all debug options off
    [[nodiscard]] static Settings for_api(const std::string& api);

    /// Base name of the backend module, without directory or extension
    [[nodiscard]] std::string module_name() const;

    /// Serialize back to the json schema
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace onca_ral
