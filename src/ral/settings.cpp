/// @file settings.cpp
/// @brief RAL settings parsing

#include <onca_engine/ral/settings.hpp>

namespace onca_ral {

namespace {

struct DebugFlag {
    const char* key;
    bool Settings::* field;
};

constexpr DebugFlag DEBUG_FLAGS[] = {
    {"enable", &Settings::debug_enabled},
    {"validation", &Settings::debug_validation},
    {"performance", &Settings::debug_performance},
    {"gpu-based-validation", &Settings::debug_gbv},
    {"gbv-state-tracking", &Settings::debug_gbv_state_tracking},
    {"dcqs", &Settings::debug_dcqs},
    {"auto-naming", &Settings::debug_auto_naming},
};

RalApi api_from_name(const std::string& name) {
    if (name == "dx12") return RalApi::Dx12;
    if (name == "vulkan") return RalApi::Vulkan;
    if (name == "software") return RalApi::Software;
    return RalApi::Other;
}

Result<DebugLogLevel> parse_debug_log_level(const std::string& str) {
    if (str == "verbose") return DebugLogLevel::Verbose;
    if (str == "info") return DebugLogLevel::Info;
    if (str == "warning") return DebugLogLevel::Warning;
    if (str == "error") return DebugLogLevel::Error;
    return Error(onca_core::ErrorCode::ParseError, "Unknown debug log level '" + str + "'");
}

} // anonymous namespace

const char* ral_api_name(RalApi api) {
    switch (api) {
        case RalApi::Dx12: return "dx12";
        case RalApi::Vulkan: return "vulkan";
        case RalApi::Software: return "software";
        case RalApi::Other: return "other";
        default: return "unknown";
    }
}

const char* debug_log_level_name(DebugLogLevel level) {
    switch (level) {
        case DebugLogLevel::Verbose: return "verbose";
        case DebugLogLevel::Info: return "info";
        case DebugLogLevel::Warning: return "warning";
        case DebugLogLevel::Error: return "error";
        default: return "unknown";
    }
}

spdlog::level::level_enum to_spdlog_level(DebugLogLevel level) {
    switch (level) {
        case DebugLogLevel::Verbose: return spdlog::level::trace;
        case DebugLogLevel::Info: return spdlog::level::info;
        case DebugLogLevel::Warning: return spdlog::level::warn;
        case DebugLogLevel::Error: return spdlog::level::err;
        default: return spdlog::level::err;
    }
}

Result<Settings> Settings::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(onca_core::ErrorCode::ParseError, "RAL settings must be an object");
    }

    Settings settings;

    auto common = j.find("common");
    if (common == j.end() || !common->is_object() || !common->contains("api") || !(*common)["api"].is_string()) {
        ral_logger()->error("No api specified");
        return Error(onca_core::ErrorCode::ParseError, "No api specified");
    }
    settings.api_name = (*common)["api"].get<std::string>();
    settings.api = api_from_name(settings.api_name);

    auto debug = j.find("debug");
    if (debug != j.end()) {
        if (!debug->is_object()) {
            return Error(onca_core::ErrorCode::ParseError, "'debug' must be a table");
        }
        for (const auto& flag : DEBUG_FLAGS) {
            auto it = debug->find(flag.key);
            if (it == debug->end()) {
                continue;
            }
            if (!it->is_boolean()) {
                return Error(onca_core::ErrorCode::ParseError, std::string("'debug.") + flag.key + "' must be a boolean");
            }
            settings.*flag.field = it->get<bool>();
        }

        auto level = debug->find("log-level");
        if (level != debug->end()) {
            if (!level->is_string()) {
                return Error(onca_core::ErrorCode::ParseError, "'debug.log-level' must be a string");
            }
            auto parsed = parse_debug_log_level(level->get<std::string>());
            if (!parsed) {
                return parsed.error();
            }
            settings.debug_log_level = *parsed;
        }
    }

    auto api_table = j.find(settings.api_name);
    if (api_table != j.end() && api_table->is_object()) {
        settings.api_specific = *api_table;
    }

    return settings;
}

Result<Settings> Settings::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Error(onca_core::ErrorCode::ParseError, "Failed to parse RAL settings: " + std::string(e.what()));
    }
    return from_json(j);
}

Settings Settings::for_api(const std::string& api) {
    Settings settings;
    settings.api_name = api;
    settings.api = api_from_name(api);
    return settings;
}

std::string Settings::module_name() const {
    switch (api) {
        case RalApi::Dx12: return "onca_ral_dx12";
        case RalApi::Vulkan: return "onca_ral_vulkan";
        case RalApi::Software: return "onca_ral_software";
        default: return "onca_ral_" + api_name;
    }
}

nlohmann::json Settings::to_json() const {
    nlohmann::json j;
    j["common"]["api"] = api_name;

    nlohmann::json debug = nlohmann::json::object();
    for (const auto& flag : DEBUG_FLAGS) {
        debug[flag.key] = this->*flag.field;
    }
    debug["log-level"] = debug_log_level_name(debug_log_level);
    j["debug"] = std::move(debug);

    j[api_name] = api_specific;
    return j;
}

} // namespace onca_ral
