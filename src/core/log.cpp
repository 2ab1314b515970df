/// @file log.cpp
/// @brief Named spdlog loggers sharing one set of sinks

#include <onca_engine/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace onca_core {

namespace {

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

// Canonical names first; `log_level_name` returns the first match
constexpr std::array<LevelName, 11> LEVEL_NAMES{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"verbose", spdlog::level::trace},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
}};

struct LoggerRegistry {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    bool sinks_built = false;
    spdlog::level::level_enum level = spdlog::level::info;
    /// Loggers created here; their sinks follow `configure_logging`
    std::map<std::string, std::shared_ptr<spdlog::logger>> owned;
    /// Loggers the host registered with spdlog before asking for them
    std::map<std::string, std::shared_ptr<spdlog::logger>> adopted;
};

LoggerRegistry& registry() {
    static LoggerRegistry reg;
    return reg;
}

std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        const auto path = std::filesystem::path(config.log_directory) / "onca.log";
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), config.max_file_size,
                config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file '{}': {}", path.string(), e.what());
        }
    }
    return sinks;
}

// Caller holds the registry mutex
const std::vector<spdlog::sink_ptr>& shared_sinks(LoggerRegistry& reg) {
    if (!reg.sinks_built) {
        reg.sinks = build_sinks(LogConfig{});
        reg.sinks_built = true;
    }
    return reg.sinks;
}

template <typename F>
void for_each_logger(LoggerRegistry& reg, F&& func) {
    for (auto& [name, logger] : reg.owned) {
        func(*logger);
    }
    for (auto& [name, logger] : reg.adopted) {
        func(*logger);
    }
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.sinks = build_sinks(config);
    reg.sinks_built = true;
    reg.level = config.level;

    for (auto& [name, logger] : reg.owned) {
        logger->sinks() = reg.sinks;
        logger->set_level(reg.level);
    }
    for (auto& [name, logger] : reg.adopted) {
        logger->set_level(reg.level);
    }
    spdlog::set_level(reg.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.owned.find(name); it != reg.owned.end()) {
        return it->second;
    }
    if (auto it = reg.adopted.find(name); it != reg.adopted.end()) {
        return it->second;
    }

    if (auto existing = spdlog::get(name)) {
        reg.adopted.emplace(name, existing);
        return existing;
    }

    const auto& sinks = shared_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.level);
    spdlog::register_logger(logger);
    reg.owned.emplace(name, logger);
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("onca_core");
    return logger;
}

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = level;
    for_each_logger(reg, [level](spdlog::logger& logger) { logger.set_level(level); });
    spdlog::set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.owned.find(name); it != reg.owned.end()) {
        it->second->set_level(level);
    } else if (auto adopted = reg.adopted.find(name); adopted != reg.adopted.end()) {
        adopted->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const LevelName& entry : LEVEL_NAMES) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const LevelName& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "unknown";
}

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for_each_logger(reg, [](spdlog::logger& logger) { logger.flush(); });
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for_each_logger(reg, [](spdlog::logger& logger) { spdlog::drop(logger.name()); });
    reg.owned.clear();
    reg.adopted.clear();
    reg.sinks.clear();
    reg.sinks_built = false;

    spdlog::shutdown();
}

} // namespace onca_core
