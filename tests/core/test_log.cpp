// onca_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <onca_engine/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

using namespace onca_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("canonical names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("error") == spdlog::level::err);
        REQUIRE(parse_log_level("critical") == spdlog::level::critical);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("aliases") {
        REQUIRE(parse_log_level("verbose") == spdlog::level::trace);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    }

    SECTION("unknown") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names round trip") {
        REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
        REQUIRE(parse_log_level(log_level_name(spdlog::level::warn)) == spdlog::level::warn);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("onca_test_named");
        auto b = get_logger("onca_test_named");
        REQUIRE(a != nullptr);
        REQUIRE(a == b);
        REQUIRE(a->name() == "onca_test_named");
    }

    SECTION("core logger") {
        REQUIRE(core_logger()->name() == "onca_core");
        REQUIRE(core_logger() == get_logger("onca_core"));
    }

    SECTION("logger registered by the host is reused") {
        std::ostringstream oss;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
        auto host_logger = std::make_shared<spdlog::logger>("onca_test_host", sink);
        spdlog::register_logger(host_logger);

        auto logger = get_logger("onca_test_host");
        REQUIRE(logger == host_logger);

        logger->set_level(spdlog::level::info);
        logger->info("adapter {} selected", 2);
        logger->flush();
        REQUIRE(oss.str().find("adapter 2 selected") != std::string::npos);
    }
}

TEST_CASE("Log level management", "[core][log]") {
    const auto previous = get_global_log_level();

    SECTION("global level applies to registered loggers") {
        auto logger = get_logger("onca_test_levels");
        set_global_log_level(spdlog::level::err);
        REQUIRE(get_global_log_level() == spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
        REQUIRE_FALSE(logger->should_log(spdlog::level::warn));
    }

    SECTION("per-logger level") {
        auto logger = get_logger("onca_test_single");
        set_logger_level("onca_test_single", spdlog::level::trace);
        REQUIRE(logger->should_log(spdlog::level::trace));
    }

    set_global_log_level(previous);
}

TEST_CASE("Logging configuration", "[core][log]") {
    const auto dir = std::filesystem::temp_directory_path() / "onca_log_config_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.log_directory = dir.string();
    config.level = spdlog::level::debug;

    auto before = get_logger("onca_test_config_before");
    configure_logging(config);
    auto after = get_logger("onca_test_config_after");

    SECTION("existing and new loggers share the file") {
        REQUIRE(get_global_log_level() == spdlog::level::debug);
        REQUIRE(before->level() == spdlog::level::debug);

        before->debug("written before");
        after->info("written after");
        flush_all_loggers();

        std::ifstream file(dir / "onca.log");
        REQUIRE(file.is_open());
        const std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(text.find("[onca_test_config_before] written before") != std::string::npos);
        REQUIRE(text.find("[onca_test_config_after] written after") != std::string::npos);
    }

    SECTION("levels below the configured one are dropped") {
        after->trace("not written");
        flush_all_loggers();

        std::ifstream file(dir / "onca.log");
        const std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(text.find("not written") == std::string::npos);
    }

    configure_logging(LogConfig{});
    std::filesystem::remove_all(dir);
}
