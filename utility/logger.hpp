// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

using log_t = std::shared_ptr<spdlog::logger>;

namespace logger_tag {
    inline constexpr std::string_view CONNECTOR = "Connector";
    inline constexpr std::string_view CONNECTOR_MANAGER = "ConnectorManager";
    inline constexpr std::string_view OWNERSHIP_REGISTRY = "OwnershipRegistry";
    inline constexpr std::string_view TABLE_SERVICE = "TableService";
    inline constexpr std::string_view HTTP_SERVER = "HttpServer";
    inline constexpr std::string_view CONSOLE = "Console";
} // namespace logger_tag

inline constexpr std::string_view LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v";

namespace detail {
    inline std::mutex& logger_registry_mutex() {
        static std::mutex m;
        return m;
    }
} // namespace detail

// Named logger for a component. Components constructed before
// initialize_all_loggers (tests, tools) get a stdout-only logger.
inline log_t get_logger(std::string_view tag) {
    std::lock_guard<std::mutex> lk(detail::logger_registry_mutex());
    if (auto log_ptr = spdlog::get(std::string(tag)); log_ptr) {
        return log_ptr;
    }
    auto logger = spdlog::stdout_color_mt(std::string(tag));
    logger->set_pattern(std::string(LOG_PATTERN));
    return logger;
}

inline log_t initialize_logger(std::string name, std::string prefix, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lk(detail::logger_registry_mutex());
    if (auto log_ptr = spdlog::get(name); log_ptr) {
        // prevent creating two loggers with same name
        log_ptr->set_level(level);
        return log_ptr;
    }

    std::filesystem::create_directories(prefix);
    if (prefix.back() != '/') {
        prefix += '/';
    }

    using namespace std::chrono;
    auto dtn = system_clock::now().time_since_epoch();

    auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true);
    std::vector<spdlog::sink_ptr> sinks{stdout_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());

    spdlog::flush_every(std::chrono::seconds(1));
    logger->set_pattern(std::string(LOG_PATTERN));
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

inline void initialize_all_loggers(const std::string& prefix, spdlog::level::level_enum level = spdlog::level::info) {
    static constexpr std::array<std::string_view, 6> all_loggers = {
        logger_tag::CONNECTOR,
        logger_tag::CONNECTOR_MANAGER,
        logger_tag::OWNERSHIP_REGISTRY,
        logger_tag::TABLE_SERVICE,
        logger_tag::HTTP_SERVER,
        logger_tag::CONSOLE,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix, level);
    }
}
