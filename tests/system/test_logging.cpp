// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "utility/logger.hpp"
#include "utility/timer.hpp"

#include <catch2/catch.hpp>
#include <filesystem>
#include <iostream>

TEST_CASE("logging is configured", "[.skip]") {
    auto prefix = std::filesystem::temp_directory_path() / "dynamico_logging_test";
    initialize_all_loggers(prefix.string(), spdlog::level::debug);
    auto log = get_logger(logger_tag::TABLE_SERVICE);

    // Emit a couple of log lines at common levels
    log->info("LoggingTest: info message");
    log->error("LoggingTest: error message");
    {
        Timer timer(log, "LoggingTest");
        timer.timePoint("halfway");
    }

    // Also print a marker to stdout so test output is easy to spot
    std::cout << "LoggingTest: cout marker" << std::endl;

    CHECK(std::filesystem::exists(prefix));
    CHECK(get_logger(logger_tag::TABLE_SERVICE) == log);
}
