// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "logger.hpp"

#include <chrono>
#include <string>

// Logs the lifetime of a scope at debug level
class Timer {
public:
    Timer(log_t log, std::string name = "")
        : log_{std::move(log)}
        , name_{std::move(name)} {
        start();
    }
    ~Timer() { log_->debug("[{}] Total time elapsed: {}ms", name_, elapsed()); }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void timePoint(const std::string& sub_name = "") {
        log_->debug("[{}] [{}] Time elapsed: {}ms", name_, sub_name, elapsed());
    }

private:
    void start() { start_point_ = std::chrono::steady_clock::now(); }
    long long elapsed() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_point_);
        return duration.count();
    }

private:
    log_t log_;
    std::string name_;
    std::chrono::time_point<std::chrono::steady_clock> start_point_;
};
