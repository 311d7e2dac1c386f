// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace types {

    // Supplied by an upstream authenticator, trusted as-is
    struct caller_t {
        int32_t id = 0;
        bool privileged = false;
    };

    using deadline_t = std::chrono::steady_clock::time_point;
    using optional_deadline = std::optional<deadline_t>;

} // namespace types
