// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace types {

    using timestamp_t = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

    // std::monostate is SQL NULL
    using cell_value = std::variant<std::monostate, int64_t, bool, timestamp_t, std::string>;

    enum class cell_kind : uint8_t
    {
        NULL_VALUE,
        INTEGER,
        BOOLEAN,
        TIMESTAMP,
        TEXT
    };

    inline cell_kind kind_of(const cell_value& value) noexcept { return static_cast<cell_kind>(value.index()); }

    inline bool is_null(const cell_value& value) noexcept { return std::holds_alternative<std::monostate>(value); }

    // Columns keep the order the engine returned them in
    using row_t = std::vector<std::pair<std::string, cell_value>>;
    using rows_t = std::vector<row_t>;

    // Throws std::out_of_range when the row has no such column
    const cell_value& cell_at(const row_t& row, std::string_view column);

    struct sql_param {
        std::string name;
        cell_value value;
    };

    using params_t = std::vector<sql_param>;

    struct statement_result {
        uint64_t affected_rows = 0;
        uint64_t last_insert_id = 0;
    };

    std::string_view kind_name(cell_kind kind) noexcept;

    // "YYYY-MM-DD HH:MM:SS[.ffffff]", fraction only when non-zero
    std::string format_timestamp(timestamp_t ts);

    // Human readable rendering, NULL is "NULL"
    std::string to_string(const cell_value& value);

} // namespace types
