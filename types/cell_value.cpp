// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "cell_value.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace types {

    const cell_value& cell_at(const row_t& row, std::string_view column) {
        for (const auto& [name, value] : row) {
            if (name == column) {
                return value;
            }
        }
        throw std::out_of_range("Row has no column: " + std::string(column));
    }

    std::string_view kind_name(cell_kind kind) noexcept {
        switch (kind) {
            case cell_kind::NULL_VALUE:
                return "null";
            case cell_kind::INTEGER:
                return "integer";
            case cell_kind::BOOLEAN:
                return "boolean";
            case cell_kind::TIMESTAMP:
                return "timestamp";
            case cell_kind::TEXT:
                return "text";
        }
        return "unknown";
    }

    std::string format_timestamp(timestamp_t ts) {
        using namespace std::chrono;
        auto day_point = floor<days>(ts);
        year_month_day ymd{day_point};
        hh_mm_ss<microseconds> tod{ts - day_point};

        auto result = fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                                  static_cast<int>(ymd.year()),
                                  static_cast<unsigned>(ymd.month()),
                                  static_cast<unsigned>(ymd.day()),
                                  tod.hours().count(),
                                  tod.minutes().count(),
                                  tod.seconds().count());
        if (auto fraction = tod.subseconds().count(); fraction != 0) {
            result += fmt::format(".{:06}", fraction);
        }
        return result;
    }

    std::string to_string(const cell_value& value) {
        switch (kind_of(value)) {
            case cell_kind::NULL_VALUE:
                return "NULL";
            case cell_kind::INTEGER:
                return std::to_string(std::get<int64_t>(value));
            case cell_kind::BOOLEAN:
                return std::get<bool>(value) ? "true" : "false";
            case cell_kind::TIMESTAMP:
                return format_timestamp(std::get<timestamp_t>(value));
            case cell_kind::TEXT:
                return std::get<std::string>(value);
        }
        return {};
    }

} // namespace types
