// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "statement_builder.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string_view>

namespace orchestrator {

    std::string build_create_table(const std::string& quoted_table, const column_definitions& columns) {
        std::string sql = "CREATE TABLE " + quoted_table + " (";
        sql += SURROGATE_KEY_COLUMN;
        for (const auto& [name, type] : columns) {
            sql += ", ";
            sql += name;
            sql += ' ';
            sql += type;
        }
        sql += ')';
        return sql;
    }

    std::string build_insert(const std::string& quoted_table, const std::vector<std::string>& quoted_columns) {
        std::vector<std::string_view> markers(quoted_columns.size(), "?");
        return fmt::format("INSERT INTO {} ({}) VALUES ({})",
                           quoted_table,
                           fmt::join(quoted_columns, ", "),
                           fmt::join(markers, ", "));
    }

    std::string build_select_all(const std::string& quoted_table, size_t limit) {
        return fmt::format("SELECT * FROM {} LIMIT {}", quoted_table, limit);
    }

    std::string build_drop_table(const std::string& quoted_table) { return "DROP TABLE " + quoted_table; }

} // namespace orchestrator
