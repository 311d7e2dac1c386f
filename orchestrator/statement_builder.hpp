// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// SQL text composition. Every identifier passed in must already be quoted
// by sql_safe::quote_identifier and every type validated by
// sql_safe::validate_data_type; values never appear in the text.
namespace orchestrator {

    inline constexpr const char* SURROGATE_KEY_COLUMN = "\"id\" SERIAL PRIMARY KEY";
    inline constexpr size_t QUERY_ROW_LIMIT = 10;

    // (quoted column name, type literal)
    using column_definitions = std::vector<std::pair<std::string, std::string>>;

    std::string build_create_table(const std::string& quoted_table, const column_definitions& columns);
    std::string build_insert(const std::string& quoted_table, const std::vector<std::string>& quoted_columns);
    std::string build_select_all(const std::string& quoted_table, size_t limit = QUERY_ROW_LIMIT);
    std::string build_drop_table(const std::string& quoted_table);

} // namespace orchestrator
