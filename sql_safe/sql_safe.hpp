// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "types/cell_value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

// Turns untrusted names into SQL text fragments.
//
// The identifier grammar is the security boundary: a name that passes it can
// contain neither quote characters, whitespace nor statement punctuation.
// The reserved word list is a second, deliberately incomplete layer.
// Pure functions, safe to call from any thread.
namespace sql_safe {

    inline constexpr std::size_t MAX_IDENTIFIER_LENGTH = 51;

    // Throws service_error(InvalidIdentifier | ReservedWord).
    // Returns the name wrapped in double quotes, otherwise untouched.
    std::string quote_identifier(std::string_view raw);

    // Throws service_error(InvalidDataType).
    // Returns the type literal verbatim, it is never quoted.
    std::string validate_data_type(std::string_view raw);

    bool is_valid_identifier(std::string_view raw) noexcept;
    bool is_reserved_word(std::string_view raw) noexcept;

    // Case-insensitive ASCII comparison, used for registry name checks
    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    // Typing for values that arrive as text: integer, then boolean,
    // then date/time, then the original text.
    types::cell_value infer_value(std::string_view text);

} // namespace sql_safe
