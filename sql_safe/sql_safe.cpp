// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "sql_safe.hpp"

#include "types/errors.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <optional>

namespace sql_safe {

    namespace {
        using types::error_kind;
        using types::service_error;

        // Not exhaustive, see the namespace comment
        constexpr std::array<std::string_view, 15> RESERVED_WORDS = {"SELECT",
                                                                      "INSERT",
                                                                      "UPDATE",
                                                                      "DELETE",
                                                                      "CREATE",
                                                                      "DROP",
                                                                      "TABLE",
                                                                      "ALTER",
                                                                      "WHERE",
                                                                      "FROM",
                                                                      "USER",
                                                                      "GRANT",
                                                                      "PUBLIC",
                                                                      "GROUP",
                                                                      "BY"};

        bool is_ascii_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

        bool is_ascii_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        char to_upper(char c) noexcept { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

        bool is_blank(std::string_view raw) noexcept { return std::all_of(raw.begin(), raw.end(), is_space); }

        std::string_view trim(std::string_view text) noexcept {
            while (!text.empty() && is_space(text.front())) {
                text.remove_prefix(1);
            }
            while (!text.empty() && is_space(text.back())) {
                text.remove_suffix(1);
            }
            return text;
        }

        std::optional<int64_t> parse_integer(std::string_view text) {
            if (!text.empty() && text.front() == '+') {
                text.remove_prefix(1);
                if (!text.empty() && text.front() == '-') {
                    return std::nullopt;
                }
            }
            if (text.empty()) {
                return std::nullopt;
            }
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<bool> parse_boolean(std::string_view text) noexcept {
            if (iequals(text, "true")) {
                return true;
            }
            if (iequals(text, "false")) {
                return false;
            }
            return std::nullopt;
        }

        // Reads exactly `width` digits starting at `pos`
        std::optional<unsigned> read_fixed(std::string_view text, std::size_t pos, std::size_t width) {
            if (pos + width > text.size()) {
                return std::nullopt;
            }
            unsigned value = 0;
            for (std::size_t i = pos; i < pos + width; ++i) {
                if (!is_ascii_digit(text[i])) {
                    return std::nullopt;
                }
                value = value * 10 + static_cast<unsigned>(text[i] - '0');
            }
            return value;
        }

        // YYYY-MM-DD[( |T)HH:MM[:SS[.f{1,6}]]]
        std::optional<types::timestamp_t> parse_timestamp(std::string_view text) {
            using namespace std::chrono;

            auto y = read_fixed(text, 0, 4);
            auto mo = read_fixed(text, 5, 2);
            auto d = read_fixed(text, 8, 2);
            if (!y || !mo || !d || text[4] != '-' || text[7] != '-') {
                return std::nullopt;
            }
            year_month_day ymd{year{static_cast<int>(*y)}, month{*mo}, day{*d}};
            if (!ymd.ok()) {
                return std::nullopt;
            }
            types::timestamp_t result{sys_days{ymd}};
            if (text.size() == 10) {
                return result;
            }

            if (text[10] != ' ' && text[10] != 'T') {
                return std::nullopt;
            }
            auto h = read_fixed(text, 11, 2);
            auto mi = read_fixed(text, 14, 2);
            if (!h || !mi || text[13] != ':' || *h > 23 || *mi > 59) {
                return std::nullopt;
            }
            result += hours{*h} + minutes{*mi};
            if (text.size() == 16) {
                return result;
            }

            auto s = read_fixed(text, 17, 2);
            if (!s || text[16] != ':' || *s > 59) {
                return std::nullopt;
            }
            result += seconds{*s};
            if (text.size() == 19) {
                return result;
            }

            auto fraction = text.substr(19);
            if (fraction.size() < 2 || fraction.size() > 7 || fraction.front() != '.') {
                return std::nullopt;
            }
            auto digits = read_fixed(fraction, 1, fraction.size() - 1);
            if (!digits) {
                return std::nullopt;
            }
            unsigned micros = *digits;
            for (std::size_t i = fraction.size() - 1; i < 6; ++i) {
                micros *= 10;
            }
            return result + microseconds{micros};
        }
    } // namespace

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return to_upper(a) == to_upper(b); });
    }

    bool is_valid_identifier(std::string_view raw) noexcept {
        if (raw.empty() || raw.size() > MAX_IDENTIFIER_LENGTH) {
            return false;
        }
        if (!is_ascii_alpha(raw.front()) && raw.front() != '_') {
            return false;
        }
        return std::all_of(raw.begin() + 1, raw.end(), [](char c) {
            return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_';
        });
    }

    bool is_reserved_word(std::string_view raw) noexcept {
        return std::any_of(RESERVED_WORDS.begin(), RESERVED_WORDS.end(), [raw](std::string_view word) {
            return iequals(word, raw);
        });
    }

    std::string quote_identifier(std::string_view raw) {
        if (is_blank(raw)) {
            throw service_error(error_kind::InvalidIdentifier, "Identifier cannot be empty.");
        }
        if (!is_valid_identifier(raw)) {
            throw service_error(error_kind::InvalidIdentifier,
                                "Invalid identifier format: '" + std::string(raw) +
                                    "'. Only letters, digits and underscores are allowed, it must not start with a "
                                    "digit and must be at most 51 characters long.");
        }
        if (is_reserved_word(raw)) {
            throw service_error(error_kind::ReservedWord,
                                "Invalid identifier: '" + std::string(raw) + "' is a reserved SQL keyword.");
        }
        std::string quoted;
        quoted.reserve(raw.size() + 2);
        quoted += '"';
        quoted += raw;
        quoted += '"';
        return quoted;
    }

    std::string validate_data_type(std::string_view raw) {
        auto allowed = [](char c) { return is_ascii_alpha(c) || is_ascii_digit(c) || c == '(' || c == ')'; };
        if (is_blank(raw) || !std::all_of(raw.begin(), raw.end(), allowed)) {
            throw service_error(error_kind::InvalidDataType, "Invalid data type: '" + std::string(raw) + "'");
        }
        return std::string(raw);
    }

    types::cell_value infer_value(std::string_view text) {
        auto trimmed = trim(text);
        if (auto value = parse_integer(trimmed); value) {
            return *value;
        }
        if (auto value = parse_boolean(trimmed); value) {
            return *value;
        }
        if (auto value = parse_timestamp(trimmed); value) {
            return *value;
        }
        return std::string(text);
    }

} // namespace sql_safe
