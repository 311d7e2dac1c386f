// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "sql_safe/sql_safe.hpp"
#include "types/errors.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <random>
#include <string>

using types::error_kind;

namespace {
    error_kind quote_error(const std::string& raw) {
        try {
            sql_safe::quote_identifier(raw);
        } catch (const types::service_error& e) {
            return e.kind();
        }
        FAIL("quote_identifier accepted '" << raw << "'");
        return error_kind::StatementFailed;
    }

    error_kind data_type_error(const std::string& raw) {
        try {
            sql_safe::validate_data_type(raw);
        } catch (const types::service_error& e) {
            return e.kind();
        }
        FAIL("validate_data_type accepted '" << raw << "'");
        return error_kind::StatementFailed;
    }

    types::timestamp_t at(int y, unsigned m, unsigned d, int h = 0, int mi = 0, int s = 0, int us = 0) {
        using namespace std::chrono;
        return types::timestamp_t{sys_days{year{y} / month{m} / day{d}}} + hours{h} + minutes{mi} + seconds{s} +
               microseconds{us};
    }
} // namespace

TEST_CASE("sql_safe::quote_identifier wraps grammar conforming names") {
    CHECK(sql_safe::quote_identifier("contacts") == "\"contacts\"");
    CHECK(sql_safe::quote_identifier("_private") == "\"_private\"");
    CHECK(sql_safe::quote_identifier("Full_Name2") == "\"Full_Name2\"");
    CHECK(sql_safe::quote_identifier("selection") == "\"selection\"");
    CHECK(sql_safe::quote_identifier("by_") == "\"by_\"");

    std::string longest = "a" + std::string(50, 'b');
    CHECK(sql_safe::quote_identifier(longest) == "\"" + longest + "\"");
}

TEST_CASE("sql_safe::quote_identifier on random grammar conforming names") {
    const std::string first = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ_";
    const std::string rest = first + "0123456789";
    std::mt19937 gen(20260101);
    std::uniform_int_distribution<size_t> length(0, 50);

    for (int i = 0; i < 500; ++i) {
        std::string name(1, first[gen() % first.size()]);
        auto n = length(gen);
        for (size_t j = 0; j < n; ++j) {
            name += rest[gen() % rest.size()];
        }
        if (sql_safe::is_reserved_word(name)) {
            continue;
        }
        REQUIRE(sql_safe::quote_identifier(name) == "\"" + name + "\"");
    }
}

TEST_CASE("sql_safe::quote_identifier rejects names outside the grammar") {
    CHECK(quote_error("") == error_kind::InvalidIdentifier);
    CHECK(quote_error("   ") == error_kind::InvalidIdentifier);
    CHECK(quote_error("1table") == error_kind::InvalidIdentifier);
    CHECK(quote_error("bad;name") == error_kind::InvalidIdentifier);
    CHECK(quote_error("bad name") == error_kind::InvalidIdentifier);
    CHECK(quote_error("bad-name") == error_kind::InvalidIdentifier);
    CHECK(quote_error("quo\"te") == error_kind::InvalidIdentifier);
    CHECK(quote_error("back`tick") == error_kind::InvalidIdentifier);
    CHECK(quote_error("t; DROP TABLE users") == error_kind::InvalidIdentifier);
    CHECK(quote_error(" padded") == error_kind::InvalidIdentifier);
    CHECK(quote_error("caf\xC3\xA9") == error_kind::InvalidIdentifier);
    CHECK(quote_error("a" + std::string(51, 'b')) == error_kind::InvalidIdentifier);
}

TEST_CASE("sql_safe::quote_identifier rejects reserved words in any case") {
    for (const std::string word : {"select", "SELECT", "Select", "sElEcT", "drop", "Table", "user", "by", "Group",
                                   "public", "grant", "where", "from", "alter", "insert", "update", "delete",
                                   "create"}) {
        INFO(word);
        CHECK(quote_error(word) == error_kind::ReservedWord);
        CHECK(sql_safe::is_valid_identifier(word));
    }
}

TEST_CASE("sql_safe::validate_data_type") {
    SECTION("type literals are returned verbatim") {
        CHECK(sql_safe::validate_data_type("INT") == "INT");
        CHECK(sql_safe::validate_data_type("VARCHAR(100)") == "VARCHAR(100)");
        CHECK(sql_safe::validate_data_type("varchar(255)") == "varchar(255)");
        CHECK(sql_safe::validate_data_type("DATETIME") == "DATETIME");
    }

    SECTION("anything outside letters, digits and parentheses is refused") {
        CHECK(data_type_error("") == error_kind::InvalidDataType);
        CHECK(data_type_error("   ") == error_kind::InvalidDataType);
        CHECK(data_type_error("DECIMAL(10,2)") == error_kind::InvalidDataType);
        CHECK(data_type_error("INT NOT NULL") == error_kind::InvalidDataType);
        CHECK(data_type_error("INT; DROP TABLE x") == error_kind::InvalidDataType);
        CHECK(data_type_error("TEXT--") == error_kind::InvalidDataType);
    }
}

TEST_CASE("sql_safe::iequals") {
    CHECK(sql_safe::iequals("app_managed_tables", "APP_Managed_Tables"));
    CHECK_FALSE(sql_safe::iequals("app_managed_tables", "app_managed_table"));
    CHECK(sql_safe::iequals("", ""));
}

TEST_CASE("sql_safe::infer_value precedence") {
    using types::cell_value;

    SECTION("integers") {
        CHECK(sql_safe::infer_value("42") == cell_value{int64_t{42}});
        CHECK(sql_safe::infer_value("-7") == cell_value{int64_t{-7}});
        CHECK(sql_safe::infer_value("+5") == cell_value{int64_t{5}});
        CHECK(sql_safe::infer_value("9223372036854775807") == cell_value{int64_t{9223372036854775807}});
    }

    SECTION("numbers that are not integers stay text") {
        CHECK(sql_safe::infer_value("3.14") == cell_value{std::string("3.14")});
        CHECK(sql_safe::infer_value("99999999999999999999") == cell_value{std::string("99999999999999999999")});
        CHECK(sql_safe::infer_value("12abc") == cell_value{std::string("12abc")});
    }

    SECTION("booleans in any case") {
        CHECK(sql_safe::infer_value("true") == cell_value{true});
        CHECK(sql_safe::infer_value("FALSE") == cell_value{false});
        CHECK(sql_safe::infer_value("True") == cell_value{true});
        CHECK(sql_safe::infer_value("yes") == cell_value{std::string("yes")});
    }

    SECTION("date and date-time") {
        CHECK(sql_safe::infer_value("2024-02-29") == cell_value{at(2024, 2, 29)});
        CHECK(sql_safe::infer_value("2024-03-01 12:30") == cell_value{at(2024, 3, 1, 12, 30)});
        CHECK(sql_safe::infer_value("2024-03-01T12:30:45") == cell_value{at(2024, 3, 1, 12, 30, 45)});
        CHECK(sql_safe::infer_value("2024-03-01 12:30:45.5") == cell_value{at(2024, 3, 1, 12, 30, 45, 500000)});
        CHECK(sql_safe::infer_value("2024-03-01 12:30:45.000123") ==
              cell_value{at(2024, 3, 1, 12, 30, 45, 123)});
    }

    SECTION("invalid calendar values stay text") {
        CHECK(sql_safe::infer_value("2023-02-29") == cell_value{std::string("2023-02-29")});
        CHECK(sql_safe::infer_value("2024-13-01") == cell_value{std::string("2024-13-01")});
        CHECK(sql_safe::infer_value("2024-01-01 24:00") == cell_value{std::string("2024-01-01 24:00")});
        CHECK(sql_safe::infer_value("2024-1-1") == cell_value{std::string("2024-1-1")});
    }

    SECTION("everything else is text, including the empty string") {
        CHECK(sql_safe::infer_value("Ada Lovelace") == cell_value{std::string("Ada Lovelace")});
        CHECK(sql_safe::infer_value("") == cell_value{std::string("")});
    }
}
