// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "types/cell_value.hpp"
#include "types/errors.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace types;

TEST_CASE("cell_value: kinds") {
    CHECK(kind_of(cell_value{}) == cell_kind::NULL_VALUE);
    CHECK(kind_of(cell_value{int64_t{1}}) == cell_kind::INTEGER);
    CHECK(kind_of(cell_value{true}) == cell_kind::BOOLEAN);
    CHECK(kind_of(cell_value{timestamp_t{}}) == cell_kind::TIMESTAMP);
    CHECK(kind_of(cell_value{std::string("x")}) == cell_kind::TEXT);
    CHECK(is_null(cell_value{}));
    CHECK(kind_name(cell_kind::TIMESTAMP) == "timestamp");
}

TEST_CASE("cell_value: rendering") {
    using namespace std::chrono;
    auto day = timestamp_t{sys_days{year{2024} / 2 / 29}};

    CHECK(to_string(cell_value{}) == "NULL");
    CHECK(to_string(cell_value{int64_t{-3}}) == "-3");
    CHECK(to_string(cell_value{false}) == "false");
    CHECK(to_string(cell_value{day}) == "2024-02-29 00:00:00");
    CHECK(format_timestamp(day + hours{13} + minutes{5} + seconds{9} + microseconds{120}) ==
          "2024-02-29 13:05:09.000120");
}

TEST_CASE("cell_value: column lookup") {
    row_t row{{"id", int64_t{1}}, {"name", std::string("Ada")}};
    CHECK(cell_at(row, "name") == cell_value{std::string("Ada")});
    CHECK_THROWS_AS(cell_at(row, "missing"), std::out_of_range);
}

TEST_CASE("errors: kinds") {
    statement_error error(boost::system::error_code{}, "boom");
    CHECK(error.kind() == error_kind::StatementFailed);
    CHECK(std::string(error.what()) == "boom");
    CHECK(error_kind_name(error_kind::AccessDenied) == "AccessDenied");
    CHECK(is_validation_error(error_kind::ReservedWord));
    CHECK_FALSE(is_validation_error(error_kind::Timeout));
}
