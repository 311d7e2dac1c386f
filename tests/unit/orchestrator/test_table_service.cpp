// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "orchestrator/table_service.hpp"
#include "types/errors.hpp"

#include "../../mock/service_fixture.hpp"

#include <catch2/catch.hpp>

#include <chrono>

using namespace orchestrator;
using types::caller_t;
using types::cell_value;
using types::error_kind;

namespace {
    template<typename F>
    error_kind error_of(F&& f) {
        try {
            f();
        } catch (const types::service_error& e) {
            return e.kind();
        }
        FAIL("expected a service_error");
        return error_kind::StatementFailed;
    }

    const caller_t owner{5, false};
    const caller_t stranger{6, false};
    const caller_t admin{1, true};
} // namespace

TEST_CASE("table_service: contacts round trip") {
    service_fixture fixture;
    fixture.service->createTable("contacts", {{"full_name", "VARCHAR(100)"}}, caller_t{2, false});

    REQUIRE(fixture.database->hasTable("contacts"));
    CHECK(fixture.registry->canAccess("contacts", 2, false));
    CHECK_FALSE(fixture.registry->canAccess("contacts", 3, false));

    auto statements = fixture.database->statements();
    REQUIRE_FALSE(statements.empty());
    CHECK(statements.front() == "CREATE TABLE \"contacts\" (\"id\" SERIAL PRIMARY KEY, \"full_name\" VARCHAR(100))");
}

TEST_CASE("table_service: inserted text is bound with its inferred type") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);
    fixture.service->insertText("t1", {{"n", "42"}}, owner);

    auto rows = fixture.service->queryData("t1", owner);
    REQUIRE(rows.size() == 1);
    CHECK(types::cell_at(rows[0], "n") == cell_value{int64_t{42}});
    CHECK(types::cell_at(rows[0], "id") == cell_value{int64_t{1}});
    CHECK(rows[0].front().first == "id");
}

TEST_CASE("table_service: typed insert keeps every value kind") {
    service_fixture fixture;
    fixture.service->createTable("events",
                                 {{"title", "TEXT"}, {"active", "BOOLEAN"}, {"at", "DATETIME"}, {"note", "TEXT"}},
                                 owner);

    auto when = types::timestamp_t{std::chrono::sys_days{std::chrono::year{2024} / 5 / 17}};
    fixture.service->insertData(
        "events",
        {{"title", std::string("launch")}, {"active", true}, {"at", when}, {"note", std::monostate{}}},
        owner);

    auto rows = fixture.service->queryData("events", owner);
    REQUIRE(rows.size() == 1);
    CHECK(types::cell_at(rows[0], "title") == cell_value{std::string("launch")});
    CHECK(types::cell_at(rows[0], "active") == cell_value{true});
    CHECK(types::cell_at(rows[0], "at") == cell_value{when});
    CHECK(types::is_null(types::cell_at(rows[0], "note")));
}

TEST_CASE("table_service: query returns at most ten rows") {
    service_fixture fixture;
    fixture.service->createTable("numbers", {{"n", "INT"}}, owner);
    for (int i = 0; i < 12; ++i) {
        fixture.service->insertText("numbers", {{"n", std::to_string(i)}}, owner);
    }
    CHECK(fixture.database->rowCount("numbers") == 12);
    CHECK(fixture.service->queryData("numbers", owner).size() == QUERY_ROW_LIMIT);
}

TEST_CASE("table_service: non owner is denied and nothing is written") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);
    fixture.database->clearStatements();

    CHECK(error_of([&] { fixture.service->insertText("t1", {{"n", "7"}}, stranger); }) == error_kind::AccessDenied);
    CHECK(error_of([&] { fixture.service->queryData("t1", stranger); }) == error_kind::AccessDenied);
    CHECK(fixture.database->rowCount("t1") == 0);
    CHECK(fixture.database->countStatements("INSERT INTO \"t1\"") == 0);
    CHECK(fixture.database->countStatements("SELECT * FROM \"t1\"") == 0);
}

TEST_CASE("table_service: privileged caller reaches any table") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);
    fixture.service->insertText("t1", {{"n", "1"}}, admin);
    CHECK(fixture.service->queryData("t1", admin).size() == 1);
}

TEST_CASE("table_service: unregistered table is denied") {
    service_fixture fixture;
    CHECK(error_of([&] { fixture.service->queryData("ghost", owner); }) == error_kind::AccessDenied);
}

TEST_CASE("table_service: registry store is off limits") {
    service_fixture fixture;

    SECTION("create is refused for every caller") {
        CHECK(error_of([&] { fixture.service->createTable("app_managed_tables", {{"x", "INT"}}, owner); }) ==
              error_kind::AccessDenied);
        CHECK(error_of([&] { fixture.service->createTable("APP_MANAGED_TABLES", {{"x", "INT"}}, admin); }) ==
              error_kind::AccessDenied);
        CHECK(fixture.database->statements().empty());
    }

    SECTION("non privileged callers cannot read or write it") {
        CHECK(error_of([&] { fixture.service->queryData("app_managed_tables", owner); }) ==
              error_kind::AccessDenied);
        CHECK(error_of([&] {
                  fixture.service->insertText("app_managed_tables", {{"table_name", "mine"}}, owner);
              }) == error_kind::AccessDenied);
    }
}

TEST_CASE("table_service: validation happens before any statement") {
    service_fixture fixture;

    CHECK(error_of([&] { fixture.service->createTable("bad;name", {{"x", "INT"}}, owner); }) ==
          error_kind::InvalidIdentifier);
    CHECK(error_of([&] { fixture.service->createTable("select", {{"x", "INT"}}, owner); }) ==
          error_kind::ReservedWord);
    CHECK(error_of([&] { fixture.service->createTable("good", {{"bad col", "INT"}}, owner); }) ==
          error_kind::InvalidIdentifier);
    CHECK(error_of([&] { fixture.service->createTable("good", {{"x", "INT; DROP"}}, owner); }) ==
          error_kind::InvalidDataType);
    CHECK(error_of([&] { fixture.service->createTable("good", {}, owner); }) == error_kind::EmptyPayload);

    CHECK(fixture.database->statements().empty());
    CHECK_FALSE(fixture.database->hasTable("good"));
}

TEST_CASE("table_service: bad column names on insert are rejected after authorization") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);
    fixture.database->clearStatements();

    CHECK(error_of([&] { fixture.service->insertText("t1", {{"n\"; --", "1"}}, owner); }) ==
          error_kind::InvalidIdentifier);
    CHECK(error_of([&] { fixture.service->insertText("t1", {}, owner); }) == error_kind::EmptyPayload);
    CHECK(fixture.database->countStatements("INSERT INTO \"t1\"") == 0);
}

TEST_CASE("table_service: duplicate table") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);

    CHECK(error_of([&] { fixture.service->createTable("t1", {{"n", "INT"}}, stranger); }) ==
          error_kind::SchemaCreationFailed);
    CHECK(fixture.registry->canAccess("t1", owner.id, false));
    CHECK_FALSE(fixture.registry->canAccess("t1", stranger.id, false));
}

TEST_CASE("table_service: engine rejection of the DDL") {
    service_fixture fixture;
    CHECK(error_of([&] { fixture.service->createTable("t2", {{"id", "INT"}}, owner); }) ==
          error_kind::SchemaCreationFailed);
    CHECK(fixture.registry->listTables(admin).empty());
}

TEST_CASE("table_service: failed registration drops the new table") {
    service_fixture fixture(mock_config{.fail_on = "INSERT INTO \"app_managed_tables\""});

    CHECK(error_of([&] { fixture.service->createTable("orphan", {{"n", "INT"}}, owner); }) ==
          error_kind::StatementFailed);
    CHECK_FALSE(fixture.database->hasTable("orphan"));
    CHECK(fixture.database->countStatements("DROP TABLE \"orphan\"") == 1);
}

TEST_CASE("table_service: name registered without a table is a duplicate") {
    service_fixture fixture;
    fixture.registry->registerTable("t9", 7);
    fixture.database->clearStatements();

    CHECK(error_of([&] { fixture.service->createTable("t9", {{"n", "INT"}}, owner); }) ==
          error_kind::DuplicateTable);
    CHECK_FALSE(fixture.database->hasTable("t9"));
    CHECK(fixture.database->countStatements("DROP TABLE \"t9\"") == 1);
    CHECK(fixture.registry->canAccess("t9", 7, false));
    CHECK_FALSE(fixture.registry->canAccess("t9", owner.id, false));
}

TEST_CASE("table_service: registration committed before a timeout keeps the table") {
    service_fixture fixture(mock_config{.timeout_after_execute_on = "INSERT INTO \"app_managed_tables\""});

    CHECK_NOTHROW(fixture.service->createTable("kept", {{"n", "INT"}}, owner));
    CHECK(fixture.database->hasTable("kept"));
    CHECK(fixture.database->countStatements("DROP TABLE") == 0);
    CHECK(fixture.registry->canAccess("kept", owner.id, false));

    fixture.service->insertText("kept", {{"n", "4"}}, owner);
    CHECK(fixture.service->queryData("kept", owner).size() == 1);
}

TEST_CASE("table_service: registration lost to a timeout drops the table") {
    service_fixture fixture(mock_config{.timeout_before_execute_on = "INSERT INTO \"app_managed_tables\""});

    CHECK(error_of([&] { fixture.service->createTable("lost", {{"n", "INT"}}, owner); }) == error_kind::Timeout);
    CHECK_FALSE(fixture.database->hasTable("lost"));
    CHECK(fixture.database->countStatements("DROP TABLE \"lost\"") == 1);
    CHECK_FALSE(fixture.registry->canAccess("lost", owner.id, false));
}

TEST_CASE("table_service: expired deadline issues no statement") {
    service_fixture fixture;
    fixture.service->createTable("t1", {{"n", "INT"}}, owner);
    fixture.database->clearStatements();

    auto expired = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    CHECK(error_of([&] { fixture.service->createTable("t2", {{"n", "INT"}}, owner, expired); }) ==
          error_kind::Timeout);
    CHECK(error_of([&] { fixture.service->insertText("t1", {{"n", "1"}}, owner, expired); }) ==
          error_kind::Timeout);
    CHECK(error_of([&] { fixture.service->queryData("t1", owner, expired); }) == error_kind::Timeout);
    CHECK(fixture.database->statements().empty());
}

TEST_CASE("table_service: slow engine times out") {
    service_fixture fixture(mock_config{.wait_time = std::chrono::milliseconds(200)});
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
    CHECK(error_of([&] { fixture.service->listTables(admin, deadline); }) == error_kind::Timeout);
}

TEST_CASE("table_service: listTables visibility") {
    service_fixture fixture;
    fixture.service->createTable("a_table", {{"n", "INT"}}, owner);
    fixture.service->createTable("b_table", {{"n", "INT"}}, stranger);
    fixture.service->createTable("c_table", {{"n", "INT"}}, owner);

    auto mine = fixture.service->listTables(owner);
    REQUIRE(mine.size() == 2);
    CHECK(mine[0].table_name == "a_table");
    CHECK(mine[1].table_name == "c_table");
    CHECK(mine[0].owner_id == owner.id);
    CHECK(mine[0].table_id < mine[1].table_id);

    CHECK(fixture.service->listTables(admin).size() == 3);
    CHECK(fixture.service->listTables(caller_t{99, false}).empty());
}
