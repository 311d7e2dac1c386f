// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "table_service.hpp"

#include "sql_safe/sql_safe.hpp"
#include "statement_builder.hpp"
#include "types/errors.hpp"
#include "utility/timer.hpp"

#include <stdexcept>

namespace orchestrator {

    using types::error_kind;
    using types::service_error;

    TableService::TableService(std::shared_ptr<mysqlc::ConnectorManager> conn_manager,
                               std::shared_ptr<registry::OwnershipRegistry> registry)
        : log_(get_logger(logger_tag::TABLE_SERVICE))
        , conn_manager_(std::move(conn_manager))
        , registry_(std::move(registry)) {
        if (!conn_manager_ || !registry_) {
            throw std::invalid_argument("TableService requires a connector manager and a registry");
        }
    }

    void TableService::createTable(std::string_view name,
                                   const std::vector<column_spec>& columns,
                                   const types::caller_t& caller,
                                   types::optional_deadline deadline) {
        Timer timer(log_, "TableService::createTable");

        if (columns.empty()) {
            throw service_error(error_kind::EmptyPayload,
                                "Table '" + std::string(name) + "' needs at least one column.");
        }
        // Nobody may register the store name, privileged or not
        if (registry_->isStoreName(name)) {
            log_->warn("Caller {} tried to create the registry store {}", caller.id, name);
            throw service_error(error_kind::AccessDenied, "Access denied to table '" + std::string(name) + "'.");
        }

        auto quoted_name = sql_safe::quote_identifier(name);
        column_definitions definitions;
        definitions.reserve(columns.size());
        for (const auto& column : columns) {
            definitions.emplace_back(sql_safe::quote_identifier(column.name),
                                     sql_safe::validate_data_type(column.data_type));
        }

        auto ddl = build_create_table(quoted_name, definitions);
        log_->debug("Create table DDL: {}", ddl);
        try {
            conn_manager_->execute(std::move(ddl), {}, deadline);
        } catch (const types::statement_error& e) {
            throw service_error(error_kind::SchemaCreationFailed,
                                "Failed to create table '" + std::string(name) + "': " + e.what());
        }

        try {
            registry_->registerTable(name, caller.id, deadline);
        } catch (const service_error& e) {
            log_->error("Registration of {} failed after DDL: {}", name, e.what());
            // A timed out or broken round trip may still have committed the row
            if (e.kind() == error_kind::Timeout || e.kind() == error_kind::ConnectionFailed) {
                switch (registrationState_(name, caller)) {
                    case registration_state::Present:
                        log_->warn("Registration of {} reported {} but the row was committed",
                                   name,
                                   types::error_kind_name(e.kind()));
                        log_->info("Table '{}' created for owner {}", name, caller.id);
                        return;
                    case registration_state::Unknown:
                        log_->error("Table '{}' left in place, registration outcome unknown", name);
                        throw;
                    case registration_state::Absent:
                        break;
                }
            }
            dropAfterFailedRegistration_(name, quoted_name);
            throw;
        }

        log_->info("Table '{}' created for owner {}", name, caller.id);
    }

    void TableService::insertData(std::string_view table,
                                  const row_values& data,
                                  const types::caller_t& caller,
                                  types::optional_deadline deadline) {
        Timer timer(log_, "TableService::insertData");

        authorize_(table, caller, deadline);
        if (data.empty()) {
            throw service_error(error_kind::EmptyPayload,
                                "No data provided for table '" + std::string(table) + "'.");
        }

        auto quoted_table = sql_safe::quote_identifier(table);
        std::vector<std::string> quoted_columns;
        types::params_t params;
        quoted_columns.reserve(data.size());
        params.reserve(data.size());
        for (const auto& [column, value] : data) {
            quoted_columns.push_back(sql_safe::quote_identifier(column));
            params.push_back({column, value});
        }

        auto sql = build_insert(quoted_table, quoted_columns);
        log_->debug("Insert DML: {}", sql);
        conn_manager_->execute(std::move(sql), std::move(params), deadline);
        log_->info("Inserted {} fields into '{}' for caller {}", data.size(), table, caller.id);
    }

    void TableService::insertText(std::string_view table,
                                  const text_values& data,
                                  const types::caller_t& caller,
                                  types::optional_deadline deadline) {
        row_values typed;
        for (const auto& [column, text] : data) {
            typed.emplace(column, sql_safe::infer_value(text));
        }
        insertData(table, typed, caller, deadline);
    }

    types::rows_t TableService::queryData(std::string_view table,
                                          const types::caller_t& caller,
                                          types::optional_deadline deadline) {
        Timer timer(log_, "TableService::queryData");

        authorize_(table, caller, deadline);
        auto sql = build_select_all(sql_safe::quote_identifier(table));
        log_->debug("Query DML: {}", sql);
        auto rows = conn_manager_->query(std::move(sql), {}, deadline);
        log_->info("Query on '{}' for caller {} returned {} rows", table, caller.id, rows.size());
        return rows;
    }

    std::vector<registry::managed_table> TableService::listTables(const types::caller_t& caller,
                                                                  types::optional_deadline deadline) {
        return registry_->listTables(caller, deadline);
    }

    void TableService::authorize_(std::string_view table,
                                  const types::caller_t& caller,
                                  const types::optional_deadline& deadline) {
        if (!registry_->canAccess(table, caller.id, caller.privileged, deadline)) {
            log_->warn("Access denied to table '{}' for caller {}", table, caller.id);
            throw service_error(error_kind::AccessDenied, "Access denied to table '" + std::string(table) + "'.");
        }
    }

    TableService::registration_state TableService::registrationState_(std::string_view name,
                                                                     const types::caller_t& caller) {
        // Own deadline, like the compensating drop
        try {
            return registry_->canAccess(name, caller.id, false) ? registration_state::Present
                                                                : registration_state::Absent;
        } catch (const service_error& e) {
            log_->error("Could not verify registration of {}: {}", name, e.what());
            return registration_state::Unknown;
        }
    }

    void TableService::dropAfterFailedRegistration_(std::string_view name, const std::string& quoted_name) {
        // Own deadline, the request deadline may be what made registration fail
        try {
            conn_manager_->execute(build_drop_table(quoted_name));
            log_->warn("Dropped unregistered table '{}'", name);
        } catch (const service_error& e) {
            log_->error("Table '{}' exists but is not registered, drop failed: {}", name, e.what());
        }
    }

} // namespace orchestrator
