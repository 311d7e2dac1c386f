// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "ownership_registry.hpp"

#include "sql_safe/sql_safe.hpp"
#include "types/errors.hpp"

#include <boost/mysql/common_server_errc.hpp>

#include <fmt/format.h>

namespace registry {

    namespace {
        using types::error_kind;
        using types::service_error;

        int64_t as_integer(const types::cell_value& value, std::string_view column) {
            if (auto* v = std::get_if<int64_t>(&value); v) {
                return *v;
            }
            throw service_error(error_kind::StatementFailed,
                                fmt::format("Registry column '{}' holds a {} value, expected integer",
                                            column,
                                            types::kind_name(types::kind_of(value))));
        }

        managed_table to_managed_table(const types::row_t& row) {
            managed_table table;
            table.table_id = as_integer(types::cell_at(row, "table_id"), "table_id");
            table.owner_id = static_cast<int32_t>(as_integer(types::cell_at(row, "owner_user_id"), "owner_user_id"));
            if (auto* name = std::get_if<std::string>(&types::cell_at(row, "table_name")); name) {
                table.table_name = *name;
            }
            if (auto* created = std::get_if<types::timestamp_t>(&types::cell_at(row, "created_at")); created) {
                table.created_at = *created;
            }
            return table;
        }
    } // namespace

    OwnershipRegistry::OwnershipRegistry(std::shared_ptr<mysqlc::ConnectorManager> conn_manager, std::string store_name)
        : log_(get_logger(logger_tag::OWNERSHIP_REGISTRY))
        , conn_manager_(std::move(conn_manager))
        , store_name_(std::move(store_name))
        , quoted_store_(sql_safe::quote_identifier(store_name_)) {
        if (!conn_manager_) {
            throw std::invalid_argument("OwnershipRegistry requires a connector manager");
        }
    }

    void OwnershipRegistry::ensureStoreExists(types::optional_deadline deadline) {
        auto sql = fmt::format("CREATE TABLE IF NOT EXISTS {} ("
                               "\"table_id\" SERIAL PRIMARY KEY, "
                               "\"table_name\" VARCHAR(100) CHARACTER SET utf8mb4 COLLATE utf8mb4_bin NOT NULL UNIQUE, "
                               "\"owner_user_id\" INT NOT NULL, "
                               "\"created_at\" TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP)",
                               quoted_store_);
        conn_manager_->execute(std::move(sql), {}, deadline);
        log_->info("Registry store {} is ready", store_name_);
    }

    void OwnershipRegistry::registerTable(std::string_view table_name,
                                          int32_t owner_id,
                                          types::optional_deadline deadline) {
        if (!sql_safe::is_valid_identifier(table_name)) {
            throw service_error(error_kind::InvalidIdentifier,
                                "Refusing to register invalid table name '" + std::string(table_name) + "'");
        }
        if (isStoreName(table_name)) {
            throw service_error(error_kind::AccessDenied,
                                "Table name '" + std::string(table_name) + "' is reserved for the registry");
        }

        auto sql = fmt::format("INSERT INTO {} (\"table_name\", \"owner_user_id\") VALUES (?, ?)", quoted_store_);
        types::params_t params{{"TableName", std::string(table_name)}, {"OwnerUserId", int64_t{owner_id}}};
        try {
            conn_manager_->execute(std::move(sql), std::move(params), deadline);
        } catch (const types::statement_error& e) {
            if (e.code() == boost::mysql::common_server_errc::er_dup_entry) {
                log_->warn("Table {} is already registered", table_name);
                throw service_error(error_kind::DuplicateTable,
                                    "Table '" + std::string(table_name) + "' is already registered: " + e.what());
            }
            throw;
        }
        log_->info("Registered table {} for owner {}", table_name, owner_id);
    }

    bool OwnershipRegistry::canAccess(std::string_view table_name,
                                      int32_t caller_id,
                                      bool privileged,
                                      types::optional_deadline deadline) {
        if (privileged) {
            return true;
        }
        if (isStoreName(table_name)) {
            log_->warn("Caller {} tried to address the registry store", caller_id);
            return false;
        }

        auto sql = fmt::format(
            "SELECT COUNT(1) AS \"matches\" FROM {} WHERE \"table_name\" = ? AND \"owner_user_id\" = ?",
            quoted_store_);
        types::params_t params{{"TableName", std::string(table_name)}, {"UserId", int64_t{caller_id}}};
        auto rows = conn_manager_->query(std::move(sql), std::move(params), deadline);
        if (rows.empty()) {
            return false;
        }
        return as_integer(types::cell_at(rows.front(), "matches"), "matches") > 0;
    }

    std::vector<managed_table> OwnershipRegistry::listTables(const types::caller_t& caller,
                                                             types::optional_deadline deadline) {
        std::string sql = fmt::format(
            "SELECT \"table_id\", \"table_name\", \"owner_user_id\", \"created_at\" FROM {}",
            quoted_store_);
        types::params_t params;
        if (!caller.privileged) {
            sql += " WHERE \"owner_user_id\" = ?";
            params.push_back({"UserId", int64_t{caller.id}});
        }
        sql += " ORDER BY \"table_id\"";

        auto rows = conn_manager_->query(std::move(sql), std::move(params), deadline);
        std::vector<managed_table> tables;
        tables.reserve(rows.size());
        for (const auto& row : rows) {
            tables.push_back(to_managed_table(row));
        }
        return tables;
    }

    bool OwnershipRegistry::isStoreName(std::string_view name) const noexcept {
        return sql_safe::iequals(name, store_name_);
    }

} // namespace registry
