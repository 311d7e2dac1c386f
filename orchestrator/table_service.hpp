// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "connectors/mysql_manager.hpp"
#include "registry/ownership_registry.hpp"
#include "types/caller.hpp"
#include "types/cell_value.hpp"
#include "utility/logger.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace orchestrator {

    struct column_spec {
        std::string name;
        std::string data_type;
    };

    using row_values = std::map<std::string, types::cell_value>;
    using text_values = std::map<std::string, std::string>;

    // Entry point for schema and data requests. Each call authorizes,
    // sanitizes and executes in that order, nothing is kept between calls.
    class TableService {
    public:
        TableService(std::shared_ptr<mysqlc::ConnectorManager> conn_manager,
                     std::shared_ptr<registry::OwnershipRegistry> registry);

        // Creates the table with a leading surrogate "id" key and registers
        // the caller as its owner. If registration fails the new table is
        // dropped again before the error is rethrown.
        void createTable(std::string_view name,
                         const std::vector<column_spec>& columns,
                         const types::caller_t& caller,
                         types::optional_deadline deadline = std::nullopt);

        void insertData(std::string_view table,
                        const row_values& data,
                        const types::caller_t& caller,
                        types::optional_deadline deadline = std::nullopt);

        // Values typed with sql_safe::infer_value
        void insertText(std::string_view table,
                        const text_values& data,
                        const types::caller_t& caller,
                        types::optional_deadline deadline = std::nullopt);

        // At most QUERY_ROW_LIMIT rows
        types::rows_t queryData(std::string_view table,
                                const types::caller_t& caller,
                                types::optional_deadline deadline = std::nullopt);

        std::vector<registry::managed_table> listTables(const types::caller_t& caller,
                                                        types::optional_deadline deadline = std::nullopt);

    private:
        enum class registration_state
        {
            Present,
            Absent,
            Unknown
        };

        void authorize_(std::string_view table, const types::caller_t& caller, const types::optional_deadline& deadline);
        registration_state registrationState_(std::string_view name, const types::caller_t& caller);
        void dropAfterFailedRegistration_(std::string_view name, const std::string& quoted_name);

        log_t log_;
        std::shared_ptr<mysqlc::ConnectorManager> conn_manager_;
        std::shared_ptr<registry::OwnershipRegistry> registry_;
    };

} // namespace orchestrator
