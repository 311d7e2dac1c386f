// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "connectors/mysql_manager.hpp"
#include "types/caller.hpp"
#include "types/cell_value.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace registry {

    inline constexpr std::string_view DEFAULT_STORE_NAME = "app_managed_tables";

    struct managed_table {
        int64_t table_id = 0;
        std::string table_name;
        int32_t owner_id = 0;
        types::timestamp_t created_at{};
    };

    // Which caller owns which managed table. Holds no cached state, every
    // answer comes from the store table.
    class OwnershipRegistry {
    public:
        // Throws service_error(InvalidIdentifier | ReservedWord) for a bad store name
        explicit OwnershipRegistry(std::shared_ptr<mysqlc::ConnectorManager> conn_manager,
                                   std::string store_name = std::string(DEFAULT_STORE_NAME));

        // Idempotent, run at every start-up
        void ensureStoreExists(types::optional_deadline deadline = std::nullopt);

        // `table_name` is the unquoted name used in later lookups.
        // Throws service_error(DuplicateTable) when the name is already registered.
        void registerTable(std::string_view table_name, int32_t owner_id, types::optional_deadline deadline = std::nullopt);

        bool canAccess(std::string_view table_name,
                       int32_t caller_id,
                       bool privileged,
                       types::optional_deadline deadline = std::nullopt);

        // Privileged callers see every table, others only their own
        std::vector<managed_table> listTables(const types::caller_t& caller,
                                              types::optional_deadline deadline = std::nullopt);

        bool isStoreName(std::string_view name) const noexcept;
        const std::string& storeName() const noexcept { return store_name_; }

    private:
        log_t log_;
        std::shared_ptr<mysqlc::ConnectorManager> conn_manager_;
        std::string store_name_;
        std::string quoted_store_;
    };

} // namespace registry
