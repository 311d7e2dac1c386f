// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "mysql_connector.hpp"

#include "types/caller.hpp"
#include "utility/thread_pool_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mysqlc {

    std::unique_ptr<mysqlc::IConnector>
    make_mysql_connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias);

    struct pool_options {
        size_t pool_size = 4;
        size_t io_threads = 2;
        // Applies when a request carries no deadline of its own
        std::chrono::milliseconds statement_timeout{5000};
    };

    // Fixed set of connectors leased one request at a time. Statements run as
    // coroutines on the internal io_context, callers block on the result.
    class ConnectorManager {
    public:
        ConnectorManager(mysql::connect_params params,
                         pool_options options = {},
                         connector_factory make_connector = make_mysql_connector);
        ~ConnectorManager();

        ConnectorManager(const ConnectorManager&) = delete;
        ConnectorManager& operator=(const ConnectorManager&) = delete;

        thread_pool_status status() const noexcept;
        void start();
        void stop();

        types::statement_result
        execute(std::string sql, types::params_t params = {}, types::optional_deadline deadline = std::nullopt);

        types::rows_t query(std::string sql, types::params_t params = {}, types::optional_deadline deadline = std::nullopt);

        size_t totalConnections() const noexcept;
        size_t idleConnections() const;
        std::chrono::milliseconds statementTimeout() const noexcept;

    private:
        class lease {
        public:
            lease(ConnectorManager& owner, IConnector* conn)
                : owner_(owner)
                , conn_(conn) {}
            ~lease() { owner_.release_(conn_); }

            lease(const lease&) = delete;
            lease& operator=(const lease&) = delete;

            IConnector* operator->() const noexcept { return conn_; }
            IConnector& operator*() const noexcept { return *conn_; }

        private:
            ConnectorManager& owner_;
            IConnector* conn_;
        };

        lease acquire_(types::deadline_t deadline);
        void release_(IConnector* conn);
        // Connect, ping and reconnect run inside the request deadline
        asio::awaitable<void> ensureConnected_(IConnector& conn, types::deadline_t deadline);
        asio::awaitable<types::statement_result>
        runStatement_(IConnector& conn, std::string sql, types::params_t params, types::deadline_t deadline);
        asio::awaitable<types::rows_t>
        runQuery_(IConnector& conn, std::string sql, types::params_t params, types::deadline_t deadline);
        types::deadline_t effectiveDeadline_(const types::optional_deadline& deadline) const;
        void checkRunning_() const;

        log_t log_;
        pool_options options_;
        thread_pool_manager thread_pool_manager_;
        std::vector<std::unique_ptr<IConnector>> connections_;

        mutable std::mutex pool_mutex_;
        std::condition_variable pool_cv_;
        std::vector<IConnector*> idle_;
    };

} // namespace mysqlc
