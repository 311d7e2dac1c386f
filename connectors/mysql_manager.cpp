// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "mysql_manager.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>

namespace mysqlc {

    std::unique_ptr<mysqlc::IConnector>
    make_mysql_connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias) {
        return std::make_unique<mysqlc::Connector>(io_ctx, std::move(params), std::move(alias));
    }

    ConnectorManager::ConnectorManager(mysql::connect_params params,
                                       pool_options options,
                                       connector_factory make_connector)
        : log_(get_logger(logger_tag::CONNECTOR_MANAGER))
        , options_(options)
        , thread_pool_manager_(options.io_threads) {
        const size_t pool_size = std::max<size_t>(options_.pool_size, 1);
        connections_.reserve(pool_size);
        idle_.reserve(pool_size);
        for (size_t i = 0; i < pool_size; ++i) {
            connections_.push_back(make_connector(thread_pool_manager_.ctx(), params, "pool-" + std::to_string(i)));
            idle_.push_back(connections_.back().get());
        }
        log_->debug("Connection pool created with {} connectors", pool_size);
    }

    ConnectorManager::~ConnectorManager() { stop(); }

    thread_pool_status ConnectorManager::status() const noexcept { return thread_pool_manager_.status(); }

    void ConnectorManager::start() {
        // stop() closed every connector for good
        if (thread_pool_manager_.status() == thread_pool_status::STOPPED) {
            log_->error("Start requested after stop");
            throw types::service_error(types::error_kind::ConnectionFailed, "ConnectorManager cannot be restarted");
        }
        thread_pool_manager_.start();
    }

    void ConnectorManager::stop() {
        if (thread_pool_manager_.status() != thread_pool_status::RUNNING) {
            return;
        }
        thread_pool_manager_.stop();
        for (auto& conn : connections_) {
            conn->close();
        }
    }

    types::statement_result
    ConnectorManager::execute(std::string sql, types::params_t params, types::optional_deadline deadline) {
        checkRunning_();
        auto until = effectiveDeadline_(deadline);
        auto conn = acquire_(until);
        // Nothing reaches the engine once the deadline has passed
        time_left(until);
        auto future = asio::co_spawn(thread_pool_manager_.ctx(),
                                     runStatement_(*conn, std::move(sql), std::move(params), until),
                                     asio::use_future);
        return future.get();
    }

    types::rows_t ConnectorManager::query(std::string sql, types::params_t params, types::optional_deadline deadline) {
        checkRunning_();
        auto until = effectiveDeadline_(deadline);
        auto conn = acquire_(until);
        time_left(until);
        auto future = asio::co_spawn(thread_pool_manager_.ctx(),
                                     runQuery_(*conn, std::move(sql), std::move(params), until),
                                     asio::use_future);
        return future.get();
    }

    size_t ConnectorManager::totalConnections() const noexcept { return connections_.size(); }

    size_t ConnectorManager::idleConnections() const {
        std::lock_guard<std::mutex> lk(pool_mutex_);
        return idle_.size();
    }

    std::chrono::milliseconds ConnectorManager::statementTimeout() const noexcept { return options_.statement_timeout; }

    ConnectorManager::lease ConnectorManager::acquire_(types::deadline_t deadline) {
        std::unique_lock<std::mutex> lk(pool_mutex_);
        if (!pool_cv_.wait_until(lk, deadline, [this]() { return !idle_.empty(); })) {
            log_->warn("No idle connection before deadline, {} connectors busy", connections_.size());
            throw types::service_error(types::error_kind::Timeout, "No database connection available before deadline");
        }
        auto* conn = idle_.back();
        idle_.pop_back();
        return lease(*this, conn);
    }

    void ConnectorManager::release_(IConnector* conn) {
        {
            std::lock_guard<std::mutex> lk(pool_mutex_);
            idle_.push_back(conn);
        }
        pool_cv_.notify_one();
    }

    asio::awaitable<void> ConnectorManager::ensureConnected_(IConnector& conn, types::deadline_t deadline) {
        if (conn.status() == Status::Closed) {
            log_->error("Connector {} is closed", conn.alias());
            throw types::service_error(types::error_kind::ConnectionFailed,
                                       "Connector " + conn.alias() + " is closed");
        }
        if (conn.status() == Status::Created) {
            co_await conn.connect(deadline);
            co_return;
        }
        bool alive = co_await conn.isConnected(deadline);
        if (!alive) {
            co_await conn.tryReconnect(deadline);
        }
    }

    asio::awaitable<types::statement_result> ConnectorManager::runStatement_(IConnector& conn,
                                                                             std::string sql,
                                                                             types::params_t params,
                                                                             types::deadline_t deadline) {
        co_await ensureConnected_(conn, deadline);
        co_return co_await conn.runStatement(std::move(sql), std::move(params), deadline);
    }

    asio::awaitable<types::rows_t> ConnectorManager::runQuery_(IConnector& conn,
                                                               std::string sql,
                                                               types::params_t params,
                                                               types::deadline_t deadline) {
        co_await ensureConnected_(conn, deadline);
        co_return co_await conn.runQuery(std::move(sql), std::move(params), deadline);
    }

    types::deadline_t ConnectorManager::effectiveDeadline_(const types::optional_deadline& deadline) const {
        return deadline.value_or(std::chrono::steady_clock::now() + options_.statement_timeout);
    }

    void ConnectorManager::checkRunning_() const {
        if (thread_pool_manager_.status() != thread_pool_status::RUNNING) {
            throw types::service_error(types::error_kind::ConnectionFailed, "ConnectorManager is not running");
        }
    }

} // namespace mysqlc
