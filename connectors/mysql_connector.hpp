// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "types/caller.hpp"
#include "types/cell_value.hpp"
#include "types/errors.hpp"
#include "utility/logger.hpp"

#include <boost/asio.hpp>
#include <boost/mysql.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/error_with_diagnostics.hpp>
#include <boost/mysql/results.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace mysqlc {

    namespace mysql = boost::mysql;
    namespace asio = boost::asio;

    enum class Status
    {
        Created,
        Connected,
        Disconnected,
        Closed
    };

    // The relational engine as seen by the rest of the service.
    // One connector runs one statement at a time. Every network step is
    // bounded by the absolute deadline it is handed.
    class IConnector {
    public:
        virtual ~IConnector() = default;
        virtual Status status() const noexcept = 0;
        virtual mysql::connect_params params() const noexcept = 0;
        virtual void close() = 0;
        virtual asio::awaitable<void> connect(types::deadline_t deadline) = 0;
        virtual asio::awaitable<bool> isConnected(types::deadline_t deadline) = 0;
        virtual asio::awaitable<void> tryReconnect(types::deadline_t deadline) = 0;
        virtual bool isClosed() const noexcept = 0;
        virtual std::string alias() const noexcept = 0;

        // Statements without a result set (DDL, INSERT, DROP).
        // Parameters are bound positionally to '?' markers.
        virtual asio::awaitable<types::statement_result>
        runStatement(std::string sql, types::params_t params, types::deadline_t deadline) = 0;

        virtual asio::awaitable<types::rows_t>
        runQuery(std::string sql, types::params_t params, types::deadline_t deadline) = 0;
    };

    // Time left until deadline, Timeout once it has passed
    std::chrono::milliseconds time_left(types::deadline_t deadline);

    // Result set conversion, columns keep server order
    types::rows_t to_rows(const mysql::results& result);
    std::vector<mysql::field> to_fields(const types::params_t& params);

    class Connector : public IConnector {
    public:
        Connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias = "");
        ~Connector() override;
        Status status() const noexcept override;
        mysql::connect_params params() const noexcept override;
        void close() override;
        asio::awaitable<void> connect(types::deadline_t deadline) override;
        asio::awaitable<bool> isConnected(types::deadline_t deadline) override;
        asio::awaitable<void> tryReconnect(types::deadline_t deadline) override;
        bool isClosed() const noexcept override;
        std::string alias() const noexcept override;

        asio::awaitable<types::statement_result>
        runStatement(std::string sql, types::params_t params, types::deadline_t deadline) override {
            return execute_(std::move(sql), std::move(params), deadline, [](const mysql::results& result) {
                return types::statement_result{result.affected_rows(), result.last_insert_id()};
            });
        }

        asio::awaitable<types::rows_t>
        runQuery(std::string sql, types::params_t params, types::deadline_t deadline) override {
            return execute_(std::move(sql), std::move(params), deadline, [](const mysql::results& result) {
                return to_rows(result);
            });
        }

    private:
        template<typename Callable>
        requires std::invocable<Callable, const mysql::results&>
            asio::awaitable<std::invoke_result_t<Callable, const mysql::results&>>
            execute_(std::string sql, types::params_t params, types::deadline_t deadline, Callable handler) {
            if (status_ != Status::Connected) {
                std::string err = "[Run query] Connector with alias: " + alias_ + " is not connected";
                log_->error(err);
                throw types::service_error(types::error_kind::ConnectionFailed, err);
            }

            // Bound values are not logged
            log_->debug("Alias: {} query: {} ({} bound parameters)", alias_, sql, params.size());

            boost::system::error_code ec;
            mysql::diagnostics diag;
            mysql::results result;
            if (params.empty()) {
                co_await conn_.async_execute(
                    sql,
                    result,
                    diag,
                    asio::cancel_after(remaining_(deadline, sql), asio::redirect_error(asio::use_awaitable, ec)));
                check_(ec, diag, sql);
            } else {
                mysql::statement stmt = co_await conn_.async_prepare_statement(
                    sql,
                    diag,
                    asio::cancel_after(remaining_(deadline, sql), asio::redirect_error(asio::use_awaitable, ec)));
                check_(ec, diag, sql);

                auto fields = to_fields(params);
                co_await conn_.async_execute(
                    stmt.bind(fields.begin(), fields.end()),
                    result,
                    diag,
                    asio::cancel_after(remaining_(deadline, sql), asio::redirect_error(asio::use_awaitable, ec)));

                if (ec != asio::error::operation_aborted) {
                    co_await closeStatement_(stmt, deadline);
                }
                check_(ec, diag, sql);
            }

            co_return handler(result);
        }

        // Throws on ec. A cancelled operation leaves the session unusable,
        // the connector is marked disconnected so the next lease reconnects.
        void check_(const boost::system::error_code& ec, const mysql::diagnostics& diag, const std::string& sql);
        // Same rule for a deadline that passes between the steps of one statement
        std::chrono::milliseconds remaining_(types::deadline_t deadline, const std::string& sql);
        asio::awaitable<void> closeStatement_(mysql::statement stmt, types::deadline_t deadline);
        asio::awaitable<void> prepareSession_(types::deadline_t deadline);

    private:
        log_t log_;
        mysql::any_connection conn_;
        mysql::connect_params params_;
        Status status_;
        std::string alias_;
    };

    using connector_factory =
        std::function<std::unique_ptr<IConnector>(asio::io_context&, mysql::connect_params, std::string)>;

} // namespace mysqlc
