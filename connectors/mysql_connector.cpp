// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "mysql_connector.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace mysqlc {

    namespace {
        constexpr size_t RECONNECT_ATTEMPTS = 3;
        constexpr std::chrono::milliseconds RECONNECT_DELAY{200};

        // Identifiers are emitted double quoted, the session must read them as such
        constexpr std::string_view SESSION_SETUP =
            "SET SESSION sql_mode = CONCAT_WS(',', NULLIF(@@SESSION.sql_mode, ''), 'ANSI_QUOTES')";

        // TINYINT(1) is how MySQL stores BOOLEAN
        bool is_boolean_column(const mysql::metadata& column) {
            return column.type() == mysql::column_type::tinyint && column.column_length() == 1;
        }

        types::cell_value to_cell(mysql::field_view field, const mysql::metadata& column) {
            switch (field.kind()) {
                case mysql::field_kind::null:
                    return std::monostate{};
                case mysql::field_kind::int64:
                    if (is_boolean_column(column)) {
                        return field.as_int64() != 0;
                    }
                    return field.as_int64();
                case mysql::field_kind::uint64: {
                    auto value = field.as_uint64();
                    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        return std::to_string(value);
                    }
                    return static_cast<int64_t>(value);
                }
                case mysql::field_kind::string:
                    return std::string(field.as_string());
                case mysql::field_kind::blob: {
                    auto blob = field.as_blob();
                    return std::string(blob.begin(), blob.end());
                }
                case mysql::field_kind::float_:
                    return fmt::format("{}", field.as_float());
                case mysql::field_kind::double_:
                    return fmt::format("{}", field.as_double());
                case mysql::field_kind::date: {
                    auto d = field.as_date();
                    if (!d.valid()) {
                        return fmt::format("{:04}-{:02}-{:02}", d.year(), d.month(), d.day());
                    }
                    return types::timestamp_t{d.as_time_point()};
                }
                case mysql::field_kind::datetime: {
                    auto dt = field.as_datetime();
                    if (!dt.valid()) {
                        return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                                           dt.year(),
                                           dt.month(),
                                           dt.day(),
                                           dt.hour(),
                                           dt.minute(),
                                           dt.second());
                    }
                    return types::timestamp_t{dt.as_time_point()};
                }
                case mysql::field_kind::time: {
                    std::chrono::hh_mm_ss<std::chrono::microseconds> tod{field.as_time()};
                    return fmt::format("{}{:02}:{:02}:{:02}",
                                       tod.is_negative() ? "-" : "",
                                       tod.hours().count(),
                                       tod.minutes().count(),
                                       tod.seconds().count());
                }
            }
            return std::monostate{};
        }

        mysql::field to_field(const types::cell_value& value) {
            switch (types::kind_of(value)) {
                case types::cell_kind::NULL_VALUE:
                    return mysql::field{};
                case types::cell_kind::INTEGER:
                    return mysql::field{std::get<int64_t>(value)};
                case types::cell_kind::BOOLEAN:
                    return mysql::field{static_cast<int64_t>(std::get<bool>(value) ? 1 : 0)};
                case types::cell_kind::TIMESTAMP:
                    return mysql::field{mysql::datetime{std::get<types::timestamp_t>(value)}};
                case types::cell_kind::TEXT:
                    return mysql::field{std::get<std::string>(value)};
            }
            return mysql::field{};
        }
    } // namespace

    std::chrono::milliseconds time_left(types::deadline_t deadline) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left <= std::chrono::milliseconds::zero()) {
            throw types::service_error(types::error_kind::Timeout, "Deadline expired before the operation started");
        }
        return left;
    }

    types::rows_t to_rows(const mysql::results& result) {
        const auto meta = result.meta();
        const auto rows = result.rows();

        types::rows_t converted;
        converted.reserve(rows.size());
        for (const auto& row : rows) {
            types::row_t out;
            out.reserve(row.size());
            for (size_t i = 0; i < row.size(); ++i) {
                out.emplace_back(std::string(meta[i].column_name()), to_cell(row.at(i), meta[i]));
            }
            converted.push_back(std::move(out));
        }
        return converted;
    }

    std::vector<mysql::field> to_fields(const types::params_t& params) {
        std::vector<mysql::field> fields;
        fields.reserve(params.size());
        for (const auto& param : params) {
            fields.push_back(to_field(param.value));
        }
        return fields;
    }

    Connector::Connector(asio::io_context& io_ctx, mysql::connect_params params, std::string alias)
        : log_(get_logger(logger_tag::CONNECTOR))
        , conn_(io_ctx)
        , params_{std::move(params)}
        , status_{Status::Created}
        , alias_{std::move(alias)} {}

    mysql::connect_params Connector::params() const noexcept { return params_; }

    Status Connector::status() const noexcept { return status_; }

    void Connector::close() {
        if (status_ != Status::Connected) {
            return;
        }
        log_->info("Alias: {} close connection", alias_);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        conn_.close(ec, diag);
        if (ec) {
            log_->warn("Alias: {} close failed: {}", alias_, ec.message());
        }
        status_ = Status::Closed;
    }

    Connector::~Connector() { close(); }

    asio::awaitable<void> Connector::connect(types::deadline_t deadline) {
        conn_.set_meta_mode(mysql::metadata_mode::full);
        boost::system::error_code ec;
        mysql::diagnostics diag;
        co_await conn_.async_connect(params_,
                                     diag,
                                     asio::cancel_after(time_left(deadline),
                                                        asio::redirect_error(asio::use_awaitable, ec)));
        if (ec) {
            log_->warn("Alias: {} connect failed: {} {}", alias_, ec.message(), diag.server_message());
            status_ = Status::Disconnected;
            co_await tryReconnect(deadline);
            co_return;
        }
        status_ = Status::Connected;
        co_await prepareSession_(deadline);
    }

    asio::awaitable<bool> Connector::isConnected(types::deadline_t deadline) {
        if (status_ != Status::Connected) {
            co_return false;
        }
        boost::system::error_code ec;
        mysql::diagnostics diag;
        co_await conn_.async_ping(diag,
                                  asio::cancel_after(time_left(deadline),
                                                     asio::redirect_error(asio::use_awaitable, ec)));
        if (ec) {
            status_ = Status::Disconnected;
            log_->warn("Alias: {} ping failed: {}", alias_, ec.message());
            co_return false;
        }
        co_return true;
    }

    asio::awaitable<void> Connector::tryReconnect(types::deadline_t deadline) {
        if (status_ == Status::Connected) {
            co_return;
        }
        status_ = Status::Disconnected;
        log_->info("Alias: {} try to reconnect", alias_);

        boost::system::error_code ec;
        mysql::diagnostics diag;
        asio::steady_timer delay(co_await asio::this_coro::executor);
        for (size_t attempt = 0; attempt < RECONNECT_ATTEMPTS; ++attempt) {
            co_await conn_.async_connect(params_,
                                         diag,
                                         asio::cancel_after(time_left(deadline),
                                                            asio::redirect_error(asio::use_awaitable, ec)));
            if (!ec) {
                log_->info("Alias: {} reconnect success", alias_);
                status_ = Status::Connected;
                co_await prepareSession_(deadline);
                co_return;
            }
            if (ec == asio::error::operation_aborted) {
                log_->error("Alias: {} reconnect cancelled after deadline", alias_);
                throw types::service_error(types::error_kind::Timeout,
                                           "Reconnect exceeded its deadline on connection '" + alias_ + "'");
            }
            log_->warn("Alias: {} reconnect attempt: {} failed: {} {}",
                       alias_,
                       attempt,
                       ec.message(),
                       diag.server_message());
            if (attempt + 1 < RECONNECT_ATTEMPTS) {
                // Never sleeps past the deadline, the next attempt then reports Timeout
                delay.expires_after(std::min<std::chrono::steady_clock::duration>(
                    RECONNECT_DELAY,
                    deadline - std::chrono::steady_clock::now()));
                co_await delay.async_wait(asio::use_awaitable);
            }
        }
        std::string error = "[Connector] Alias: " + alias_ + " connect failed: " + ec.message();
        log_->error(error);
        throw types::service_error(types::error_kind::ConnectionFailed, error);
    }

    bool Connector::isClosed() const noexcept { return status_ == Status::Closed; }

    std::string Connector::alias() const noexcept { return alias_; }

    asio::awaitable<void> Connector::prepareSession_(types::deadline_t deadline) {
        boost::system::error_code ec;
        mysql::diagnostics diag;
        mysql::results result;
        co_await conn_.async_execute(SESSION_SETUP,
                                     result,
                                     diag,
                                     asio::cancel_after(time_left(deadline),
                                                        asio::redirect_error(asio::use_awaitable, ec)));
        if (ec) {
            status_ = Status::Disconnected;
            if (ec == asio::error::operation_aborted) {
                log_->error("Alias: {} session setup cancelled after deadline", alias_);
                throw types::service_error(types::error_kind::Timeout,
                                           "Session setup exceeded its deadline on connection '" + alias_ + "'");
            }
            std::string error = "[Connector] Alias: " + alias_ + " session setup failed: " + ec.message() + " " +
                                std::string(diag.server_message());
            log_->error(error);
            throw types::service_error(types::error_kind::ConnectionFailed, error);
        }
    }

    std::chrono::milliseconds Connector::remaining_(types::deadline_t deadline, const std::string& sql) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left <= std::chrono::milliseconds::zero()) {
            status_ = Status::Disconnected;
            log_->error("Alias: {} query [{}] ran out of time between steps", alias_, sql);
            throw types::service_error(types::error_kind::Timeout,
                                       "Statement exceeded its deadline on connection '" + alias_ + "'");
        }
        return left;
    }

    asio::awaitable<void> Connector::closeStatement_(mysql::statement stmt, types::deadline_t deadline) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left <= std::chrono::milliseconds::zero()) {
            // The statement stays open on the server until the session is replaced
            status_ = Status::Disconnected;
            log_->warn("Alias: {} no time left to close statement", alias_);
            co_return;
        }
        boost::system::error_code ec;
        mysql::diagnostics diag;
        co_await conn_.async_close_statement(stmt,
                                             diag,
                                             asio::cancel_after(left, asio::redirect_error(asio::use_awaitable, ec)));
        if (ec == asio::error::operation_aborted) {
            status_ = Status::Disconnected;
            log_->warn("Alias: {} close statement cancelled after deadline", alias_);
        } else if (ec) {
            log_->warn("Alias: {} close statement failed: {}", alias_, ec.message());
        }
    }

    void Connector::check_(const boost::system::error_code& ec, const mysql::diagnostics& diag, const std::string& sql) {
        if (!ec) {
            return;
        }
        if (ec == asio::error::operation_aborted) {
            status_ = Status::Disconnected;
            log_->error("Alias: {} query [{}] cancelled after deadline", alias_, sql);
            throw types::service_error(types::error_kind::Timeout,
                                       "Statement exceeded its deadline on connection '" + alias_ + "'");
        }
        std::string server_message(diag.server_message());
        log_->error("Alias: {} query [{}] failed: {} {}", alias_, sql, ec.message(), server_message);
        throw types::statement_error(ec, ec.message() + (server_message.empty() ? "" : ": " + server_message));
    }

} // namespace mysqlc
