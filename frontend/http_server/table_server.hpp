// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "orchestrator/table_service.hpp"
#include "utility/logger.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace http_server {

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    using request_t = http::request<http::string_body>;
    using response_t = http::response<http::string_body>;

    // Routes one request to the table service. Kept free of the socket so the
    // routing can be exercised without a listener.
    //
    //   GET  /health
    //   GET  /tables
    //   POST /tables                  {"name": "...", "columns": [{"name": "...", "type": "..."}]}
    //   POST /tables/{name}/rows      {"data": {"column": value}}
    //   GET  /tables/{name}/rows
    //
    // Identity comes from X-Caller-Id / X-Caller-Privileged, which an
    // authenticating proxy in front of this server is expected to set.
    response_t handle_request(orchestrator::TableService& service, const request_t& request);

    // JSON value to a bound cell; strings go through sql_safe::infer_value
    types::cell_value from_json(const boost::json::value& value);
    boost::json::value to_json(const types::cell_value& value);

    class Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        beast::flat_buffer buffer_{8192};
        request_t request_;
        response_t response_;
        std::shared_ptr<orchestrator::TableService> service_;

    public:
        Session(tcp::socket socket, std::shared_ptr<orchestrator::TableService> service);
        void start();

    private:
        void read_request();
        void write_response();
    };

    class Server {
        asio::io_context& ioc_;
        tcp::acceptor acceptor_;
        std::shared_ptr<orchestrator::TableService> service_;
        log_t log_;

    public:
        Server(asio::io_context& ioc, unsigned short port, std::shared_ptr<orchestrator::TableService> service);

    private:
        void accept();
    };

} // namespace http_server
