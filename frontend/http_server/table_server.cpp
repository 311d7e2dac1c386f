// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "table_server.hpp"

#include "sql_safe/sql_safe.hpp"
#include "types/errors.hpp"

#include <charconv>
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace http_server {

    namespace {
        constexpr std::string_view CALLER_ID_HEADER = "X-Caller-Id";
        constexpr std::string_view CALLER_PRIVILEGED_HEADER = "X-Caller-Privileged";

        // Malformed request that never reached the service
        class bad_request : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        std::string get_current_timestamp() {
            auto now = std::chrono::system_clock::now();
            auto in_time_t = std::chrono::system_clock::to_time_t(now);

            std::stringstream ss;
            ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %X");
            return ss.str();
        }

        http::status status_for(types::error_kind kind) {
            switch (kind) {
                case types::error_kind::InvalidIdentifier:
                case types::error_kind::ReservedWord:
                case types::error_kind::InvalidDataType:
                case types::error_kind::EmptyPayload:
                    return http::status::bad_request;
                case types::error_kind::AccessDenied:
                    return http::status::forbidden;
                case types::error_kind::DuplicateTable:
                    return http::status::conflict;
                case types::error_kind::Timeout:
                    return http::status::gateway_timeout;
                case types::error_kind::ConnectionFailed:
                    return http::status::service_unavailable;
                case types::error_kind::SchemaCreationFailed:
                case types::error_kind::StatementFailed:
                    return http::status::internal_server_error;
            }
            return http::status::internal_server_error;
        }

        void set_json(response_t& response, http::status status, const boost::json::value& body) {
            response.result(status);
            response.set(http::field::content_type, "application/json");
            response.body() = boost::json::serialize(body);
        }

        void set_error(response_t& response, http::status status, std::string_view kind, std::string_view message) {
            set_json(response, status, boost::json::object{{"error", kind}, {"message", message}});
        }

        types::caller_t read_caller(const request_t& request) {
            auto id_header = request.find(CALLER_ID_HEADER);
            if (id_header == request.end()) {
                throw bad_request("Missing header: " + std::string(CALLER_ID_HEADER));
            }
            auto text = id_header->value();
            types::caller_t caller;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), caller.id);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                throw bad_request("Invalid caller id: " + std::string(text));
            }
            if (auto privileged = request.find(CALLER_PRIVILEGED_HEADER); privileged != request.end()) {
                auto flag = privileged->value();
                caller.privileged = flag == "1" || sql_safe::iequals(flag, "true");
            }
            return caller;
        }

        const boost::json::object& body_object(const boost::json::value& body) {
            if (!body.is_object()) {
                throw bad_request("Request body must be a JSON object");
            }
            return body.as_object();
        }

        std::string required_string(const boost::json::object& object, std::string_view key) {
            auto* value = object.if_contains(key);
            if (!value) {
                throw bad_request("Missing key: " + std::string(key));
            }
            if (!value->is_string()) {
                throw bad_request("Key is not a string: " + std::string(key));
            }
            return std::string(value->as_string());
        }

        std::vector<orchestrator::column_spec> read_columns(const boost::json::object& body) {
            auto* columns = body.if_contains("columns");
            if (!columns || !columns->is_array()) {
                throw bad_request("Key 'columns' must be an array");
            }
            std::vector<orchestrator::column_spec> specs;
            for (const auto& column : columns->as_array()) {
                const auto& object = body_object(column);
                specs.push_back({required_string(object, "name"), required_string(object, "type")});
            }
            return specs;
        }

        orchestrator::row_values read_data(const boost::json::object& body) {
            auto* data = body.if_contains("data");
            if (!data || !data->is_object()) {
                throw bad_request("Key 'data' must be an object");
            }
            orchestrator::row_values values;
            for (const auto& [key, value] : data->as_object()) {
                values.emplace(std::string(key), from_json(value));
            }
            return values;
        }

        boost::json::object table_to_json(const registry::managed_table& table) {
            return boost::json::object{{"table_id", table.table_id},
                                       {"table_name", table.table_name},
                                       {"owner_id", table.owner_id},
                                       {"created_at", types::format_timestamp(table.created_at)}};
        }

        std::vector<std::string_view> split_path(std::string_view target) {
            if (auto query = target.find('?'); query != std::string_view::npos) {
                target = target.substr(0, query);
            }
            std::vector<std::string_view> segments;
            while (!target.empty()) {
                auto slash = target.find('/');
                auto segment = target.substr(0, slash);
                if (!segment.empty()) {
                    segments.push_back(segment);
                }
                if (slash == std::string_view::npos) {
                    break;
                }
                target.remove_prefix(slash + 1);
            }
            return segments;
        }

        void route(orchestrator::TableService& service, const request_t& request, response_t& response) {
            auto segments = split_path(request.target());
            const auto method = request.method();

            if (method == http::verb::get && segments.size() == 1 && segments[0] == "health") {
                set_json(response,
                         http::status::ok,
                         boost::json::object{{"status", "healthy"}, {"timestamp", get_current_timestamp()}});
                return;
            }
            if (segments.empty() || segments[0] != "tables" || segments.size() == 2 || segments.size() > 3 ||
                (segments.size() == 3 && segments[2] != "rows")) {
                set_error(response, http::status::not_found, "NotFound", "Resource not found");
                return;
            }

            auto caller = read_caller(request);
            if (segments.size() == 1 && method == http::verb::get) {
                boost::json::array tables;
                for (const auto& table : service.listTables(caller)) {
                    tables.push_back(table_to_json(table));
                }
                set_json(response, http::status::ok, boost::json::object{{"tables", std::move(tables)}});
                return;
            }
            if (segments.size() == 1 && method == http::verb::post) {
                auto body = boost::json::parse(request.body());
                const auto& object = body_object(body);
                auto name = required_string(object, "name");
                service.createTable(name, read_columns(object), caller);
                set_json(response, http::status::created, boost::json::object{{"table", name}});
                return;
            }

            std::string table(segments[1]);
            if (method == http::verb::post) {
                auto body = boost::json::parse(request.body());
                auto data = read_data(body_object(body));
                service.insertData(table, data, caller);
                set_json(response,
                         http::status::created,
                         boost::json::object{{"table", table}, {"inserted_fields", static_cast<int64_t>(data.size())}});
                return;
            }
            if (method == http::verb::get) {
                boost::json::array rows;
                for (const auto& row : service.queryData(table, caller)) {
                    boost::json::object out;
                    for (const auto& [column, value] : row) {
                        out[column] = to_json(value);
                    }
                    rows.push_back(std::move(out));
                }
                set_json(response, http::status::ok, boost::json::object{{"table", table}, {"rows", std::move(rows)}});
                return;
            }
            set_error(response, http::status::method_not_allowed, "MethodNotAllowed", "Method not allowed");
        }
    } // namespace

    types::cell_value from_json(const boost::json::value& value) {
        switch (value.kind()) {
            case boost::json::kind::null:
                return std::monostate{};
            case boost::json::kind::bool_:
                return value.get_bool();
            case boost::json::kind::int64:
                return value.get_int64();
            case boost::json::kind::uint64:
                if (value.get_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return std::to_string(value.get_uint64());
                }
                return static_cast<int64_t>(value.get_uint64());
            case boost::json::kind::double_:
                return boost::json::serialize(value);
            case boost::json::kind::string:
                return sql_safe::infer_value(value.get_string());
            case boost::json::kind::array:
            case boost::json::kind::object:
                break;
        }
        throw bad_request("Column values must be scalars");
    }

    boost::json::value to_json(const types::cell_value& value) {
        switch (types::kind_of(value)) {
            case types::cell_kind::NULL_VALUE:
                return nullptr;
            case types::cell_kind::INTEGER:
                return std::get<int64_t>(value);
            case types::cell_kind::BOOLEAN:
                return std::get<bool>(value);
            case types::cell_kind::TIMESTAMP:
                return boost::json::string(types::format_timestamp(std::get<types::timestamp_t>(value)));
            case types::cell_kind::TEXT:
                return boost::json::string(std::get<std::string>(value));
        }
        return nullptr;
    }

    response_t handle_request(orchestrator::TableService& service, const request_t& request) {
        response_t response;
        response.version(request.version());
        response.keep_alive(false);

        try {
            route(service, request, response);
        } catch (const types::service_error& e) {
            set_error(response, status_for(e.kind()), types::error_kind_name(e.kind()), e.what());
        } catch (const bad_request& e) {
            set_error(response, http::status::bad_request, "BadRequest", e.what());
        } catch (const boost::system::system_error& e) {
            // boost::json::parse failures
            set_error(response, http::status::bad_request, "BadRequest", std::string("Invalid JSON: ") + e.what());
        } catch (const std::exception& e) {
            get_logger(logger_tag::HTTP_SERVER)
                ->error("{} {} failed: {}",
                        std::string_view(request.method_string()),
                        std::string_view(request.target()),
                        e.what());
            set_error(response, http::status::internal_server_error, "InternalError", "Internal server error");
        }
        response.prepare_payload();
        return response;
    }

    Session::Session(tcp::socket socket, std::shared_ptr<orchestrator::TableService> service)
        : socket_(std::move(socket))
        , service_(std::move(service)) {}

    void Session::start() { read_request(); }

    void Session::read_request() {
        auto self = shared_from_this();
        http::async_read(socket_, buffer_, request_, [self](beast::error_code ec, std::size_t) {
            if (ec) {
                return;
            }
            self->response_ = handle_request(*self->service_, self->request_);
            self->write_response();
        });
    }

    void Session::write_response() {
        auto self = shared_from_this();
        http::async_write(socket_, response_, [self](beast::error_code ec, std::size_t) {
            self->socket_.shutdown(tcp::socket::shutdown_send, ec);
        });
    }

    Server::Server(asio::io_context& ioc, unsigned short port, std::shared_ptr<orchestrator::TableService> service)
        : ioc_(ioc)
        , acceptor_(ioc, tcp::endpoint(tcp::v4(), port))
        , service_(std::move(service))
        , log_(get_logger(logger_tag::HTTP_SERVER)) {
        log_->info("Listening on port {}", port);
        accept();
    }

    void Server::accept() {
        acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<Session>(std::move(socket), service_)->start();
            } else {
                log_->warn("Accept failed: {}", ec.message());
            }
            accept();
        });
    }

} // namespace http_server
