// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "connectors/mysql_manager.hpp"

#include <spdlog/common.h>

#include <boost/mysql/connect_params.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace config {

    struct database_config {
        std::string host = "localhost";
        uint16_t port = 3306;
        std::string username = "root";
        std::string password;
        std::string database = "dynamico_db";
    };

    struct service_config {
        database_config database;
        size_t pool_size = 4;
        size_t io_threads = 2;
        std::chrono::milliseconds statement_timeout{5000};
        std::string registry_table = "app_managed_tables";
        uint16_t http_port = 8085;
        std::string log_dir = "/tmp/dynamico/logs";
        std::string log_level = "info";

        // Interactive console instead of the HTTP server
        bool console = false;
        int32_t console_caller_id = 2;
        bool console_privileged = false;
    };

    // Command line first, then the optional --config file for anything the
    // command line left unset. Returns nullopt when --help was printed.
    // Throws boost::program_options::error on malformed input.
    std::optional<service_config> parse_command_line(int argc, char* argv[], std::ostream& out = std::cout);

    boost::mysql::connect_params to_connect_params(const database_config& db);
    mysqlc::pool_options to_pool_options(const service_config& cfg);
    spdlog::level::level_enum to_log_level(const std::string& level);

    inline std::ostream& operator<<(std::ostream& os, const database_config& db) {
        os << "Host: " << db.host << std::endl;
        os << "Port: " << db.port << std::endl;
        os << "Username: " << db.username << std::endl;
        os << "Database: " << db.database << std::endl;
        return os;
    }

} // namespace config
