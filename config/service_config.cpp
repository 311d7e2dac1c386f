// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "service_config.hpp"

#include <boost/program_options.hpp>

#include <fstream>

namespace po = boost::program_options;

namespace config {

    std::optional<service_config> parse_command_line(int argc, char* argv[], std::ostream& out) {
        service_config cfg;
        std::string config_file;
        int64_t timeout_ms = cfg.statement_timeout.count();

        po::options_description generic("Generic options");
        generic.add_options()("help,h", "Show help message")
        ("config,c", po::value<std::string>(&config_file), "Path to an INI style configuration file");

        po::options_description settings("Service options");
        settings.add_options()
        ("db.host", po::value<std::string>(&cfg.database.host)->default_value(cfg.database.host), "MySQL host")
        ("db.port", po::value<uint16_t>(&cfg.database.port)->default_value(cfg.database.port), "MySQL port")
        ("db.user", po::value<std::string>(&cfg.database.username)->default_value(cfg.database.username), "MySQL user")
        ("db.password", po::value<std::string>(&cfg.database.password), "MySQL password")
        ("db.name", po::value<std::string>(&cfg.database.database)->default_value(cfg.database.database), "Database")
        ("pool.size", po::value<size_t>(&cfg.pool_size)->default_value(cfg.pool_size), "Pooled connections")
        ("pool.io-threads", po::value<size_t>(&cfg.io_threads)->default_value(cfg.io_threads), "I/O threads")
        ("pool.timeout-ms",
        po::value<int64_t>(&timeout_ms)->default_value(timeout_ms),
        "Default statement deadline in milliseconds")
        ("registry.table",
        po::value<std::string>(&cfg.registry_table)->default_value(cfg.registry_table),
        "Ownership registry table name")
        ("http.port", po::value<uint16_t>(&cfg.http_port)->default_value(cfg.http_port), "HTTP server port")
        ("log.dir", po::value<std::string>(&cfg.log_dir)->default_value(cfg.log_dir), "Log file directory")
        ("log.level",
        po::value<std::string>(&cfg.log_level)->default_value(cfg.log_level),
        "trace, debug, info, warn, error")
        ("console", po::bool_switch(&cfg.console), "Run the interactive console instead of the HTTP server")
        ("caller-id",
        po::value<int32_t>(&cfg.console_caller_id)->default_value(cfg.console_caller_id),
        "Console caller identity")
        ("privileged", po::bool_switch(&cfg.console_privileged), "Console caller bypasses ownership checks");

        po::options_description all("Allowed options");
        all.add(generic).add(settings);

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, all), vm);
        if (vm.count("help")) {
            out << all << "\n";
            return std::nullopt;
        }
        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file.is_open()) {
                throw po::error("cannot open config file: " + path);
            }
            po::store(po::parse_config_file(file, settings), vm);
        }
        po::notify(vm);

        if (timeout_ms <= 0) {
            throw po::error("pool.timeout-ms must be positive");
        }
        cfg.statement_timeout = std::chrono::milliseconds(timeout_ms);
        return cfg;
    }

    boost::mysql::connect_params to_connect_params(const database_config& db) {
        boost::mysql::connect_params params;
        params.server_address.emplace_host_and_port(db.host, db.port);
        params.username = db.username;
        params.password = db.password;
        params.database = db.database;
        return params;
    }

    mysqlc::pool_options to_pool_options(const service_config& cfg) {
        return mysqlc::pool_options{
            .pool_size = cfg.pool_size,
            .io_threads = cfg.io_threads,
            .statement_timeout = cfg.statement_timeout,
        };
    }

    spdlog::level::level_enum to_log_level(const std::string& level) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            return spdlog::level::info;
        }
        return parsed;
    }

} // namespace config
