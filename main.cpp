// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/program_options.hpp>

#include "config/service_config.hpp"
#include "connectors/mysql_manager.hpp"
#include "frontend/console/console.hpp"
#include "frontend/http_server/table_server.hpp"
#include "orchestrator/table_service.hpp"
#include "registry/ownership_registry.hpp"
#include "utility/logger.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    std::optional<config::service_config> parsed;
    try {
        parsed = config::parse_command_line(argc, argv);
    } catch (const po::error& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        std::cerr << "Run with --help for the list of options.\n";
        return 1;
    }

    // --help
    if (!parsed) {
        return 0;
    }
    const auto& cfg = *parsed;

    initialize_all_loggers(cfg.log_dir, config::to_log_level(cfg.log_level));
    auto log = get_logger(logger_tag::TABLE_SERVICE);

    try {
        auto conn_manager = std::make_shared<mysqlc::ConnectorManager>(config::to_connect_params(cfg.database),
                                                                       config::to_pool_options(cfg));
        conn_manager->start();

        auto registry = std::make_shared<registry::OwnershipRegistry>(conn_manager, cfg.registry_table);
        registry->ensureStoreExists();

        auto service = std::make_shared<orchestrator::TableService>(conn_manager, registry);

        if (cfg.console) {
            console::Console console(*service, types::caller_t{cfg.console_caller_id, cfg.console_privileged});
            console.run();
        } else {
            boost::asio::io_context ctx;
            boost::asio::signal_set signals(ctx, SIGINT, SIGTERM);
            signals.async_wait([&ctx](const boost::system::error_code&, int) { ctx.stop(); });

            http_server::Server server(ctx, cfg.http_port, service);
            std::cout << "HTTP Server running on port " << cfg.http_port << "..." << std::endl;
            ctx.run();
        }

        conn_manager->stop();
    } catch (const types::service_error& e) {
        log->critical("Start-up failed ({}): {}", types::error_kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        log->critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
