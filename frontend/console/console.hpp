// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include "orchestrator/table_service.hpp"
#include "types/caller.hpp"
#include "utility/logger.hpp"

#include <iostream>
#include <string>

namespace console {

    // Interactive menu over a TableService. One caller identity per session.
    class Console {
    public:
        Console(orchestrator::TableService& service,
                types::caller_t caller,
                std::istream& in = std::cin,
                std::ostream& out = std::cout);

        // Returns on 'Q' or end of input. Service errors are printed and the
        // loop continues.
        void run();

    private:
        // false when the session should end
        bool handleChoice_(const std::string& choice);
        void showMenu_();
        void createTable_();
        void insertData_();
        void queryData_();
        void listTables_();
        bool readLine_(std::string& line);

        orchestrator::TableService& service_;
        types::caller_t caller_;
        std::istream& in_;
        std::ostream& out_;
        log_t log_;
    };

} // namespace console
