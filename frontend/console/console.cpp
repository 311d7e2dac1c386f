// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#include "console.hpp"

#include "types/errors.hpp"

#include <algorithm>
#include <cctype>

namespace console {

    namespace {
        bool is_blank(const std::string& text) {
            return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
        }

        std::string to_upper(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
            return text;
        }
    } // namespace

    Console::Console(orchestrator::TableService& service,
                     types::caller_t caller,
                     std::istream& in,
                     std::ostream& out)
        : service_(service)
        , caller_(caller)
        , in_(in)
        , out_(out)
        , log_(get_logger(logger_tag::CONSOLE)) {}

    void Console::run() {
        out_ << "--- Dynamic Database Application ---\n";
        out_ << "--- Logged in as User ID: " << caller_.id << (caller_.privileged ? " (privileged)" : "") << " ---\n";
        log_->info("Console session started for caller {}", caller_.id);

        std::string choice;
        while (true) {
            showMenu_();
            if (!readLine_(choice)) {
                break;
            }
            try {
                if (!handleChoice_(to_upper(choice))) {
                    break;
                }
            } catch (const types::service_error& e) {
                log_->warn("Console request failed ({}): {}", types::error_kind_name(e.kind()), e.what());
                out_ << "\nERROR: " << e.what() << "\n";
            }
        }
        out_ << "Exiting application...\n";
        log_->info("Console session ended for caller {}", caller_.id);
    }

    bool Console::handleChoice_(const std::string& choice) {
        if (choice == "1") {
            createTable_();
        } else if (choice == "2") {
            insertData_();
        } else if (choice == "3") {
            queryData_();
        } else if (choice == "4") {
            listTables_();
        } else if (choice == "Q") {
            return false;
        } else {
            out_ << "Invalid option. Please try again.\n";
        }
        return true;
    }

    void Console::showMenu_() {
        out_ << "\n--- Main Menu ---\n"
             << "1. Create a new table\n"
             << "2. Insert data into a table\n"
             << "3. Query data from a table\n"
             << "4. List tables\n"
             << "Q. Quit\n"
             << "Select an option: " << std::flush;
    }

    void Console::createTable_() {
        std::string table_name;
        out_ << "Enter new table name (e.g., 'contacts'): " << std::flush;
        readLine_(table_name);

        std::vector<orchestrator::column_spec> columns;
        out_ << "Define columns (press Enter on an empty name to finish):\n";
        std::string column_name;
        std::string column_type;
        while (true) {
            out_ << "  Column Name (e.g., 'full_name'): " << std::flush;
            if (!readLine_(column_name) || is_blank(column_name)) {
                break;
            }
            out_ << "  Data Type for '" << column_name << "' (e.g., 'VARCHAR(100)', 'INT'): " << std::flush;
            if (!readLine_(column_type) || is_blank(column_type)) {
                out_ << "Data type cannot be empty. Column not added.\n";
                continue;
            }
            columns.push_back({column_name, column_type});
        }

        if (columns.empty()) {
            out_ << "No columns defined. Table creation cancelled.\n";
            return;
        }

        out_ << "\nCreating table '" << table_name << "' with " << columns.size() << " columns...\n";
        service_.createTable(table_name, columns, caller_);
        out_ << "Table '" << table_name << "' created.\n";
    }

    void Console::insertData_() {
        std::string table_name;
        out_ << "Enter table name to insert into: " << std::flush;
        readLine_(table_name);

        orchestrator::text_values data;
        out_ << "Enter data as key-value pairs (press Enter on an empty key to finish):\n";
        std::string key;
        std::string value;
        while (true) {
            out_ << "  Column Name (key): " << std::flush;
            if (!readLine_(key) || is_blank(key)) {
                break;
            }
            out_ << "  Value for '" << key << "': " << std::flush;
            readLine_(value);
            data[key] = value;
        }

        if (data.empty()) {
            out_ << "No data provided. Insert cancelled.\n";
            return;
        }

        out_ << "\nInserting " << data.size() << " fields into '" << table_name << "'...\n";
        service_.insertText(table_name, data, caller_);
        out_ << "Insert completed.\n";
    }

    void Console::queryData_() {
        std::string table_name;
        out_ << "Enter table name to query: " << std::flush;
        readLine_(table_name);

        auto rows = service_.queryData(table_name, caller_);
        out_ << "\n--- Query Results for '" << table_name << "' ---\n";
        for (const auto& row : rows) {
            bool first = true;
            for (const auto& [column, value] : row) {
                out_ << (first ? "" : ", ") << column << ": " << types::to_string(value);
                first = false;
            }
            out_ << "\n";
        }
        if (rows.empty()) {
            out_ << "(No data found or table is empty)\n";
        }
    }

    void Console::listTables_() {
        auto tables = service_.listTables(caller_);
        out_ << "\n--- Tables ---\n";
        for (const auto& table : tables) {
            out_ << table.table_id << ". " << table.table_name << " (owner " << table.owner_id << ", created "
                 << types::format_timestamp(table.created_at) << ")\n";
        }
        if (tables.empty()) {
            out_ << "(No tables)\n";
        }
    }

    bool Console::readLine_(std::string& line) {
        if (!std::getline(in_, line)) {
            line.clear();
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    }

} // namespace console
