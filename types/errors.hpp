// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Dynamico

#pragma once

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace types {

    enum class error_kind : uint8_t
    {
        InvalidIdentifier,
        ReservedWord,
        InvalidDataType,
        DuplicateTable,
        SchemaCreationFailed,
        StatementFailed,
        AccessDenied,
        EmptyPayload,
        Timeout,
        ConnectionFailed
    };

    inline std::string_view error_kind_name(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::InvalidIdentifier:
                return "InvalidIdentifier";
            case error_kind::ReservedWord:
                return "ReservedWord";
            case error_kind::InvalidDataType:
                return "InvalidDataType";
            case error_kind::DuplicateTable:
                return "DuplicateTable";
            case error_kind::SchemaCreationFailed:
                return "SchemaCreationFailed";
            case error_kind::StatementFailed:
                return "StatementFailed";
            case error_kind::AccessDenied:
                return "AccessDenied";
            case error_kind::EmptyPayload:
                return "EmptyPayload";
            case error_kind::Timeout:
                return "Timeout";
            case error_kind::ConnectionFailed:
                return "ConnectionFailed";
        }
        return "Unknown";
    }

    // Input-validation kinds the caller can fix by correcting the request
    inline bool is_validation_error(error_kind kind) noexcept {
        return kind == error_kind::InvalidIdentifier || kind == error_kind::ReservedWord ||
               kind == error_kind::InvalidDataType || kind == error_kind::EmptyPayload;
    }

    class service_error : public std::runtime_error {
    public:
        service_error(error_kind kind, const std::string& message)
            : std::runtime_error(message)
            , kind_(kind) {}

        error_kind kind() const noexcept { return kind_; }

    private:
        error_kind kind_;
    };

    // Raised by the database capability, carries the engine error code
    class statement_error : public service_error {
    public:
        statement_error(boost::system::error_code code, const std::string& message)
            : service_error(error_kind::StatementFailed, message)
            , code_(code) {}

        const boost::system::error_code& code() const noexcept { return code_; }

    private:
        boost::system::error_code code_;
    };

} // namespace types
