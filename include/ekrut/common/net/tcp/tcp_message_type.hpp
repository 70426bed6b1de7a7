// tcp_message_type.hpp - TCP Message Types for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <variant>

namespace EKrut::Net::TCP {
    enum class ServerMessageType : uint8_t { // Server to Client
        USER_RESPONSE = 0x02, // Result code followed by an optional user or registration list
        LOGOUT_NOTICE = 0x04, // Forced logout (session expired, displaced by another login)

        // Shared
        GRACEFUL_DISCONNECT = 0xFE, // Notify client of impending disconnection
        KILL_CONNECTION    = 0xFF, // Forcefully terminate the connection, reserved for unrecoverable errors
    };

    enum class ClientMessageType : uint8_t { // Client to Server
        LOGIN                   = 0xA1, // username, password
        LOGOUT                  = 0xA2, // Voluntary logout
        IS_LOGGED_IN            = 0xA3, // username
        FETCH_USER              = 0xA4, // fetch type, argument
        GET_REGISTRATION_LIST   = 0xA5, // area
        CREATE_USER_TO_REGISTER = 0xA6, // registration
        ACCEPT_REGISTER_USER    = 0xA7, // registration
        UPDATE_USER             = 0xA8, // user

        // Shared
        GRACEFUL_DISCONNECT = 0xFE, // Notify server of impending disconnection
        KILL_CONNECTION    = 0xFF, // Forcefully terminate the connection, reserved for unrecoverable errors
    };

    // Make a variant type for either message type
    using AnyMessageType = std::variant<ServerMessageType, ClientMessageType>;
}
