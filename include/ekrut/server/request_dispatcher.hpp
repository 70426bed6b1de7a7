// request_dispatcher.hpp - Client request routing for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <optional>
#include <string>
#include <ekrut/common/net/protocol.hpp>
#include <ekrut/common/net/tcp/tcp_message_type.hpp>
#include <ekrut/server/session_registry.hpp>
#include <ekrut/server/user_manager.hpp>
#include <ekrut/server/net/transport.hpp>

namespace EKrut::Server {
    // Decodes a request, runs it against the registry or the user manager and builds the reply.
    // Any request from a connection with a session counts as activity for that session.
    class RequestDispatcher {
        public:
            RequestDispatcher(SessionRegistry& registry, UserManager& users) : mRegistry(registry), mUsers(users) {}

            // Returns the reply to send back, or std::nullopt for messages that get none
            std::optional<Net::Message> handle(const Net::ConnectionInfo& connection,
                                               EKrut::Net::TCP::ClientMessageType type,
                                               const std::string& payload);

            void connectionClosed(Net::ConnectionId connection);

            // Strips passwords. A reply too large for one frame becomes INVALID_INPUT.
            static Net::Message reply(Protocol::UserResponse response);

        private:
            Protocol::UserResponse mHandleLogin(const Net::ConnectionInfo& connection, const std::string& payload);
            Protocol::UserResponse mHandleIsLoggedIn(const std::string& payload);
            Protocol::UserResponse mHandleFetchUser(const std::string& payload);

            SessionRegistry& mRegistry;
            UserManager& mUsers;
    };
}
