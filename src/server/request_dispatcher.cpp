// request_dispatcher.cpp - Client request routing for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/request_dispatcher.hpp>
#include <ekrut/common/utils.hpp>

using EKrut::Net::TCP::ClientMessageType;
using EKrut::Net::TCP::ServerMessageType;
using EKrut::Protocol::SessionError;
using EKrut::Protocol::UserResponse;

namespace EKrut::Server {
    std::optional<Net::Message> RequestDispatcher::handle(const Net::ConnectionInfo& connection,
                                                          ClientMessageType type,
                                                          const std::string& payload) {
        // Login and logout manage the session themselves; everything else refreshes it
        if (type != ClientMessageType::LOGIN && type != ClientMessageType::LOGOUT) {
            mRegistry.resolveUser(connection.id);
        }

        switch (type) {
            case ClientMessageType::LOGIN: {
                Utils::debug("Received LOGIN from " + connection.address);
                return reply(mHandleLogin(connection, payload));
            }
            case ClientMessageType::LOGOUT: {
                Utils::debug("Received LOGOUT from " + connection.address);
                return reply(mRegistry.logout(connection.id));
            }
            case ClientMessageType::IS_LOGGED_IN: {
                Utils::debug("Received IS_LOGGED_IN from " + connection.address);
                return reply(mHandleIsLoggedIn(payload));
            }
            case ClientMessageType::FETCH_USER: {
                Utils::debug("Received FETCH_USER from " + connection.address);
                return reply(mHandleFetchUser(payload));
            }
            case ClientMessageType::GET_REGISTRATION_LIST: {
                Utils::debug("Received GET_REGISTRATION_LIST from " + connection.address);
                auto fields = Protocol::decodeFields(payload);
                if (fields.size() != 1)
                    return reply(UserResponse(SessionError::INVALID_INPUT));
                return reply(mUsers.getRegistrationList(fields[0]));
            }
            case ClientMessageType::CREATE_USER_TO_REGISTER: {
                Utils::debug("Received CREATE_USER_TO_REGISTER from " + connection.address);
                auto registration = Protocol::decodeRegistration(payload);
                if (!registration)
                    return reply(UserResponse(SessionError::INVALID_INPUT));
                return reply(mUsers.createUserToRegister(*registration));
            }
            case ClientMessageType::ACCEPT_REGISTER_USER: {
                Utils::debug("Received ACCEPT_REGISTER_USER from " + connection.address);
                auto registration = Protocol::decodeRegistration(payload);
                if (!registration)
                    return reply(UserResponse(SessionError::INVALID_INPUT));
                return reply(mUsers.acceptRegisterUser(*registration));
            }
            case ClientMessageType::UPDATE_USER: {
                Utils::debug("Received UPDATE_USER from " + connection.address);
                auto user = Protocol::decodeUser(payload);
                if (!user)
                    return reply(UserResponse(SessionError::INVALID_INPUT));
                return reply(mUsers.updateUser(*user));
            }
            default:
                Utils::warn("Unhandled message type " + std::to_string(static_cast<int>(type)) + " from " + connection.address);
                return std::nullopt;
        }
    }

    void RequestDispatcher::connectionClosed(Net::ConnectionId connection) {
        if (mRegistry.connectionClosed(connection))
            Utils::debug("Session for closed connection " + std::to_string(connection) + " removed");
    }

    Net::Message RequestDispatcher::reply(UserResponse response) {
        for (auto& user : response.users)
            user.password.clear();

        std::string payload = Protocol::encodeUserResponse(response);
        if (payload.size() > Protocol::kMaxPayload) {
            Utils::warn("Reply of " + std::to_string(payload.size()) + " bytes does not fit in a frame, answering INVALID_INPUT");
            payload = Protocol::encodeUserResponse(UserResponse(SessionError::INVALID_INPUT));
        }
        return Net::Message{ServerMessageType::USER_RESPONSE, std::move(payload)};
    }

    UserResponse RequestDispatcher::mHandleLogin(const Net::ConnectionInfo& connection, const std::string& payload) {
        auto fields = Protocol::decodeFields(payload);
        if (fields.size() != 2)
            return UserResponse(SessionError::INVALID_INPUT);
        return mRegistry.login(fields[0], fields[1], connection);
    }

    UserResponse RequestDispatcher::mHandleIsLoggedIn(const std::string& payload) {
        auto fields = Protocol::decodeFields(payload);
        if (fields.size() != 1 || fields[0].empty())
            return UserResponse(SessionError::INVALID_INPUT);
        return mRegistry.isLoggedIn(fields[0]) ? UserResponse::ok() : UserResponse(SessionError::NOT_FOUND);
    }

    UserResponse RequestDispatcher::mHandleFetchUser(const std::string& payload) {
        auto fields = Protocol::decodeFields(payload);
        if (fields.empty() || fields.size() > 2)
            return UserResponse(SessionError::INVALID_INPUT);

        auto fetchType = Protocol::fetchUserTypeFromString(fields[0]);
        if (!fetchType)
            return UserResponse(SessionError::INVALID_INPUT);

        std::optional<std::string> argument;
        if (fields.size() == 2)
            argument = fields[1];
        return mUsers.fetchUser(*fetchType, argument);
    }
}
