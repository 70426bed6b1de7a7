// protocol.hpp - Request/response payloads for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <ekrut/common/user.hpp>

namespace EKrut::Protocol {
    // Result tag sent back for every request
    enum class ResultType : uint8_t {
        OK            = 0x00,
        NOT_FOUND     = 0x01,
        INVALID_INPUT = 0x02,
    };

    // Finer grained error kept by the server. INVALID_CREDENTIAL travels as INVALID_INPUT plus a reason byte.
    enum class SessionError : uint8_t {
        NONE = 0,
        NOT_FOUND,
        INVALID_CREDENTIAL,
        INVALID_INPUT,
    };

    enum class FetchUserType : uint8_t {
        USER_NAME = 0,
        PHONE_NUMBER,
        EMAIL,
        AREA_MANAGER_AND_AREA,
        ROLE,
    };

    constexpr char kFieldSeparator = '\x1F';
    constexpr char kRecordSeparator = '\x1E';
    constexpr uint8_t kReasonInvalidCredential = 0x01;
    // Largest payload a single frame can carry (16-bit length)
    constexpr size_t kMaxPayload = 0xFFFF;

    ResultType toResultType(SessionError error);
    std::string resultTypeToString(ResultType result);
    std::string sessionErrorToString(SessionError error);
    std::optional<FetchUserType> fetchUserTypeFromString(const std::string& name);

    struct UserResponse {
        SessionError error = SessionError::NONE;
        std::vector<User> users;
        std::vector<UserRegistration> registrations;

        UserResponse() = default;
        explicit UserResponse(SessionError err) : error(err) {}

        static UserResponse ok() { return UserResponse(SessionError::NONE); }
        static UserResponse ok(User user) {
            UserResponse response;
            response.users.push_back(std::move(user));
            return response;
        }

        bool isOk() const { return error == SessionError::NONE; }
        ResultType resultCode() const { return toResultType(error); }

        // First user of the payload, if any
        std::optional<User> user() const {
            if (users.empty()) return std::nullopt;
            return users.front();
        }
    };

    // Field codec. Fields must not contain the separators.
    std::string encodeFields(const std::vector<std::string>& fields);
    std::vector<std::string> decodeFields(const std::string& payload);

    std::string encodeUser(const User& user);
    // Returns std::nullopt on a malformed record
    std::optional<User> decodeUser(const std::string& record);

    std::string encodeRegistration(const UserRegistration& registration);
    std::optional<UserRegistration> decodeRegistration(const std::string& record);

    // USER_RESPONSE payload: [result][reason][records...]
    std::string encodeUserResponse(const UserResponse& response);

    struct DecodedResponse {
        ResultType result = ResultType::OK;
        bool invalidCredential = false;
        std::vector<std::string> records;
    };
    std::optional<DecodedResponse> decodeUserResponse(const std::string& payload);
}
