// protocol.cpp - Request/response payloads for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/common/net/protocol.hpp>
#include <ekrut/common/utils.hpp>

namespace EKrut::Protocol {
    ResultType toResultType(SessionError error) {
        switch (error) {
            case SessionError::NONE: return ResultType::OK;
            case SessionError::NOT_FOUND: return ResultType::NOT_FOUND;
            case SessionError::INVALID_CREDENTIAL: return ResultType::INVALID_INPUT;
            case SessionError::INVALID_INPUT: return ResultType::INVALID_INPUT;
        }
        return ResultType::INVALID_INPUT;
    }

    std::string resultTypeToString(ResultType result) {
        switch (result) {
            case ResultType::OK: return "OK";
            case ResultType::NOT_FOUND: return "NOT_FOUND";
            case ResultType::INVALID_INPUT: return "INVALID_INPUT";
        }
        return "UNKNOWN";
    }

    std::string sessionErrorToString(SessionError error) {
        switch (error) {
            case SessionError::NONE: return "NONE";
            case SessionError::NOT_FOUND: return "NOT_FOUND";
            case SessionError::INVALID_CREDENTIAL: return "INVALID_CREDENTIAL";
            case SessionError::INVALID_INPUT: return "INVALID_INPUT";
        }
        return "UNKNOWN";
    }

    std::optional<FetchUserType> fetchUserTypeFromString(const std::string& name) {
        if (name == "USER_NAME") return FetchUserType::USER_NAME;
        if (name == "PHONE_NUMBER") return FetchUserType::PHONE_NUMBER;
        if (name == "EMAIL") return FetchUserType::EMAIL;
        if (name == "AREA_MANAGER_AND_AREA") return FetchUserType::AREA_MANAGER_AND_AREA;
        if (name == "ROLE") return FetchUserType::ROLE;
        return std::nullopt;
    }

    std::string encodeFields(const std::vector<std::string>& fields) {
        std::string out;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out.push_back(kFieldSeparator);
            out += fields[i];
        }
        return out;
    }

    std::vector<std::string> decodeFields(const std::string& payload) {
        if (payload.empty()) return {};
        return Utils::split(payload, kFieldSeparator);
    }

    std::string encodeUser(const User& user) {
        return encodeFields({
            user.username, user.password, userTypeToString(user.type),
            user.firstName, user.lastName, user.id,
            user.email, user.phoneNumber, user.area
        });
    }

    std::optional<User> decodeUser(const std::string& record) {
        auto fields = decodeFields(record);
        if (fields.size() != 9 || fields[0].empty())
            return std::nullopt;

        auto type = userTypeFromString(fields[2]);
        if (!type)
            return std::nullopt;

        User user;
        user.username = fields[0];
        user.password = fields[1];
        user.type = *type;
        user.firstName = fields[3];
        user.lastName = fields[4];
        user.id = fields[5];
        user.email = fields[6];
        user.phoneNumber = fields[7];
        user.area = fields[8];
        return user;
    }

    std::string encodeRegistration(const UserRegistration& registration) {
        return encodeFields({
            registration.username, registration.customerOrSub,
            registration.monthlyCharge ? "1" : "0", registration.creditCardNumber,
            registration.area, registration.firstName, registration.lastName,
            registration.email, registration.phoneNumber
        });
    }

    std::optional<UserRegistration> decodeRegistration(const std::string& record) {
        auto fields = decodeFields(record);
        if (fields.size() != 9 || fields[0].empty())
            return std::nullopt;

        if (fields[2] != "0" && fields[2] != "1")
            return std::nullopt;

        UserRegistration registration;
        registration.username = fields[0];
        registration.customerOrSub = fields[1];
        registration.monthlyCharge = fields[2] == "1";
        registration.creditCardNumber = fields[3];
        registration.area = fields[4];
        registration.firstName = fields[5];
        registration.lastName = fields[6];
        registration.email = fields[7];
        registration.phoneNumber = fields[8];
        return registration;
    }

    std::string encodeUserResponse(const UserResponse& response) {
        std::string out;
        out.push_back(static_cast<char>(response.resultCode()));
        out.push_back(static_cast<char>(response.error == SessionError::INVALID_CREDENTIAL ? kReasonInvalidCredential : 0x00));

        std::vector<std::string> records;
        for (const auto& user : response.users)
            records.push_back(encodeUser(user));
        for (const auto& registration : response.registrations)
            records.push_back(encodeRegistration(registration));

        for (size_t i = 0; i < records.size(); ++i) {
            if (i > 0) out.push_back(kRecordSeparator);
            out += records[i];
        }
        return out;
    }

    std::optional<DecodedResponse> decodeUserResponse(const std::string& payload) {
        if (payload.size() < 2)
            return std::nullopt;

        uint8_t code = static_cast<uint8_t>(payload[0]);
        if (code > static_cast<uint8_t>(ResultType::INVALID_INPUT))
            return std::nullopt;

        DecodedResponse decoded;
        decoded.result = static_cast<ResultType>(code);
        decoded.invalidCredential = static_cast<uint8_t>(payload[1]) == kReasonInvalidCredential;

        std::string body = payload.substr(2);
        if (!body.empty())
            decoded.records = Utils::split(body, kRecordSeparator);
        return decoded;
    }
}
