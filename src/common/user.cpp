// user.cpp - User entities for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/common/user.hpp>

#include <array>
#include <utility>

namespace EKrut {
    namespace {
        const std::array<std::pair<UserType, const char*>, 9> kUserTypeNames = {{
            {UserType::REGISTERED, "REGISTERED"},
            {UserType::CUSTOMER, "CUSTOMER"},
            {UserType::SUBSCRIBER, "SUBSCRIBER"},
            {UserType::AREA_MANAGER, "AREA_MANAGER"},
            {UserType::CEO, "CEO"},
            {UserType::OPERATIONS_WORKER, "OPERATIONS_WORKER"},
            {UserType::MARKETING_MANAGER, "MARKETING_MANAGER"},
            {UserType::MARKETING_WORKER, "MARKETING_WORKER"},
            {UserType::DELIVERY_WORKER, "DELIVERY_WORKER"},
        }};
    }

    std::string userTypeToString(UserType type) {
        for (const auto& [value, name] : kUserTypeNames) {
            if (value == type)
                return name;
        }
        return "UNKNOWN";
    }

    std::optional<UserType> userTypeFromString(const std::string& name) {
        for (const auto& [value, typeName] : kUserTypeNames) {
            if (name == typeName)
                return value;
        }
        return std::nullopt;
    }
}
