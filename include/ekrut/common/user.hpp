// user.hpp - User entities for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace EKrut {
    enum class UserType : uint8_t {
        REGISTERED = 0x00, // Signed up, registration not accepted yet
        CUSTOMER,
        SUBSCRIBER,
        AREA_MANAGER,
        CEO,
        OPERATIONS_WORKER,
        MARKETING_MANAGER,
        MARKETING_WORKER,
        DELIVERY_WORKER,
    };

    std::string userTypeToString(UserType type);
    // Returns std::nullopt for unknown names
    std::optional<UserType> userTypeFromString(const std::string& name);

    // Snapshot of a principal. Callers always get copies, never references into server state.
    struct User {
        std::string username;
        std::string password;
        UserType type = UserType::REGISTERED;
        std::string firstName;
        std::string lastName;
        std::string id;
        std::string email;
        std::string phoneNumber;
        std::string area;

        bool operator==(const User& other) const { return username == other.username; }
        bool operator!=(const User& other) const { return !(*this == other); }
    };

    // A pending request to become a customer or subscriber, reviewed by the area manager
    struct UserRegistration {
        std::string username;
        std::string customerOrSub; // "customer" or "subscriber"
        bool monthlyCharge = false;
        std::string creditCardNumber;
        std::string area;
        std::string firstName;
        std::string lastName;
        std::string email;
        std::string phoneNumber;

        bool isSubscriber() const { return customerOrSub == "subscriber"; }
    };

    struct Customer {
        int subscriberNumber = -1; // 0 = assign a new subscriber number, -1 = plain customer
        std::string username;
        bool monthlyCharge = false;
        std::string creditCardNumber;
        bool firstSubscriberPurchase = false;
    };
}
