// user_manager.cpp - Registration and profile requests for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/user_manager.hpp>
#include <ekrut/common/utils.hpp>

using EKrut::Protocol::FetchUserType;
using EKrut::Protocol::SessionError;
using EKrut::Protocol::UserResponse;

namespace EKrut::Server {
    UserResponse UserManager::fetchUser(FetchUserType fetchType, const std::optional<std::string>& argument) {
        if (!argument || argument->empty())
            return UserResponse(SessionError::INVALID_INPUT);

        UserResponse response;
        try {
            std::optional<User> user;
            switch (fetchType) {
                case FetchUserType::USER_NAME:
                    user = mStore.fetchUserByUsername(*argument);
                    break;
                case FetchUserType::PHONE_NUMBER:
                    user = mStore.fetchUserByPhoneNumber(*argument);
                    break;
                case FetchUserType::EMAIL:
                    user = mStore.fetchUserByEmail(*argument);
                    break;
                case FetchUserType::AREA_MANAGER_AND_AREA:
                    user = mStore.fetchManagerByArea(*argument);
                    break;
                case FetchUserType::ROLE: {
                    auto type = userTypeFromString(*argument);
                    if (!type)
                        return UserResponse(SessionError::INVALID_INPUT);
                    response.users = mStore.fetchAllUsersByRole(*type);
                    break;
                }
            }
            if (user)
                response.users.push_back(std::move(*user));
        } catch (const std::exception& e) {
            Utils::warn("Fetching user '" + *argument + "' failed: " + e.what());
            return UserResponse(SessionError::NOT_FOUND);
        }

        if (response.users.empty())
            return UserResponse(SessionError::NOT_FOUND);
        return response;
    }

    UserResponse UserManager::acceptRegisterUser(const UserRegistration& userToRegister) {
        try {
            auto user = mStore.fetchUserByUsername(userToRegister.username);
            if (!user) {
                Utils::warn("Accepting registration for unknown user " + userToRegister.username);
                return UserResponse(SessionError::NOT_FOUND);
            }

            // Claim the pending request before touching the user, so a missing request changes nothing
            if (!mStore.deleteUserFromRegistration(userToRegister.username)) {
                Utils::warn("No pending registration for " + userToRegister.username);
                return UserResponse(SessionError::NOT_FOUND);
            }

            User promoted = *user;
            if (promoted.type == UserType::REGISTERED)
                promoted.type = UserType::CUSTOMER;

            Customer customer;
            customer.subscriberNumber = userToRegister.isSubscriber() ? 0 : -1;
            customer.username = userToRegister.username;
            customer.monthlyCharge = userToRegister.monthlyCharge;
            customer.creditCardNumber = userToRegister.creditCardNumber;
            customer.firstSubscriberPurchase = false;

            if (!mStore.updateUser(promoted) || !mStore.createOrUpdateCustomer(customer)) {
                Utils::warn("Accepting registration for " + userToRegister.username + " failed in the store, restoring the request");
                if (!mStore.updateUser(*user) || !mStore.createUserToRegister(userToRegister))
                    Utils::error("Could not restore registration state of " + userToRegister.username);
                return UserResponse(SessionError::NOT_FOUND);
            }

            Utils::log("Registration of " + userToRegister.username + " accepted");
            mNotifier.sendNotification(kRegistrationAcceptedMessage, user->email, user->phoneNumber);
        } catch (const std::exception& e) {
            Utils::warn("Accepting registration for " + userToRegister.username + " failed: " + e.what());
            return UserResponse(SessionError::NOT_FOUND);
        }

        return UserResponse::ok();
    }

    UserResponse UserManager::getRegistrationList(const std::string& area) {
        try {
            auto list = mStore.getUserRegistrationList(area);
            if (!list)
                return UserResponse(SessionError::NOT_FOUND);

            UserResponse response;
            response.registrations = std::move(*list);
            return response;
        } catch (const std::exception& e) {
            Utils::warn("Fetching registration list for area '" + area + "' failed: " + e.what());
            return UserResponse(SessionError::NOT_FOUND);
        }
    }

    UserResponse UserManager::createUserToRegister(const UserRegistration& registration) {
        try {
            if (mStore.createUserToRegister(registration))
                return UserResponse::ok();
        } catch (const std::exception& e) {
            Utils::warn("Creating registration for " + registration.username + " failed: " + e.what());
        }
        return UserResponse(SessionError::NOT_FOUND);
    }

    UserResponse UserManager::updateUser(const User& user) {
        if (user.username.empty())
            return UserResponse(SessionError::INVALID_INPUT);

        try {
            User updated = user;
            // Users leave the server without their password; an empty one means "unchanged"
            if (updated.password.empty()) {
                auto stored = mStore.fetchUserByUsername(user.username);
                if (!stored)
                    return UserResponse(SessionError::NOT_FOUND);
                updated.password = stored->password;
            }

            if (mStore.updateUser(updated))
                return UserResponse::ok();
        } catch (const std::exception& e) {
            Utils::warn("Updating user " + user.username + " failed: " + e.what());
        }
        return UserResponse(SessionError::NOT_FOUND);
    }
}
