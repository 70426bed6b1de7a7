// user_manager.hpp - Registration and profile requests for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <optional>
#include <string>
#include <ekrut/common/user.hpp>
#include <ekrut/common/net/protocol.hpp>
#include <ekrut/server/credential_store.hpp>
#include <ekrut/server/user_notifier.hpp>

namespace EKrut::Server {
    inline const std::string kRegistrationAcceptedMessage = "Your registration request has been accepted!";

    // Thin request/response layer over the credential store. Store errors come back as NOT_FOUND.
    class UserManager {
        public:
            UserManager(CredentialStore& store, UserNotifier& notifier) : mStore(store), mNotifier(notifier) {}

            Protocol::UserResponse fetchUser(Protocol::FetchUserType fetchType, const std::optional<std::string>& argument);

            // Promotes a REGISTERED user to CUSTOMER, records the customer, drops the pending request and
            // notifies the user.
            Protocol::UserResponse acceptRegisterUser(const UserRegistration& userToRegister);

            Protocol::UserResponse getRegistrationList(const std::string& area);
            Protocol::UserResponse createUserToRegister(const UserRegistration& registration);
            Protocol::UserResponse updateUser(const User& user);

        private:
            CredentialStore& mStore;
            UserNotifier& mNotifier;
    };
}
