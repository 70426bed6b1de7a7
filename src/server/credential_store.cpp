// credential_store.cpp - User record storage for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/credential_store.hpp>
#include <ekrut/common/utils.hpp>

#include <fstream>
#include <mutex>

namespace EKrut::Server {
    void InMemoryCredentialStore::loadUsers(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open users file at path: " + path);
        }

        std::string line;
        int lineNo = 0;
        int loaded = 0;
        while (std::getline(file, line)) {
            lineNo++;
            std::string stripped = Utils::trim(line);
            if (stripped.empty() || stripped[0] == '#')
                continue;

            auto fields = Utils::split(stripped, ':');
            if (fields.size() != 9 || fields[0].empty()) {
                Utils::warn("Users file " + path + ":" + std::to_string(lineNo) + " is malformed, skipping.");
                continue;
            }

            auto type = userTypeFromString(fields[2]);
            if (!type) {
                Utils::warn("Users file " + path + ":" + std::to_string(lineNo) + " has unknown user type '" + fields[2] + "', skipping.");
                continue;
            }

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
            addUser(user);
            loaded++;
        }

        Utils::log("Loaded " + std::to_string(loaded) + " users from " + path);
    }

    void InMemoryCredentialStore::loadRegistrations(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open registrations file at path: " + path);
        }

        std::string line;
        int lineNo = 0;
        int loaded = 0;
        while (std::getline(file, line)) {
            lineNo++;
            std::string stripped = Utils::trim(line);
            if (stripped.empty() || stripped[0] == '#')
                continue;

            auto fields = Utils::split(stripped, ':');
            if (fields.size() != 9 || fields[0].empty() || (fields[2] != "0" && fields[2] != "1")) {
                Utils::warn("Registrations file " + path + ":" + std::to_string(lineNo) + " is malformed, skipping.");
                continue;
            }

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

            if (createUserToRegister(registration))
                loaded++;
        }

        Utils::log("Loaded " + std::to_string(loaded) + " pending registrations from " + path);
    }

    void InMemoryCredentialStore::addUser(const User& user) {
        std::unique_lock lock(mMutex);
        mUsers[user.username] = user;
    }

    template <typename Pred>
    std::optional<User> InMemoryCredentialStore::mFindFirst(Pred pred) const {
        std::shared_lock lock(mMutex);
        for (const auto& [username, user] : mUsers) {
            if (pred(user))
                return user;
        }
        return std::nullopt;
    }

    std::optional<User> InMemoryCredentialStore::fetchUserByUsername(const std::string& username) {
        std::shared_lock lock(mMutex);
        auto it = mUsers.find(username);
        if (it == mUsers.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<User> InMemoryCredentialStore::fetchUserByPhoneNumber(const std::string& phoneNumber) {
        return mFindFirst([&](const User& user) { return user.phoneNumber == phoneNumber; });
    }

    std::optional<User> InMemoryCredentialStore::fetchUserByEmail(const std::string& email) {
        return mFindFirst([&](const User& user) { return user.email == email; });
    }

    std::optional<User> InMemoryCredentialStore::fetchManagerByArea(const std::string& area) {
        return mFindFirst([&](const User& user) { return user.type == UserType::AREA_MANAGER && user.area == area; });
    }

    std::vector<User> InMemoryCredentialStore::fetchAllUsersByRole(UserType type) {
        std::shared_lock lock(mMutex);
        std::vector<User> users;
        for (const auto& [username, user] : mUsers) {
            if (user.type == type)
                users.push_back(user);
        }
        return users;
    }

    bool InMemoryCredentialStore::updateUser(const User& user) {
        std::unique_lock lock(mMutex);
        auto it = mUsers.find(user.username);
        if (it == mUsers.end())
            return false;
        it->second = user;
        return true;
    }

    bool InMemoryCredentialStore::createOrUpdateCustomer(const Customer& customer) {
        std::unique_lock lock(mMutex);
        if (mUsers.find(customer.username) == mUsers.end())
            return false;

        Customer stored = customer;
        if (stored.subscriberNumber == 0) {
            stored.subscriberNumber = mNextSubscriberNumber++;
            stored.firstSubscriberPurchase = true;
        }
        mCustomers[stored.username] = stored;
        return true;
    }

    std::optional<std::vector<UserRegistration>> InMemoryCredentialStore::getUserRegistrationList(const std::string& area) {
        std::shared_lock lock(mMutex);
        std::vector<UserRegistration> list;
        for (const auto& [username, registration] : mRegistrations) {
            if (registration.area == area)
                list.push_back(registration);
        }
        return list;
    }

    bool InMemoryCredentialStore::createUserToRegister(const UserRegistration& registration) {
        std::unique_lock lock(mMutex);
        return mRegistrations.emplace(registration.username, registration).second;
    }

    bool InMemoryCredentialStore::deleteUserFromRegistration(const std::string& username) {
        std::unique_lock lock(mMutex);
        return mRegistrations.erase(username) > 0;
    }

    std::optional<Customer> InMemoryCredentialStore::fetchCustomer(const std::string& username) const {
        std::shared_lock lock(mMutex);
        auto it = mCustomers.find(username);
        if (it == mCustomers.end())
            return std::nullopt;
        return it->second;
    }

    size_t InMemoryCredentialStore::userCount() const {
        std::shared_lock lock(mMutex);
        return mUsers.size();
    }
}
