// credential_store.hpp - User record storage for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <ekrut/common/user.hpp>

namespace EKrut::Server {
    // Storage unavailable or inconsistent. Callers treat it like "not found".
    class StoreError : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // Access to user, customer and registration records. Every method may throw StoreError.
    class CredentialStore {
        public:
            virtual ~CredentialStore() = default;

            virtual std::optional<User> fetchUserByUsername(const std::string& username) = 0;
            virtual std::optional<User> fetchUserByPhoneNumber(const std::string& phoneNumber) = 0;
            virtual std::optional<User> fetchUserByEmail(const std::string& email) = 0;
            virtual std::optional<User> fetchManagerByArea(const std::string& area) = 0;
            virtual std::vector<User> fetchAllUsersByRole(UserType type) = 0;

            // Returns false if the user does not exist
            virtual bool updateUser(const User& user) = 0;
            virtual bool createOrUpdateCustomer(const Customer& customer) = 0;

            // Returns std::nullopt when no list could be produced
            virtual std::optional<std::vector<UserRegistration>> getUserRegistrationList(const std::string& area) = 0;
            // Returns false if a registration for the username already exists
            virtual bool createUserToRegister(const UserRegistration& registration) = 0;
            // Returns false if there was nothing to delete
            virtual bool deleteUserFromRegistration(const std::string& username) = 0;
    };

    // Thread-safe store kept in memory, optionally seeded from colon separated files.
    class InMemoryCredentialStore : public CredentialStore {
        public:
            InMemoryCredentialStore() = default;

            // Users file: username:password:type:firstName:lastName:id:email:phone:area
            // Throws std::runtime_error if the file cannot be read; malformed lines are skipped with a warning.
            void loadUsers(const std::string& path);
            // Registrations file: username:customerOrSub:monthlyCharge:creditCard:area:firstName:lastName:email:phone
            void loadRegistrations(const std::string& path);

            void addUser(const User& user);

            std::optional<User> fetchUserByUsername(const std::string& username) override;
            std::optional<User> fetchUserByPhoneNumber(const std::string& phoneNumber) override;
            std::optional<User> fetchUserByEmail(const std::string& email) override;
            std::optional<User> fetchManagerByArea(const std::string& area) override;
            std::vector<User> fetchAllUsersByRole(UserType type) override;

            bool updateUser(const User& user) override;
            bool createOrUpdateCustomer(const Customer& customer) override;

            std::optional<std::vector<UserRegistration>> getUserRegistrationList(const std::string& area) override;
            bool createUserToRegister(const UserRegistration& registration) override;
            bool deleteUserFromRegistration(const std::string& username) override;

            std::optional<Customer> fetchCustomer(const std::string& username) const;
            size_t userCount() const;

        private:
            template <typename Pred>
            std::optional<User> mFindFirst(Pred pred) const;

            mutable std::shared_mutex mMutex;
            std::map<std::string, User> mUsers; // Ordered so scans are deterministic
            std::map<std::string, Customer> mCustomers;
            std::map<std::string, UserRegistration> mRegistrations;
            int mNextSubscriberNumber = 1000;
    };
}
