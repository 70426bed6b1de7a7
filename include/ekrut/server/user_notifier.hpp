// user_notifier.hpp - Outbound user notifications for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <string>

namespace EKrut::Server {
    class UserNotifier {
        public:
            virtual ~UserNotifier() = default;

            // Deliver message by email and SMS. Fire-and-forget.
            virtual void sendNotification(const std::string& message, const std::string& email, const std::string& phoneNumber) = 0;
    };

    // Writes notifications to the server log instead of delivering them
    class LogUserNotifier : public UserNotifier {
        public:
            void sendNotification(const std::string& message, const std::string& email, const std::string& phoneNumber) override;
    };
}
