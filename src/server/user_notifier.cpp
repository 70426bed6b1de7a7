// user_notifier.cpp - Outbound user notifications for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/user_notifier.hpp>
#include <ekrut/common/utils.hpp>

namespace EKrut::Server {
    void LogUserNotifier::sendNotification(const std::string& message, const std::string& email, const std::string& phoneNumber) {
        Utils::log("Notification to <" + email + "> / " + phoneNumber + ": " + message);
    }
}
