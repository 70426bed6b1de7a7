// connected_client_view.hpp - Observable list of connected clients for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <ekrut/common/user.hpp>

namespace EKrut::Server {
    struct ConnectedClient {
        std::string address;
        std::string username;
        UserType type = UserType::REGISTERED;

        // Address is not part of the identity; one entry per user
        bool operator==(const ConnectedClient& other) const {
            return username == other.username && type == other.type;
        }
    };

    enum class ViewChange : uint8_t {
        ADDED,
        REMOVED,
    };

    // Presentation projection of the live sessions. Only SessionRegistry mutates it, under its own lock,
    // so listeners run with that lock held and must not call back into the registry.
    class ConnectedClientView {
        public:
            using Listener = std::function<void(ViewChange, const ConnectedClient&)>;
            using ListenerId = uint64_t;

            ListenerId subscribe(Listener listener);
            void unsubscribe(ListenerId id);

            std::vector<ConnectedClient> snapshot() const;
            size_t size() const;
            bool contains(const std::string& username) const;

        private:
            friend class SessionRegistry;

            void mAdd(const ConnectedClient& client);
            // Returns false if there was no entry for the user
            bool mRemove(const std::string& username);
            void mPublish(ViewChange change, const ConnectedClient& client);

            mutable std::shared_mutex mMutex;
            std::vector<ConnectedClient> mClients; // Insertion order
            std::mutex mListenerMutex;
            std::map<ListenerId, Listener> mListeners;
            ListenerId mNextListenerId = 1;
    };
}
