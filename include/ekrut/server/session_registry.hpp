// session_registry.hpp - Session Registry for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <ekrut/common/user.hpp>
#include <ekrut/common/utils.hpp>
#include <ekrut/common/net/protocol.hpp>
#include <ekrut/server/connected_client_view.hpp>
#include <ekrut/server/credential_store.hpp>
#include <ekrut/server/timer_service.hpp>
#include <ekrut/server/net/transport.hpp>

namespace EKrut::Server {
    inline const std::string kSessionExpiredReason = "Session expired";
    inline const std::string kDisplacedReason = "Logged in from another connection";

    // Snapshot of one live session
    struct SessionState {
        User user; // Password is never kept
        Net::ConnectionInfo connection;
        TimerHandle timer = 0; // Pending idle timer, 0 once it fired
        uint64_t generation = 0; // Identifies the armed timer; a firing timer with another generation is stale
        Clock::time_point expires{}; // Strictly increases on every touch
    };

    // Tracks who is logged in on which connection and evicts idle sessions.
    //
    // Sessions are keyed by username. The connection index and the connected client view are derived from
    // that map and only change inside mAttach()/mDetach(), which run under mMutex. No operation performs
    // transport I/O while holding mMutex.
    //
    // The registry must be destroyed after the timer service stops dispatching callbacks.
    class SessionRegistry {
        public:
            SessionRegistry(CredentialStore& store, TimerService& timers, Net::Transport& transport,
                            std::chrono::milliseconds idleTimeout = Utils::defaultIdleTimeout());
            ~SessionRegistry();

            SessionRegistry(const SessionRegistry&) = delete;
            SessionRegistry& operator=(const SessionRegistry&) = delete;

            // Authenticate username on connection and open a session.
            // INVALID_INPUT for empty arguments, NOT_FOUND for an unknown user or a store failure,
            // INVALID_CREDENTIAL for a wrong password. A previous session of the same user on another
            // connection is replaced and that connection gets a logout notice.
            Protocol::UserResponse login(const std::string& username, const std::string& password, const Net::ConnectionInfo& connection);

            // Close the session bound to connection. When reason is set the client is sent a logout notice
            // after teardown. NOT_FOUND if there is no session, including on a repeated call.
            Protocol::UserResponse logout(Net::ConnectionId connection, const std::optional<std::string>& reason = std::nullopt);

            // The transport lost the connection. Tears the session down without a notice.
            bool connectionClosed(Net::ConnectionId connection);

            bool isLoggedIn(const std::string& username) const;

            // Lookups that also count as activity and push the idle expiry back
            std::optional<User> resolveUser(Net::ConnectionId connection);
            std::optional<Net::ConnectionId> resolveConnection(const std::string& username);

            // Re-arm the idle timer. Returns false if username has no session on connection (e.g. it was just evicted).
            bool touch(const std::string& username, Net::ConnectionId connection);

            std::optional<Clock::time_point> expiryOf(const std::string& username) const;
            size_t size() const;
            std::vector<SessionState> sessions() const;
            std::chrono::milliseconds idleTimeout() const { return mIdleTimeout; }
            // Session map, connection index and view describe the same set of sessions
            bool isConsistent() const;

            ConnectedClientView& connectedClients() { return mView; }
            const ConnectedClientView& connectedClients() const { return mView; }

        private:
            struct Eviction {
                User user;
                Net::ConnectionInfo connection;
            };

            // Shared by logout(), connectionClosed() and idle expiry. With expectedGeneration set, only a
            // session still armed with that timer is torn down.
            Protocol::UserResponse mLogout(Net::ConnectionId connection, const std::optional<std::string>& reason,
                                           std::optional<uint64_t> expectedGeneration);

            // The following require mMutex
            void mAttach(const User& user, const Net::ConnectionInfo& connection);
            std::optional<Eviction> mDetach(const std::string& username);
            void mArmTimer(SessionState& session);
            void mCancelTimer(SessionState& session);
            bool mTouchLocked(const std::string& username, Net::ConnectionId connection);
            bool mCheckInvariants() const;

            void mSendLogoutNotice(const Eviction& eviction, const std::string& reason);

            CredentialStore& mStore;
            TimerService& mTimers;
            Net::Transport& mTransport;
            const std::chrono::milliseconds mIdleTimeout;

            mutable std::mutex mMutex;
            std::unordered_map<std::string, SessionState> mSessions;
            std::unordered_map<Net::ConnectionId, std::string> mConnectionIndex;
            ConnectedClientView mView;
            uint64_t mNextGeneration = 1;
    };
}
