// session_registry.cpp - Session Registry for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/session_registry.hpp>
#include <ekrut/common/libsodium_wrapper.hpp>

#include <utility>

using EKrut::Protocol::SessionError;
using EKrut::Protocol::UserResponse;

namespace EKrut::Server {
    SessionRegistry::SessionRegistry(CredentialStore& store, TimerService& timers, Net::Transport& transport,
                                     std::chrono::milliseconds idleTimeout)
        : mStore(store), mTimers(timers), mTransport(transport), mIdleTimeout(idleTimeout)
    {
        if (mIdleTimeout.count() <= 0) {
            throw std::invalid_argument("Idle timeout must be positive");
        }
    }

    SessionRegistry::~SessionRegistry() {
        std::lock_guard lock(mMutex);
        for (auto& [username, session] : mSessions) {
            mCancelTimer(session);
        }
        mSessions.clear();
        mConnectionIndex.clear();
    }

    UserResponse SessionRegistry::login(const std::string& username, const std::string& password, const Net::ConnectionInfo& connection) {
        if (username.empty() || password.empty()) {
            return UserResponse(SessionError::INVALID_INPUT);
        }

        std::optional<User> user;
        try {
            user = mStore.fetchUserByUsername(username);
        } catch (const std::exception& e) {
            Utils::warn("Login for " + username + " failed, credential store error: " + e.what());
            return UserResponse(SessionError::NOT_FOUND);
        }

        if (!user) {
            Utils::log("Login rejected for unknown user " + username + " from " + connection.address);
            return UserResponse(SessionError::NOT_FOUND);
        }

        if (!Utils::LibSodiumWrapper::credentialsMatch(password, user->password)) {
            Utils::log("Login rejected for " + username + " from " + connection.address + ": wrong password");
            return UserResponse(SessionError::INVALID_CREDENTIAL);
        }

        user->password.clear();

        std::optional<Eviction> displaced;
        {
            std::lock_guard lock(mMutex);

            // One session per connection: drop whoever was logged in here before
            auto idx = mConnectionIndex.find(connection.id);
            if (idx != mConnectionIndex.end() && idx->second != username) {
                std::string previous = idx->second;
                mDetach(previous);
                Utils::log("Connection " + std::to_string(connection.id) + " switched from " + previous + " to " + username);
            }

            // One session per user: the old connection is told it lost the session
            auto existing = mSessions.find(username);
            if (existing != mSessions.end()) {
                bool otherConnection = existing->second.connection.id != connection.id;
                auto eviction = mDetach(username);
                if (otherConnection)
                    displaced = std::move(eviction);
            }

            mAttach(*user, connection);
        }

        if (displaced) {
            Utils::log("Session of " + username + " on connection " + std::to_string(displaced->connection.id) + " replaced by a new login");
            mSendLogoutNotice(*displaced, kDisplacedReason);
        }

        Utils::log("User " + username + " logged in from " + connection.address);
        return UserResponse::ok(*user);
    }

    UserResponse SessionRegistry::logout(Net::ConnectionId connection, const std::optional<std::string>& reason) {
        return mLogout(connection, reason, std::nullopt);
    }

    bool SessionRegistry::connectionClosed(Net::ConnectionId connection) {
        return mLogout(connection, std::nullopt, std::nullopt).isOk();
    }

    UserResponse SessionRegistry::mLogout(Net::ConnectionId connection, const std::optional<std::string>& reason,
                                          std::optional<uint64_t> expectedGeneration) {
        std::optional<Eviction> eviction;
        {
            std::lock_guard lock(mMutex);

            auto idx = mConnectionIndex.find(connection);
            if (idx == mConnectionIndex.end()) {
                if (expectedGeneration)
                    Utils::debug("Idle timer for connection " + std::to_string(connection) + " fired after its session ended");
                return UserResponse(SessionError::NOT_FOUND);
            }

            auto it = mSessions.find(idx->second);
            if (expectedGeneration) {
                if (it->second.generation != *expectedGeneration) {
                    Utils::debug("Idle timer for " + idx->second + " was superseded, ignoring");
                    return UserResponse(SessionError::NOT_FOUND);
                }
                it->second.timer = 0; // This is the timer that fired
            }

            eviction = mDetach(idx->second);
        }

        if (!eviction) {
            Utils::error("Connection " + std::to_string(connection) + " was indexed without a session");
            return UserResponse(SessionError::NOT_FOUND);
        }

        if (reason) {
            Utils::log("User " + eviction->user.username + " logged out (" + *reason + ")");
            mSendLogoutNotice(*eviction, *reason);
        } else {
            Utils::log("User " + eviction->user.username + " logged out");
        }

        return UserResponse::ok();
    }

    bool SessionRegistry::isLoggedIn(const std::string& username) const {
        std::lock_guard lock(mMutex);
        return mSessions.find(username) != mSessions.end();
    }

    std::optional<User> SessionRegistry::resolveUser(Net::ConnectionId connection) {
        std::lock_guard lock(mMutex);

        auto idx = mConnectionIndex.find(connection);
        if (idx == mConnectionIndex.end())
            return std::nullopt;

        const std::string& username = idx->second;
        mTouchLocked(username, connection);
        return mSessions.at(username).user;
    }

    std::optional<Net::ConnectionId> SessionRegistry::resolveConnection(const std::string& username) {
        std::lock_guard lock(mMutex);

        auto it = mSessions.find(username);
        if (it == mSessions.end())
            return std::nullopt;

        Net::ConnectionId connection = it->second.connection.id;
        mTouchLocked(username, connection);
        return connection;
    }

    bool SessionRegistry::touch(const std::string& username, Net::ConnectionId connection) {
        std::lock_guard lock(mMutex);
        return mTouchLocked(username, connection);
    }

    std::optional<Clock::time_point> SessionRegistry::expiryOf(const std::string& username) const {
        std::lock_guard lock(mMutex);
        auto it = mSessions.find(username);
        if (it == mSessions.end())
            return std::nullopt;
        return it->second.expires;
    }

    size_t SessionRegistry::size() const {
        std::lock_guard lock(mMutex);
        return mSessions.size();
    }

    std::vector<SessionState> SessionRegistry::sessions() const {
        std::lock_guard lock(mMutex);
        std::vector<SessionState> snapshot;
        snapshot.reserve(mSessions.size());
        for (const auto& [username, session] : mSessions) {
            snapshot.push_back(session);
        }
        return snapshot;
    }

    void SessionRegistry::mAttach(const User& user, const Net::ConnectionInfo& connection) {
        SessionState session;
        session.user = user;
        session.connection = connection;
        mArmTimer(session);

        mSessions.emplace(user.username, std::move(session));
        mConnectionIndex[connection.id] = user.username;
        mView.mAdd(ConnectedClient{connection.address, user.username, user.type});

#if DEBUG
        if (!mCheckInvariants())
            Utils::error("Session registry inconsistent after attaching " + user.username);
#endif
    }

    std::optional<SessionRegistry::Eviction> SessionRegistry::mDetach(const std::string& username) {
        auto it = mSessions.find(username);
        if (it == mSessions.end())
            return std::nullopt;

        mCancelTimer(it->second);
        Eviction eviction{std::move(it->second.user), it->second.connection};

        mConnectionIndex.erase(eviction.connection.id);
        mSessions.erase(it);
        if (!mView.mRemove(username))
            Utils::error("Connected client view had no entry for " + username);

#if DEBUG
        if (!mCheckInvariants())
            Utils::error("Session registry inconsistent after detaching " + username);
#endif
        return eviction;
    }

    void SessionRegistry::mArmTimer(SessionState& session) {
        Clock::time_point now = mTimers.now();
        Clock::time_point expires = now + mIdleTimeout;
        if (expires <= session.expires)
            expires = session.expires + Clock::duration(1);

        uint64_t generation = mNextGeneration++;
        Net::ConnectionId connection = session.connection.id;
        auto delay = std::chrono::ceil<std::chrono::milliseconds>(expires - now);

        session.timer = mTimers.schedule([this, connection, generation]() {
            mLogout(connection, kSessionExpiredReason, generation);
        }, delay);
        session.generation = generation;
        session.expires = expires;
    }

    void SessionRegistry::mCancelTimer(SessionState& session) {
        if (session.timer == 0)
            return;

        if (!mTimers.cancel(session.timer))
            Utils::debug("Idle timer for " + session.user.username + " already fired");
        session.timer = 0;
    }

    bool SessionRegistry::mTouchLocked(const std::string& username, Net::ConnectionId connection) {
        auto it = mSessions.find(username);
        if (it == mSessions.end() || it->second.connection.id != connection)
            return false;

        mCancelTimer(it->second);
        mArmTimer(it->second);
        return true;
    }

    bool SessionRegistry::isConsistent() const {
        std::lock_guard lock(mMutex);
        return mCheckInvariants();
    }

    bool SessionRegistry::mCheckInvariants() const {
        if (mSessions.size() != mConnectionIndex.size() || mSessions.size() != mView.size())
            return false;

        for (const auto& [connection, username] : mConnectionIndex) {
            auto it = mSessions.find(username);
            if (it == mSessions.end() || it->second.connection.id != connection)
                return false;
            if (!mView.contains(username))
                return false;
        }
        return true;
    }

    void SessionRegistry::mSendLogoutNotice(const Eviction& eviction, const std::string& reason) {
        Net::Message message{EKrut::Net::TCP::ServerMessageType::LOGOUT_NOTICE,
                             Protocol::encodeFields({eviction.user.username, reason})};
        try {
            if (!mTransport.send(message, eviction.connection.id)) {
                Utils::warn("Logout notice for " + eviction.user.username + " could not be delivered to connection " +
                            std::to_string(eviction.connection.id));
            }
        } catch (const std::exception& e) {
            Utils::warn("Logout notice for " + eviction.user.username + " failed: " + e.what());
        }
    }
}
