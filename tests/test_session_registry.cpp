// test_session_registry.cpp - Session registry tests for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>
#include <ekrut/common/libsodium_wrapper.hpp>
#include <ekrut/server/session_registry.hpp>
#include "test_support.hpp"

using namespace EKrut;
using namespace EKrut::Server;
using namespace EKrut::Testing;
using EKrut::Net::TCP::ServerMessageType;
using EKrut::Protocol::ResultType;
using EKrut::Protocol::SessionError;
using namespace std::chrono_literals;

namespace {
    constexpr std::chrono::milliseconds kIdle = 300000ms;

    class SessionRegistryTest : public ::testing::Test {
        protected:
            void SetUp() override {
                Utils::LibSodiumWrapper::init();
                store.addUser(makeUser("alice", "pw1", UserType::CUSTOMER));
                store.addUser(makeUser("bob", "pw2", UserType::AREA_MANAGER));
            }

            std::vector<std::pair<Server::Net::Message, Server::Net::ConnectionId>> notices() const {
                std::vector<std::pair<Server::Net::Message, Server::Net::ConnectionId>> out;
                for (const auto& entry : transport.sent()) {
                    if (entry.first.type == ServerMessageType::LOGOUT_NOTICE)
                        out.push_back(entry);
                }
                return out;
            }

            FlakyCredentialStore store;
            ManualTimerService timers;
            RecordingTransport transport;
            SessionRegistry registry{store, timers, transport, kIdle};
    };
}

TEST_F(SessionRegistryTest, LoginLogoutLifecycle) {
    auto ok = registry.login("alice", "pw1", connection(1));
    ASSERT_TRUE(ok.isOk());
    ASSERT_TRUE(ok.user().has_value());
    EXPECT_EQ(ok.user()->username, "alice");
    EXPECT_TRUE(ok.user()->password.empty());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.isLoggedIn("alice"));
    EXPECT_TRUE(registry.connectedClients().contains("alice"));

    auto wrong = registry.login("alice", "nope", connection(2));
    EXPECT_EQ(wrong.error, SessionError::INVALID_CREDENTIAL);
    EXPECT_EQ(wrong.resultCode(), ResultType::INVALID_INPUT);
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.sessions()[0].connection.id, 1u);

    auto out = registry.logout(1);
    EXPECT_TRUE(out.isOk());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.connectedClients().size(), 0u);
    EXPECT_FALSE(registry.isLoggedIn("alice"));
    EXPECT_EQ(timers.pending(), 0u);

    EXPECT_EQ(registry.logout(1).error, SessionError::NOT_FOUND);
    EXPECT_TRUE(notices().empty());
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, RejectsUnknownUsersAndEmptyInput) {
    EXPECT_EQ(registry.login("mallory", "pw", connection(1)).error, SessionError::NOT_FOUND);
    EXPECT_EQ(registry.login("", "pw1", connection(1)).error, SessionError::INVALID_INPUT);
    EXPECT_EQ(registry.login("alice", "", connection(1)).error, SessionError::INVALID_INPUT);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(SessionRegistryTest, IdleSessionIsEvictedWithOneNotice) {
    ASSERT_TRUE(registry.login("bob", "pw2", connection(7)).isOk());

    timers.advance(kIdle - 1ms);
    EXPECT_TRUE(registry.isLoggedIn("bob"));

    timers.advance(1ms);
    EXPECT_FALSE(registry.isLoggedIn("bob"));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.connectedClients().contains("bob"));

    auto sent = notices();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].second, 7u);
    EXPECT_EQ(Protocol::decodeFields(sent[0].first.payload),
              (std::vector<std::string>{"bob", kSessionExpiredReason}));

    timers.advance(kIdle * 2);
    EXPECT_EQ(notices().size(), 1u);
    EXPECT_EQ(registry.logout(7).error, SessionError::NOT_FOUND);
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, TouchPushesExpiryStrictlyLater) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    auto first = registry.expiryOf("alice");
    ASSERT_TRUE(first.has_value());

    timers.advance(1000ms);
    ASSERT_TRUE(registry.resolveUser(1).has_value());
    auto second = registry.expiryOf("alice");
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(*second, *first);

    // Same clock reading still moves the expiry forward
    ASSERT_EQ(registry.resolveConnection("alice"), std::optional<Server::Net::ConnectionId>(1));
    auto third = registry.expiryOf("alice");
    EXPECT_GT(*third, *second);

    timers.advance(kIdle - 1ms);
    EXPECT_TRUE(registry.isLoggedIn("alice"));
    timers.advance(2ms);
    EXPECT_FALSE(registry.isLoggedIn("alice"));
    EXPECT_EQ(notices().size(), 1u);
}

TEST_F(SessionRegistryTest, TouchRequiresMatchingSession) {
    EXPECT_FALSE(registry.touch("alice", 1));

    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    EXPECT_FALSE(registry.touch("alice", 2));
    EXPECT_TRUE(registry.touch("alice", 1));

    timers.advance(kIdle + 1ms);
    EXPECT_FALSE(registry.touch("alice", 1));
    EXPECT_FALSE(registry.resolveUser(1).has_value());
    EXPECT_FALSE(registry.resolveConnection("alice").has_value());
}

TEST_F(SessionRegistryTest, StaleTimerAfterLogoutIsIgnored) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    TimerHandle handle = registry.sessions()[0].timer;

    ASSERT_TRUE(registry.logout(1).isOk());
    ASSERT_TRUE(timers.fireCancelled(handle));

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(notices().empty());
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, StaleTimerDoesNotEvictRefreshedSession) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    TimerHandle original = registry.sessions()[0].timer;

    ASSERT_TRUE(registry.touch("alice", 1));
    ASSERT_TRUE(timers.fireCancelled(original));

    EXPECT_TRUE(registry.isLoggedIn("alice"));
    EXPECT_TRUE(notices().empty());

    // Same user logged in again on a new connection: the old timer must not hit it either
    TimerHandle current = registry.sessions()[0].timer;
    ASSERT_TRUE(registry.login("alice", "pw1", connection(2)).isOk());
    ASSERT_TRUE(timers.fireCancelled(current));
    EXPECT_TRUE(registry.isLoggedIn("alice"));
    EXPECT_EQ(registry.resolveConnection("alice"), std::optional<Server::Net::ConnectionId>(2));
}

TEST_F(SessionRegistryTest, ReloginFromAnotherConnectionDisplacesOldOne) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("alice", "pw1", connection(2)).isOk());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.sessions()[0].connection.id, 2u);
    EXPECT_EQ(timers.pending(), 1u);

    auto sent = notices();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].second, 1u);
    EXPECT_EQ(Protocol::decodeFields(sent[0].first.payload),
              (std::vector<std::string>{"alice", kDisplacedReason}));

    EXPECT_EQ(registry.logout(1).error, SessionError::NOT_FOUND);
    EXPECT_FALSE(registry.resolveUser(1).has_value());
    EXPECT_EQ(registry.resolveUser(2)->username, "alice");
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, ReloginOnSameConnectionSendsNoNotice) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(timers.pending(), 1u);
    EXPECT_TRUE(notices().empty());
    EXPECT_EQ(registry.connectedClients().size(), 1u);
}

TEST_F(SessionRegistryTest, SwitchingUserOnConnectionDropsPreviousSession) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("bob", "pw2", connection(1)).isOk());

    EXPECT_FALSE(registry.isLoggedIn("alice"));
    EXPECT_TRUE(registry.isLoggedIn("bob"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolveUser(1)->username, "bob");
    EXPECT_TRUE(notices().empty());
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, ConnectionClosedTearsDownSilently) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());

    EXPECT_TRUE(registry.connectionClosed(1));
    EXPECT_FALSE(registry.connectionClosed(1));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_TRUE(notices().empty());
}

TEST_F(SessionRegistryTest, ForcedLogoutSendsNoticeEvenIfDeliveryFails) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("bob", "pw2", connection(2)).isOk());

    ASSERT_TRUE(registry.logout(1, std::string("Removed by administrator")).isOk());
    auto sent = notices();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(Protocol::decodeFields(sent[0].first.payload)[1], "Removed by administrator");

    transport.setAccept(false);
    EXPECT_TRUE(registry.logout(2, std::string("Removed by administrator")).isOk());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, StoreFailureIsReportedAsNotFound) {
    store.failing = true;
    auto response = registry.login("alice", "pw1", connection(1));
    EXPECT_EQ(response.error, SessionError::NOT_FOUND);
    EXPECT_EQ(registry.size(), 0u);

    store.failing = false;
    EXPECT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
}

TEST_F(SessionRegistryTest, ReturnedUsersAreCopies) {
    auto response = registry.login("alice", "pw1", connection(1));
    ASSERT_TRUE(response.isOk());
    User copy = *response.user();
    copy.area = "south";

    auto resolved = registry.resolveUser(1);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->area, "north");
    EXPECT_TRUE(resolved->password.empty());
}

TEST_F(SessionRegistryTest, ViewPublishesChanges) {
    std::vector<std::pair<ViewChange, std::string>> seen;
    auto id = registry.connectedClients().subscribe([&](ViewChange change, const ConnectedClient& client) {
        seen.emplace_back(change, client.username);
    });

    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("bob", "pw2", connection(2)).isOk());
    auto snapshot = registry.connectedClients().snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].username, "alice");
    EXPECT_EQ(snapshot[0].address, "10.0.0.1");
    EXPECT_EQ(snapshot[1].type, UserType::AREA_MANAGER);

    ASSERT_TRUE(registry.logout(1).isOk());
    registry.connectedClients().unsubscribe(id);
    ASSERT_TRUE(registry.logout(2).isOk());

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], std::make_pair(ViewChange::ADDED, std::string("alice")));
    EXPECT_EQ(seen[1], std::make_pair(ViewChange::ADDED, std::string("bob")));
    EXPECT_EQ(seen[2], std::make_pair(ViewChange::REMOVED, std::string("alice")));
}

TEST_F(SessionRegistryTest, ConcurrentLoginsAreAllRecorded) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            std::string name = "user" + std::to_string(t) + "_" + std::to_string(i);
            store.addUser(makeUser(name, "secret", UserType::CUSTOMER));
        }
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string name = "user" + std::to_string(t) + "_" + std::to_string(i);
                Server::Net::ConnectionId id = static_cast<Server::Net::ConnectionId>(t * kPerThread + i + 1);
                if (!registry.login(name, "secret", connection(id)).isOk())
                    failures++;
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(registry.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(registry.connectedClients().size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(timers.pending(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_TRUE(registry.isConsistent());
}

TEST_F(SessionRegistryTest, TouchRacingEvictionStaysConsistent) {
    ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    ASSERT_TRUE(registry.login("bob", "pw2", connection(2)).isOk());

    std::atomic<bool> done{false};
    std::thread toucher([&]() {
        while (!done.load()) {
            registry.touch("alice", 1);
            registry.resolveUser(2);
        }
    });

    for (int i = 0; i < 200; ++i)
        timers.advance(kIdle / 100);
    done = true;
    toucher.join();

    EXPECT_TRUE(registry.isConsistent());
    EXPECT_LE(notices().size(), 2u);
    EXPECT_EQ(registry.size() + notices().size(), 2u);
}

TEST(SessionRegistryLifetime, DestructionCancelsPendingTimers) {
    Utils::LibSodiumWrapper::init();
    InMemoryCredentialStore store;
    store.addUser(makeUser("alice", "pw1", UserType::CUSTOMER));
    ManualTimerService timers;
    RecordingTransport transport;
    {
        SessionRegistry registry(store, timers, transport, kIdle);
        ASSERT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
        EXPECT_EQ(timers.pending(), 1u);
    }
    EXPECT_EQ(timers.pending(), 0u);
}

TEST(SessionRegistryLifetime, RejectsNonPositiveTimeout) {
    InMemoryCredentialStore store;
    ManualTimerService timers;
    RecordingTransport transport;
    EXPECT_THROW(SessionRegistry(store, timers, transport, 0ms), std::invalid_argument);
}

TEST_F(SessionRegistryTest, ThrowingListenerDoesNotBreakLogin) {
    int calls = 0;
    registry.connectedClients().subscribe([](ViewChange, const ConnectedClient&) {
        throw std::runtime_error("listener failed");
    });
    registry.connectedClients().subscribe([](ViewChange, const ConnectedClient&) {
        throw 42;
    });
    registry.connectedClients().subscribe([&](ViewChange, const ConnectedClient&) { calls++; });

    EXPECT_TRUE(registry.login("alice", "pw1", connection(1)).isOk());
    EXPECT_TRUE(registry.isLoggedIn("alice"));
    EXPECT_TRUE(registry.logout(1).isOk());
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(registry.isConsistent());
}
