// test_tcp_server.cpp - Loopback tests for the EKrut TCP server
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <gtest/gtest.h>

#include <array>
#include <thread>
#include <asio.hpp>
#include <ekrut/common/libsodium_wrapper.hpp>
#include <ekrut/common/net/protocol.hpp>
#include <ekrut/common/net/tcp/tcp_message_handler.hpp>
#include <ekrut/server/request_dispatcher.hpp>
#include <ekrut/server/server_session.hpp>
#include <ekrut/server/session_registry.hpp>
#include <ekrut/server/timer_service.hpp>
#include <ekrut/server/user_manager.hpp>
#include <ekrut/server/net/tcp/tcp_server.hpp>
#include "test_support.hpp"

using namespace EKrut;
using namespace EKrut::Server;
using namespace EKrut::Testing;
using EKrut::Net::TCP::ClientMessageType;
using EKrut::Net::TCP::MessageHandler;
using EKrut::Net::TCP::ServerMessageType;
using EKrut::Net::TCP::TCPServer;
using namespace std::chrono_literals;

namespace {
    struct Frame {
        uint8_t type = 0;
        std::string payload;
    };

    // Blocking client speaking the framed protocol
    class TestClient {
        public:
            explicit TestClient(uint16_t port) : mSocket(mIo) {
                mSocket.connect(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), port));
            }

            void send(ClientMessageType type, const std::string& payload) {
                auto data = MessageHandler::frame(type, payload);
                asio::write(mSocket, asio::buffer(data));
            }

            Frame receive() {
                std::array<uint8_t, 3> header{};
                asio::read(mSocket, asio::buffer(header));
                Frame frame;
                frame.type = header[0];
                size_t length = (static_cast<size_t>(header[1]) << 8) | header[2];
                frame.payload.resize(length);
                if (length > 0)
                    asio::read(mSocket, asio::buffer(frame.payload));
                return frame;
            }

        private:
            asio::io_context mIo;
            asio::ip::tcp::socket mSocket;
    };

    class TCPServerTest : public ::testing::Test {
        protected:
            void SetUp() override {
                Utils::LibSodiumWrapper::init();
                ServerSession::getInstance().setHostRunning(true);
                store.addUser(makeUser("alice", "pw1", UserType::CUSTOMER));

                server.start(dispatcher);
                mRunner = std::thread([this]() { io.run(); });
            }

            void TearDown() override {
                ServerSession::getInstance().setHostRunning(false);
                server.stop();
                timers.cancelAll();
                mGuard.reset();
                io.stop();
                if (mRunner.joinable())
                    mRunner.join();
            }

            asio::io_context io;
            InMemoryCredentialStore store;
            RecordingNotifier notifier;
            AsioTimerService timers{io};
            TCPServer server{io, 0, true};
            SessionRegistry registry{store, timers, server, 200ms};
            UserManager users{store, notifier};
            RequestDispatcher dispatcher{registry, users};

        private:
            asio::executor_work_guard<asio::io_context::executor_type> mGuard = asio::make_work_guard(io);
            std::thread mRunner;
    };
}

TEST_F(TCPServerTest, LoginOverTheWire) {
    TestClient client(server.localPort());
    client.send(ClientMessageType::LOGIN, Protocol::encodeFields({"alice", "pw1"}));

    Frame reply = client.receive();
    ASSERT_EQ(reply.type, static_cast<uint8_t>(ServerMessageType::USER_RESPONSE));
    auto decoded = Protocol::decodeUserResponse(reply.payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->result, Protocol::ResultType::OK);
    ASSERT_EQ(decoded->records.size(), 1u);

    auto user = Protocol::decodeUser(decoded->records[0]);
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->username, "alice");
    EXPECT_TRUE(user->password.empty());
    EXPECT_TRUE(registry.isLoggedIn("alice"));
}

TEST_F(TCPServerTest, WrongPasswordCarriesReason) {
    TestClient client(server.localPort());
    client.send(ClientMessageType::LOGIN, Protocol::encodeFields({"alice", "bad"}));

    auto decoded = Protocol::decodeUserResponse(client.receive().payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->result, Protocol::ResultType::INVALID_INPUT);
    EXPECT_TRUE(decoded->invalidCredential);
    EXPECT_FALSE(registry.isLoggedIn("alice"));
}

TEST_F(TCPServerTest, IdleClientReceivesLogoutNotice) {
    TestClient client(server.localPort());
    client.send(ClientMessageType::LOGIN, Protocol::encodeFields({"alice", "pw1"}));
    ASSERT_EQ(client.receive().type, static_cast<uint8_t>(ServerMessageType::USER_RESPONSE));

    Frame notice = client.receive();
    ASSERT_EQ(notice.type, static_cast<uint8_t>(ServerMessageType::LOGOUT_NOTICE));
    EXPECT_EQ(Protocol::decodeFields(notice.payload), (std::vector<std::string>{"alice", kSessionExpiredReason}));
    EXPECT_FALSE(registry.isLoggedIn("alice"));

    // The connection stays usable after the forced logout
    client.send(ClientMessageType::IS_LOGGED_IN, Protocol::encodeFields({"alice"}));
    auto decoded = Protocol::decodeUserResponse(client.receive().payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->result, Protocol::ResultType::NOT_FOUND);
}

TEST_F(TCPServerTest, ClosingTheSocketEndsTheSession) {
    {
        TestClient client(server.localPort());
        client.send(ClientMessageType::LOGIN, Protocol::encodeFields({"alice", "pw1"}));
        ASSERT_EQ(client.receive().type, static_cast<uint8_t>(ServerMessageType::USER_RESPONSE));
        ASSERT_TRUE(registry.isLoggedIn("alice"));
    }

    for (int i = 0; i < 100 && registry.isLoggedIn("alice"); ++i)
        std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(registry.isLoggedIn("alice"));
}
