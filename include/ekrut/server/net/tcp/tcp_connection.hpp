// tcp_connection.hpp - TCP Connection for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <cstdint>
#include <asio.hpp>
#include <ekrut/common/net/tcp/tcp_message_type.hpp>
#include <ekrut/common/net/tcp/tcp_message_handler.hpp>
#include <ekrut/common/net/tcp/net_helper.hpp>
#include <ekrut/common/utils.hpp>
#include <ekrut/server/request_dispatcher.hpp>
#include <ekrut/server/net/transport.hpp>

namespace EKrut::Net::TCP {
    class TCPConnection : public std::enable_shared_from_this<TCPConnection> {
        public:
            using pointer = std::shared_ptr<TCPConnection>;

            static pointer create(
                asio::ip::tcp::socket socket,
                Server::Net::ConnectionId connectionID,
                Server::RequestDispatcher& dispatcher,
                std::function<void(pointer)> onDisconnect)
            {
                auto conn = pointer(new TCPConnection(std::move(socket), connectionID, dispatcher));
                conn->mOnDisconnect = std::move(onDisconnect);
                return conn;
            }

            // Start a TCP Connection (Handler for an incoming connection)
            void start();
            // Send a message to the TCP client. Safe from any thread.
            bool sendMessage(ServerMessageType type, const std::string& data = "");
            // Set callback for disconnects
            void setDisconnectCallback(std::function<void(std::shared_ptr<TCPConnection>)> cb);
            // Tell the client we are leaving, then close once pending writes are out
            void disconnect();

            Server::Net::ConnectionId getConnectionID() const { return mInfo.id; }
            const std::string& getAddress() const { return mInfo.address; }

        private:
            TCPConnection(asio::ip::tcp::socket socket, Server::Net::ConnectionId connectionID, Server::RequestDispatcher& dispatcher)
                :
                mHandler(std::make_shared<MessageHandler>(std::move(socket))),
                mDispatcher(dispatcher)
            {
                mInfo.id = connectionID;
                mInfo.address = NetHelper::remoteAddress(mHandler->socket());
            }

            // Handle an incoming TCP message
            void mHandleMessage(AnyMessageType type, const std::string& data);
            // Runs once, whichever side closed the connection
            void mOnClosed(const asio::error_code& ec);

            std::shared_ptr<MessageHandler> mHandler;
            Server::RequestDispatcher& mDispatcher;
            Server::Net::ConnectionInfo mInfo;
            std::function<void(std::shared_ptr<TCPConnection>)> mOnDisconnect;
            std::atomic<bool> mClosed{false};
    };
}
