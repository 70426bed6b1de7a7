// tcp_server.hpp - TCP Server for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include <memory>
#include <mutex>
#include <asio.hpp>
#include <ekrut/common/net/tcp/tcp_message_type.hpp>
#include <ekrut/common/utils.hpp>
#include <ekrut/server/net/tcp/tcp_connection.hpp>
#include <ekrut/server/net/transport.hpp>
#include <ekrut/server/request_dispatcher.hpp>

namespace EKrut::Net::TCP {

    class TCPServer : public Server::Net::Transport {
        public:
            TCPServer(asio::io_context& ioContext,
                      uint16_t port,
                      bool ipv4Only = false)
                : mAcceptor(ioContext)
            {
                asio::error_code ec_open, ec_v6only, ec_bind;

                if (!ipv4Only) {
                    // Try IPv6 (dual-stack if supported)
                    asio::ip::tcp::endpoint endpoint_v6(asio::ip::tcp::v6(), port);

                    mAcceptor.open(endpoint_v6.protocol(), ec_open);

                    if (!ec_open) {
                        // Try enabling dual-stack, but DO NOT treat failure as fatal
                        mAcceptor.set_option(asio::ip::v6_only(false), ec_v6only);
                        mAcceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec_v6only);

                        // Try binding IPv6
                        mAcceptor.bind(endpoint_v6, ec_bind);
                    }
                }

                // If IPv6 bind failed OR IPv6 open failed OR forced IPv4-only
                if (ipv4Only || ec_open || ec_bind) {
                    if (!ipv4Only)
                        Utils::warn("TCP: IPv6 unavailable (open=" + ec_open.message() +
                                    ", bind=" + ec_bind.message() +
                                    "), falling back to IPv4 only");

                    asio::ip::tcp::endpoint endpoint_v4(asio::ip::tcp::v4(), port);

                    mAcceptor.close(); // guarantee clean state
                    mAcceptor.open(endpoint_v4.protocol());
                    mAcceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true));
                    mAcceptor.bind(endpoint_v4);
                }

                // Start listening
                mAcceptor.listen();
                Utils::log("Started TCP server on port " + std::to_string(port));
            }

            // Begin accepting clients; requests go to dispatcher, which must outlive the server
            void start(Server::RequestDispatcher& dispatcher);

            // Stop the TCP Server
            void stop();

            // Transport: push a message to a connected client
            bool send(const Server::Net::Message& message, Server::Net::ConnectionId connection) override;

            size_t connectionCount() const;
            uint16_t localPort() const { return mAcceptor.local_endpoint().port(); }

        private:
            // Start accepting clients via TCP
            void mStartAccept();
            Server::Net::ConnectionId mNewConnectionID();

            asio::ip::tcp::acceptor mAcceptor;
            Server::RequestDispatcher* mDispatcher = nullptr;
            mutable std::mutex mClientsMutex;
            std::unordered_map<Server::Net::ConnectionId, TCPConnection::pointer> mClients;
    };

}
