// tcp_server.cpp - TCP Server for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/net/tcp/tcp_server.hpp>
#include <ekrut/server/server_session.hpp>
#include <ekrut/common/libsodium_wrapper.hpp>

namespace EKrut::Net::TCP {

    void TCPServer::start(Server::RequestDispatcher& dispatcher) {
        mDispatcher = &dispatcher;
        mStartAccept();
    }

    void TCPServer::mStartAccept() {
        mAcceptor.async_accept(
            [this](asio::error_code ec, asio::ip::tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) {
                        // Acceptor was cancelled/closed during shutdown
                        return;
                    }
                    Utils::error("Accept failed: " + ec.message());
                    // Try again only if still running
                    if (ServerSession::getInstance().isHostRunning() && mAcceptor.is_open())
                        mStartAccept();
                    return;
                }

                auto client = TCPConnection::create(
                    std::move(socket),
                    mNewConnectionID(),
                    *mDispatcher,
                    [this](std::shared_ptr<TCPConnection> c) {
                        std::lock_guard lock(mClientsMutex);
                        mClients.erase(c->getConnectionID());
                        Utils::debug("Client " + std::to_string(c->getConnectionID()) + " removed.");
                    }
                );

                {
                    std::lock_guard lock(mClientsMutex);
                    mClients.emplace(client->getConnectionID(), client);
                }
                client->start();

                if (ServerSession::getInstance().isHostRunning() && mAcceptor.is_open())
                    mStartAccept();
            }
        );
    }

    Server::Net::ConnectionId TCPServer::mNewConnectionID() {
        std::lock_guard lock(mClientsMutex);
        Server::Net::ConnectionId id;
        do {
            id = Utils::LibSodiumWrapper::randomId();
        } while (mClients.find(id) != mClients.end());
        return id;
    }

    bool TCPServer::send(const Server::Net::Message& message, Server::Net::ConnectionId connection) {
        TCPConnection::pointer client;
        {
            std::lock_guard lock(mClientsMutex);
            auto it = mClients.find(connection);
            if (it == mClients.end())
                return false;
            client = it->second;
        }
        return client->sendMessage(message.type, message.payload);
    }

    size_t TCPServer::connectionCount() const {
        std::lock_guard lock(mClientsMutex);
        return mClients.size();
    }

    void TCPServer::stop() {
        // Stop accepting
        if (mAcceptor.is_open()) {
            asio::error_code ec;
            mAcceptor.cancel(ec);
            mAcceptor.close(ec);
            Utils::log("TCP Acceptor closed.");
        }

        // Snapshot to avoid iterator invalidation while callbacks erase()
        std::vector<TCPConnection::pointer> snapshot;
        {
            std::lock_guard lock(mClientsMutex);
            for (auto& [id, client] : mClients)
                snapshot.push_back(client);
        }

        for (auto& client : snapshot) {
            client->disconnect();
            Utils::log("GRACEFUL_DISCONNECT sent to connection " + std::to_string(client->getConnectionID()));
        }
        // Let the erase callback run as sockets close
        // Do NOT destroy server while io handlers may still reference it
    }
}
