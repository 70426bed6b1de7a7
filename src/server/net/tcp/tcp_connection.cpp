// tcp_connection.cpp - TCP Connection for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/net/tcp/tcp_connection.hpp>
#include <ekrut/common/net/tcp/net_helper.hpp>

namespace EKrut::Net::TCP {
    void TCPConnection::start() {
        // The handler outlives callbacks it is running, so it only holds a weak reference back
        std::weak_ptr<TCPConnection> weak = shared_from_this();

        mHandler->onMessage([weak](AnyMessageType type, const std::string& data) {
            if (auto self = weak.lock())
                self->mHandleMessage(type, data);
        });

        mHandler->onDisconnect([weak](const asio::error_code& ec) {
            if (auto self = weak.lock())
                self->mOnClosed(ec);
        });

        mHandler->start();

        Utils::log("Client connected: " + mInfo.address + " (connection " + std::to_string(mInfo.id) + ")");
    }

    bool TCPConnection::sendMessage(ServerMessageType type, const std::string& data) {
        if (mClosed || !mHandler)
            return false;
        return mHandler->sendMessage(type, data);
    }

    void TCPConnection::setDisconnectCallback(std::function<void(std::shared_ptr<TCPConnection>)> cb) {
        mOnDisconnect = std::move(cb);
    }

    void TCPConnection::disconnect() {
        if (mClosed)
            return;

        mHandler->sendMessage(ServerMessageType::GRACEFUL_DISCONNECT, "Server initiated disconnect.");
        mHandler->closeAfterWrites();
    }

    void TCPConnection::mOnClosed(const asio::error_code& ec) {
        if (mClosed.exchange(true))
            return;

        if (NetHelper::isExpectedDisconnect(ec)) {
            Utils::log("Closed connection to " + mInfo.address);
        } else {
            Utils::log("Client disconnected: " + mInfo.address + " - " + ec.message());
        }

        mDispatcher.connectionClosed(mInfo.id);

        if (mOnDisconnect) {
            mOnDisconnect(shared_from_this());
        }
    }

    void TCPConnection::mHandleMessage(AnyMessageType type, const std::string& data) {
        if (!std::holds_alternative<ClientMessageType>(type)) {
            Utils::warn("Unhandled message type " + std::to_string(MessageHandler::toUint8(type)) + " from " + mInfo.address);
            return;
        }

        ClientMessageType clientType = std::get<ClientMessageType>(type);
        switch (clientType) {
            case ClientMessageType::GRACEFUL_DISCONNECT: {
                Utils::log("Received GRACEFUL_DISCONNECT from " + mInfo.address + ": " + data);
                mHandler->closeAfterWrites();
                return;
            }
            case ClientMessageType::KILL_CONNECTION: {
                Utils::warn("Received KILL_CONNECTION from " + mInfo.address + ": " + data);
                mHandler->closeAfterWrites();
                return;
            }
            default:
                break;
        }

        auto reply = mDispatcher.handle(mInfo, clientType, data);
        if (reply && !sendMessage(reply->type, reply->payload)) {
            Utils::warn("Could not queue reply for " + mInfo.address);
        }
    }
}
