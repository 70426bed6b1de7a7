// tcp_message_handler.cpp - TCP Message Handler for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/common/net/tcp/tcp_message_handler.hpp>
#include <ekrut/common/net/tcp/net_helper.hpp>
#include <ekrut/common/utils.hpp>

namespace EKrut::Net::TCP {
    void MessageHandler::start() {
        auto self = shared_from_this();
        asio::post(mStrand, [this, self]() { mReadHeader(); });
    }

    std::vector<uint8_t> MessageHandler::frame(AnyMessageType type, const std::string &payload) {
        std::vector<uint8_t> data;
        data.reserve(3 + payload.size());
        data.push_back(toUint8(type));
        uint16_t length = static_cast<uint16_t>(payload.size());

        data.push_back(length >> 8);
        data.push_back(length & 0xFF);

        data.insert(data.end(), payload.begin(), payload.end());
        return data;
    }

    bool MessageHandler::sendMessage(AnyMessageType type, const std::string &payload) {
        if (payload.size() > kMaxPayload) {
            Utils::error("Refusing to send oversized payload (" + std::to_string(payload.size()) + " bytes)");
            return false;
        }

        auto data = frame(type, payload);
        auto self = shared_from_this();
        asio::post(mStrand, [this, self, data = std::move(data)]() mutable {
            if (mDisconnected) return;
            bool idle = mWriteQueue.empty();
            mWriteQueue.push_back(std::move(data));
            if (idle) mWriteNext();
        });
        return true;
    }

    void MessageHandler::onMessage(std::function<void(AnyMessageType, const std::string&)> callback) {
        mOnMessage = std::move(callback);
    }

    void MessageHandler::closeAfterWrites() {
        auto self = shared_from_this();
        asio::post(mStrand, [this, self]() {
            mCloseRequested = true;
            if (mWriteQueue.empty()) mCloseSocket();
        });
    }

    void MessageHandler::mWriteNext() {
        auto self = shared_from_this();
        asio::async_write(mSocket, asio::buffer(mWriteQueue.front()),
            asio::bind_executor(mStrand, [this, self](asio::error_code ec, std::size_t) {
                if (ec) {
                    if (!NetHelper::isExpectedDisconnect(ec))
                        Utils::error("Send failed: " + ec.message());
                    mWriteQueue.clear();
                    mFail(ec);
                    return;
                }

                mWriteQueue.pop_front();
                if (!mWriteQueue.empty()) {
                    mWriteNext();
                } else if (mCloseRequested) {
                    mCloseSocket();
                }
            })
        );
    }

    void MessageHandler::mReadHeader() {
        auto self = shared_from_this();
        asio::async_read(mSocket, asio::buffer(mHeader),
            asio::bind_executor(mStrand, [this, self](asio::error_code ec, std::size_t) {
                if (ec) {
                    if (!NetHelper::isExpectedDisconnect(ec))
                        Utils::error("Header read failed: " + ec.message());
                    mFail(ec);
                    return;
                }

                mCurrentType = decodeMessageType(mHeader[0]);

                uint16_t len = (mHeader[1] << 8) | mHeader[2];
                mReadBody(len);
            })
        );
    }

    void MessageHandler::mReadBody(uint16_t length) {
        auto self = shared_from_this();
        mBody.resize(length);

        asio::async_read(mSocket, asio::buffer(mBody),
            asio::bind_executor(mStrand, [this, self](asio::error_code ec, std::size_t) {
                if (ec) {
                    if (!NetHelper::isExpectedDisconnect(ec))
                        Utils::error("Body read failed: " + ec.message());
                    mFail(ec);
                    return;
                }

                std::string payload(mBody.begin(), mBody.end());

                // Dispatch based on message type
                if (mOnMessage) {
                    mOnMessage(mCurrentType, payload);
                }

                if (!mDisconnected)
                    mReadHeader(); // Keep listening
            })
        );
    }

    void MessageHandler::mFail(const asio::error_code& ec) {
        if (mDisconnected.exchange(true)) return;

        asio::error_code ignored;
        mSocket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        mSocket.close(ignored);

        if (mOnDisconnect) {
            mOnDisconnect(ec);
        }
    }

    void MessageHandler::mCloseSocket() {
        mFail(asio::error::operation_aborted);
    }

    AnyMessageType MessageHandler::decodeMessageType(uint8_t code) {
        switch (code) {
            case 0xFE: return ClientMessageType::GRACEFUL_DISCONNECT;
            case 0xFF: return ClientMessageType::KILL_CONNECTION;
            default: break;
        }

        if (code >= 0xA0) {
            return static_cast<ClientMessageType>(code);
        } else {
            return static_cast<ServerMessageType>(code);
        }
    }

    uint8_t MessageHandler::toUint8(const AnyMessageType& type) {
        return std::visit([](auto t) -> uint8_t {
            return static_cast<uint8_t>(t);
        }, type);
    }
}
