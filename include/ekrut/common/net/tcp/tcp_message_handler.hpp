// tcp_message_handler.hpp - TCP Message Handler for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include <functional>
#include <asio.hpp>
#include <ekrut/common/net/protocol.hpp>
#include <ekrut/common/net/tcp/tcp_message_type.hpp>
#include <ekrut/common/utils.hpp>

namespace EKrut::Net::TCP {
    // Frames are [type][lenHigh][lenLow][payload]. Reads run as a single chain; writes are queued on a strand
    // so sendMessage() may be called from any thread.
    class MessageHandler : public std::enable_shared_from_this<MessageHandler> {
        public:
            static constexpr size_t kMaxPayload = Protocol::kMaxPayload;

            MessageHandler(asio::ip::tcp::socket socket)
                : mSocket(std::move(socket)), mStrand(asio::make_strand(mSocket.get_executor())) {}

            asio::ip::tcp::socket &socket() { return mSocket; }

            void start();
            // Returns false if the payload does not fit in a frame
            bool sendMessage(AnyMessageType type, const std::string &payload = "");
            void onMessage(std::function<void(AnyMessageType, const std::string&)> callback);
            void onDisconnect(std::function<void(const asio::error_code&)> callback) {
                mOnDisconnect = std::move(callback);
            }
            // Close the socket once queued writes have drained
            void closeAfterWrites();

            static AnyMessageType decodeMessageType(uint8_t code);
            static uint8_t toUint8(const AnyMessageType& type);
            static std::vector<uint8_t> frame(AnyMessageType type, const std::string &payload);

        private:
            void mReadHeader();
            void mReadBody(uint16_t length);
            void mWriteNext();
            void mFail(const asio::error_code& ec);
            void mCloseSocket();

            asio::ip::tcp::socket mSocket;
            asio::strand<asio::ip::tcp::socket::executor_type> mStrand;
            AnyMessageType mCurrentType = ServerMessageType::KILL_CONNECTION; // Doesn't matter initial value
            std::array<uint8_t, 3> mHeader{}; // [type][lenHigh][lenLow]
            std::vector<uint8_t> mBody;
            std::deque<std::vector<uint8_t>> mWriteQueue; // Strand only
            bool mCloseRequested = false; // Strand only
            std::atomic<bool> mDisconnected{false};
            std::function<void(AnyMessageType, const std::string&)> mOnMessage;
            std::function<void(const asio::error_code&)> mOnDisconnect;
    };
}
