// net_helper.hpp - Network Helper Functions for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <string>
#include <asio.hpp>

namespace EKrut::Net::TCP {
    class NetHelper {
        public:
            inline static bool isExpectedDisconnect(const asio::error_code& ec) {
                using asio::error::operation_aborted;
                using asio::error::bad_descriptor;
                using asio::error::eof;
                using asio::error::connection_reset;

                return ec == operation_aborted || ec == bad_descriptor || ec == eof || ec == connection_reset;
            }

            // Remote address as text, or "unknown" once the socket is gone
            inline static std::string remoteAddress(const asio::ip::tcp::socket& socket) {
                asio::error_code ec;
                auto endpoint = socket.remote_endpoint(ec);
                if (ec) return "unknown";
                return endpoint.address().to_string();
            }
    };
}
