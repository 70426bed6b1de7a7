// transport.hpp - Outbound transport seam for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>
#include <ekrut/common/net/tcp/tcp_message_type.hpp>

namespace EKrut::Server::Net {
    using ConnectionId = uint64_t;

    // What the registry knows about a connection
    struct ConnectionInfo {
        ConnectionId id = 0;
        std::string address;
    };

    struct Message {
        EKrut::Net::TCP::ServerMessageType type;
        std::string payload;
    };

    class Transport {
        public:
            virtual ~Transport() = default;

            // Fire-and-forget push to a connection. Returns false if the connection is unknown or the message
            // could not be queued; never throws.
            virtual bool send(const Message& message, ConnectionId connection) = 0;
    };
}
