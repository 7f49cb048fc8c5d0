#pragma once

#include <parley/common.hpp>

namespace parley {

    // Which transport family a peer or listener uses
    enum class Protocol : dp::u8 { Stream = 0, Datagram = 1 };

    inline const char *protocol_name(Protocol protocol) {
        switch (protocol) {
        case Protocol::Stream:
            return "tcp";
        case Protocol::Datagram:
            return "udp";
        }
        return "unknown";
    }

    // TCP endpoint - host and port
    struct TcpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }

        inline bool operator==(const UdpEndpoint &other) const { return port == other.port && host == other.host; }
    };

} // namespace parley
