#pragma once

#include <parley/endpoint.hpp>

namespace parley {

    // Abstract base class for datagram-oriented (connectionless) transports
    // Datagrams are unreliable, unordered, connectionless messages
    class Datagram {
      public:
        virtual ~Datagram() = default;

        // Bind to local address for receiving
        // Port 0 picks an ephemeral port, see local_port()
        virtual dp::Res<void> bind(const UdpEndpoint &endpoint) = 0;

        // Send one datagram to a specific destination
        // Fire and forget - may or may not arrive
        // No framing needed - message boundaries preserved by transport
        virtual dp::Res<void> send_to(const Bytes &payload, const UdpEndpoint &dest) = 0;

        // Receive one datagram
        // Blocks until a datagram arrives or the receive timeout elapses
        // Returns the payload and the source endpoint
        virtual dp::Res<dp::Pair<Bytes, UdpEndpoint>> recv_from() = 0;

        // Set receive timeout in milliseconds (0 = block forever)
        virtual dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) = 0;

        // Port actually bound, 0 when not bound
        virtual dp::u16 local_port() const = 0;

        // Close and release resources
        virtual void close() = 0;
    };

} // namespace parley
