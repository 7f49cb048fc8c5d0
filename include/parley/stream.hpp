#pragma once

#include <functional>
#include <memory>
#include <parley/endpoint.hpp>

namespace parley {

    // Abstract base class for stream-oriented (connection-based) transports
    // Streams are reliable, ordered, connection-oriented byte pipes carrying
    // length-prefixed frames
    class Stream {
      public:
        virtual ~Stream() = default;

        // Connection establishment - client side
        // Fails once timeout_ms elapses without a connection (0 = OS default)
        virtual dp::Res<void> connect(const TcpEndpoint &endpoint, dp::u32 timeout_ms) = 0;

        // Connection establishment - server side
        // Binds to local endpoint and starts listening
        virtual dp::Res<void> listen(const TcpEndpoint &endpoint) = 0;

        // Accept incoming connection - server side
        // Blocks until a client connects or the receive timeout elapses
        // Returns a new Stream instance for the client connection
        virtual dp::Res<std::unique_ptr<Stream>> accept() = 0;

        // Send one frame
        // Blocks until the entire frame is handed to the OS
        virtual dp::Res<void> send(const Bytes &payload) = 0;

        // Receive one frame
        // Blocks until a complete frame arrives or the receive timeout elapses
        // Returns the frame payload (without length prefix)
        virtual dp::Res<Bytes> recv() = 0;

        // Set receive timeout in milliseconds
        // 0 means no timeout (blocking forever)
        virtual dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) = 0;

        // Unblock any thread waiting in recv()/accept() without releasing the socket
        // Safe to call from another thread
        virtual void shutdown() = 0;

        // Close the connection and release resources
        virtual void close() = 0;

        // Check if the connection is active
        virtual bool is_connected() const = 0;

        // True once recv() observed an orderly close by the peer
        virtual bool peer_closed() const = 0;

        // Address of the other side ("ip:port")
        virtual dp::String remote_address() const = 0;
    };

    // Hook applied to every connected or accepted stream (e.g. a TLS wrapper)
    using StreamDecorator = std::function<dp::Res<std::unique_ptr<Stream>>(std::unique_ptr<Stream>)>;

} // namespace parley
