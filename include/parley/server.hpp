#pragma once

#include <parley/config.hpp>
#include <parley/session/peer.hpp>

namespace parley {

    // Abstract chat server, one implementation per transport family
    // All methods are safe to call from any thread, including from callbacks
    class Server {
      public:
        virtual ~Server() = default;

        // Bind and start the background threads
        virtual dp::Res<void> start() = 0;

        // Stop accepting, close every peer and join all threads
        // Idempotent. Called from a callback, the calling thread is joined later
        // by the destructor or the next start()
        virtual void stop() = 0;

        virtual bool is_running() const = 0;

        // Send a chat from the server to one peer
        virtual dp::Res<void> send_to(const std::string &identifier, const std::string &text) = 0;

        // Send a chat from the server to every peer
        // Returns how many peers it was handed to
        virtual dp::usize broadcast(const std::string &text) = 0;

        // Snapshot of the connected peers
        virtual dp::Vector<PeerInfo> peers() const = 0;

        virtual dp::usize peer_count() const = 0;

        // Port actually bound
        virtual dp::u16 port() const = 0;

        virtual Protocol protocol() const = 0;
    };

} // namespace parley
