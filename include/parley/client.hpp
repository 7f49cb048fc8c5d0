#pragma once

#include <parley/config.hpp>
#include <parley/protocol/codec.hpp>
#include <parley/session/peer.hpp>

#include <atomic>
#include <cstdio>

namespace parley {

    // Abstract chat client, one implementation per transport family
    // Inbound traffic is reported through the Callbacks from a receive thread
    class Client {
      protected:
        ClientOptions options_;
        Callbacks callbacks_;
        std::atomic<bool> connected_;

        Client(const ClientOptions &options, Callbacks callbacks)
            : options_(options), callbacks_(std::move(callbacks)), connected_(false) {}

        PeerInfo peer_for(const std::string &sender) const {
            PeerInfo peer;
            peer.identifier = to_std(options_.host) + ":" + std::to_string(options_.port);
            peer.display_name = sender.empty() ? std::string(SERVER_IDENTITY) : sender;
            peer.protocol = options_.protocol;
            peer.last_activity = Clock::now();
            return peer;
        }

        // Report one inbound message to the application
        void dispatch(const Message &msg) {
            switch (msg.kind) {
            case MessageKind::Connect:
                callbacks_.status(msg.sender + " joined", false);
                break;
            case MessageKind::Disconnect:
                callbacks_.status(msg.content, false);
                break;
            case MessageKind::Chat:
                callbacks_.message(peer_for(msg.sender), msg.content);
                break;
            case MessageKind::Status:
                callbacks_.status(msg.sender + ": " + msg.content, false);
                break;
            case MessageKind::Error:
                callbacks_.status(msg.sender + ": " + msg.content, true);
                break;
            case MessageKind::Test: {
                // Echo of our own probe, never answered
                double latency_ms = (now_seconds() - msg.timestamp) * 1000.0;
                char text[96];
                std::snprintf(text, sizeof(text), "test echo from %s: %.2f ms", msg.sender.c_str(), latency_ms);
                echo::debug(text);
                callbacks_.status(text, false);
                break;
            }
            case MessageKind::Ack:
                echo::trace("ignoring unexpected ack");
                break;
            }
        }

      public:
        virtual ~Client() = default;

        // Reach the server and announce ourselves with Connect
        // Fails with "peer unreachable" when the server does not answer in time
        virtual dp::Res<void> connect() = 0;

        virtual dp::Res<void> send_chat(const std::string &text) = 0;

        virtual dp::Res<void> send_status(const std::string &text) = 0;

        // Latency probe, the echo is reported through on_status
        virtual dp::Res<void> send_test() = 0;

        // Best-effort Disconnect, then release threads and sockets
        // Idempotent
        virtual void disconnect() = 0;

        bool is_connected() const { return connected_; }

        Protocol protocol() const { return options_.protocol; }

        const std::string &username() const { return options_.username; }
    };

} // namespace parley
