#pragma once

#include <parley/endpoint.hpp>

#include <functional>

namespace parley {

    /// What the server knows about one connected peer
    struct PeerInfo {
        std::string identifier;   // "ip:port" of the remote socket
        std::string display_name; // from Connect, falls back to the first chat's sender
        Protocol protocol = Protocol::Stream;
        Clock::time_point connected_at;
        Clock::time_point last_activity;
    };

    /// Application hooks, invoked from internal threads
    /// Any of them may be left empty
    struct Callbacks {
        std::function<void(const PeerInfo &, const std::string &)> on_message;
        std::function<void(const std::string &, bool is_error)> on_status;
        std::function<void(const PeerInfo &)> on_peer_connected;
        std::function<void(const PeerInfo &)> on_peer_disconnected;

        void message(const PeerInfo &peer, const std::string &text) const {
            if (on_message)
                on_message(peer, text);
        }
        void status(const std::string &text, bool is_error) const {
            if (on_status)
                on_status(text, is_error);
        }
        void connected(const PeerInfo &peer) const {
            if (on_peer_connected)
                on_peer_connected(peer);
        }
        void disconnected(const PeerInfo &peer) const {
            if (on_peer_disconnected)
                on_peer_disconnected(peer);
        }
    };

} // namespace parley
