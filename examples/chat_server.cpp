#include <parley/parley.hpp>

#include <csignal>
#include <cstdlib>
#include <cstring>

// Chat server
//
// Usage: chat_server [tcp|udp] [host] [port]
// Defaults come from CHAT_SERVER_HOST / CHAT_SERVER_TCP_PORT / CHAT_SERVER_UDP_PORT.

std::atomic<bool> g_running{true};

void on_signal(int) { g_running = false; }

int main(int argc, char **argv) {
    parley::Protocol protocol = parley::Protocol::Stream;
    if (argc > 1) {
        if (std::strcmp(argv[1], "udp") == 0) {
            protocol = parley::Protocol::Datagram;
        } else if (std::strcmp(argv[1], "tcp") != 0) {
            echo::error("unknown protocol '", argv[1], "', expected tcp or udp");
            return 1;
        }
    }

    auto options = parley::ServerOptions::from_env(protocol);
    if (argc > 2) {
        options.host = argv[2];
    }
    if (argc > 3) {
        options.port = static_cast<dp::u16>(std::atoi(argv[3]));
    }

    parley::Callbacks callbacks;
    callbacks.on_message = [](const parley::PeerInfo &peer, const std::string &text) {
        echo::info("[", peer.display_name.c_str(), "] ", text.c_str());
    };
    callbacks.on_status = [](const std::string &text, bool is_error) {
        if (is_error) {
            echo::warn(text.c_str());
        } else {
            echo::info(text.c_str());
        }
    };
    callbacks.on_peer_connected = [](const parley::PeerInfo &peer) {
        echo::info(peer.display_name.c_str(), " joined from ", peer.identifier.c_str());
    };
    callbacks.on_peer_disconnected = [](const parley::PeerInfo &peer) {
        echo::info(peer.display_name.c_str(), " left");
    };

    auto server = parley::make_server(options, callbacks);
    auto res = server->start();
    if (res.is_err()) {
        echo::error("Failed to start: ", res.error().message.c_str());
        return 1;
    }
    echo::info(parley::protocol_name(protocol), " chat server listening on port ", server->port());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(parley::POLL_INTERVAL_MS));
    }

    server->broadcast("Server is shutting down");
    server->stop();
    echo::info("Server shut down");
    return 0;
}
