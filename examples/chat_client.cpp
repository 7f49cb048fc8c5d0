#include <parley/parley.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>

// Interactive chat client
//
// Usage: chat_client [tcp|udp] [host] [port] [name]
//   /test          measure round-trip latency
//   /status <text> send a status notice
//   /quit          leave
// Anything else is sent as chat.

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

    auto options = parley::ClientOptions::from_env(protocol);
    if (argc > 2) {
        options.host = argv[2];
    }
    if (argc > 3) {
        options.port = static_cast<dp::u16>(std::atoi(argv[3]));
    }
    if (argc > 4) {
        options.username = argv[4];
    }

    parley::Callbacks callbacks;
    callbacks.on_message = [](const parley::PeerInfo &peer, const std::string &text) {
        std::cout << "[" << peer.display_name << "] " << text << std::endl;
    };
    callbacks.on_status = [](const std::string &text, bool is_error) {
        if (is_error) {
            echo::error(text.c_str());
        } else {
            echo::info(text.c_str());
        }
    };

    auto client = parley::make_client(options, callbacks);
    auto res = client->connect();
    if (res.is_err()) {
        echo::error("Failed to connect: ", res.error().message.c_str());
        return 1;
    }

    auto submit = [&client](const std::string &text) -> dp::Res<void> {
        if (text == "/test") {
            return client->send_test();
        }
        if (text.rfind("/status ", 0) == 0) {
            return client->send_status(text.substr(8));
        }
        return client->send_chat(text);
    };

    std::string line;
    while (client->is_connected() && std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        if (line == "/quit") {
            break;
        }
        auto send_res = submit(line);
        if (send_res.is_err()) {
            echo::error("Send failed: ", send_res.error().message.c_str());
        }
    }

    client->disconnect();
    return 0;
}
