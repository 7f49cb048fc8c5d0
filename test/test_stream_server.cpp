#include "chat_fixture.hpp"

#include <doctest/doctest.h>
#include <parley/client/client.hpp>
#include <parley/server/server.hpp>

#include <arpa/inet.h>
#include <atomic>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using chat_test::eventually;
using chat_test::Inbox;

namespace {

    parley::ServerOptions stream_server_options(dp::u16 port) {
        parley::ServerOptions options;
        options.protocol = parley::Protocol::Stream;
        options.host = "127.0.0.1";
        options.port = port;
        return options;
    }

    parley::ClientOptions stream_client_options(dp::u16 port, const std::string &name) {
        parley::ClientOptions options;
        options.protocol = parley::Protocol::Stream;
        options.host = "127.0.0.1";
        options.port = port;
        options.username = name;
        options.connect_timeout_ms = 1000;
        return options;
    }

    // Plain socket for sending bytes no well-behaved client would
    int raw_connect(dp::u16 port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        struct sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(::connect(fd, (struct sockaddr *)&addr, sizeof(addr)) == 0);
        return fd;
    }

    void raw_send(int fd, const parley::Bytes &bytes) {
        REQUIRE(::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(bytes.size()));
    }

} // namespace

TEST_CASE("StreamServer - handshake and chat") {
    Inbox server_inbox;
    parley::StreamServer server(stream_server_options(21201), server_inbox.callbacks());
    REQUIRE(server.start().is_ok());
    CHECK(server.is_running());
    CHECK(server.port() == 21201);
    CHECK(server.protocol() == parley::Protocol::Stream);

    Inbox alice_inbox;
    parley::StreamClient alice(stream_client_options(21201, "alice"), alice_inbox.callbacks());
    REQUIRE(alice.connect().is_ok());
    CHECK(alice.is_connected());

    SUBCASE("Connect is welcomed by name") {
        CHECK(eventually([&] { return alice_inbox.has_status("server: Welcome to the chat server, alice!"); }));
        CHECK(eventually([&] { return server_inbox.was_connected("alice"); }));
        CHECK(server.peer_count() == 1);

        auto peers = server.peers();
        REQUIRE(peers.size() == 1);
        CHECK(peers[0].display_name == "alice");
        CHECK(peers[0].protocol == parley::Protocol::Stream);
        CHECK(peers[0].identifier.find("127.0.0.1:") == 0);
    }

    SUBCASE("Chat reaches the server") {
        REQUIRE(alice.send_chat("hello").is_ok());
        CHECK(eventually([&] { return server_inbox.has_message("alice: hello"); }));
    }

    SUBCASE("Test probe is echoed with the latency") {
        REQUIRE(alice.send_test().is_ok());
        CHECK(eventually([&] { return alice_inbox.has_status("test echo from server:"); }));
        CHECK(alice_inbox.has_status(" ms"));
    }

    SUBCASE("Status from the client reaches the server status callback") {
        REQUIRE(alice.send_status("typing").is_ok());
        CHECK(eventually([&] { return server_inbox.has_status("alice: typing"); }));
    }

    SUBCASE("Disconnect is reported once") {
        REQUIRE(eventually([&] { return server_inbox.was_connected("alice"); }));
        alice.disconnect();
        CHECK_FALSE(alice.is_connected());
        CHECK(eventually([&] { return server_inbox.was_disconnected("alice"); }));
        CHECK(eventually([&] { return server_inbox.has_status("alice: peer disconnected"); }));
        CHECK(eventually([&] { return server.peer_count() == 0; }));

        // Second disconnect is a no-op
        alice.disconnect();
        CHECK(alice.send_chat("late").is_err());
    }

    alice.disconnect();
    server.stop();
    CHECK_FALSE(server.is_running());
}

TEST_CASE("StreamServer - relay and server-originated chat") {
    Inbox server_inbox;
    parley::StreamServer server(stream_server_options(21202), server_inbox.callbacks());
    REQUIRE(server.start().is_ok());

    Inbox alice_inbox;
    Inbox bob_inbox;
    parley::StreamClient alice(stream_client_options(21202, "alice"), alice_inbox.callbacks());
    parley::StreamClient bob(stream_client_options(21202, "bob"), bob_inbox.callbacks());
    REQUIRE(alice.connect().is_ok());
    REQUIRE(bob.connect().is_ok());
    REQUIRE(eventually([&] { return server_inbox.connected_count() == 2; }));

    SUBCASE("Chat is relayed to the other peers only") {
        REQUIRE(alice.send_chat("hi all").is_ok());
        CHECK(eventually([&] { return bob_inbox.has_message("alice: hi all"); }));
        CHECK(server_inbox.has_message("alice: hi all"));

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(alice_inbox.messages().empty());
    }

    SUBCASE("send_to reaches one peer") {
        std::string alice_id;
        for (const auto &peer : server.peers()) {
            if (peer.display_name == "alice") {
                alice_id = peer.identifier;
            }
        }
        REQUIRE_FALSE(alice_id.empty());

        REQUIRE(server.send_to(alice_id, "just you").is_ok());
        CHECK(eventually([&] { return alice_inbox.has_message("server: just you"); }));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(bob_inbox.messages().empty());

        auto missing = server.send_to("10.0.0.1:1", "nobody");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code != dp::Error::TIMEOUT);
    }

    SUBCASE("broadcast reaches everyone") {
        CHECK(server.broadcast("attention") == 2);
        CHECK(eventually([&] { return alice_inbox.has_message("server: attention"); }));
        CHECK(eventually([&] { return bob_inbox.has_message("server: attention"); }));
    }

    alice.disconnect();
    bob.disconnect();
    server.stop();
}

TEST_CASE("StreamServer - relay disabled") {
    Inbox server_inbox;
    auto options = stream_server_options(21203);
    options.relay_chat = false;
    parley::StreamServer server(options, server_inbox.callbacks());
    REQUIRE(server.start().is_ok());

    Inbox alice_inbox;
    Inbox bob_inbox;
    parley::StreamClient alice(stream_client_options(21203, "alice"), alice_inbox.callbacks());
    parley::StreamClient bob(stream_client_options(21203, "bob"), bob_inbox.callbacks());
    REQUIRE(alice.connect().is_ok());
    REQUIRE(bob.connect().is_ok());
    REQUIRE(eventually([&] { return server_inbox.connected_count() == 2; }));

    REQUIRE(alice.send_chat("private").is_ok());
    CHECK(eventually([&] { return server_inbox.has_message("alice: private"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(bob_inbox.messages().empty());

    alice.disconnect();
    bob.disconnect();
    server.stop();
}

TEST_CASE("StreamServer - lifecycle") {
    SUBCASE("Connect to a closed port fails fast") {
        Inbox inbox;
        parley::StreamClient client(stream_client_options(21299, "alice"), inbox.callbacks());

        auto start = std::chrono::steady_clock::now();
        auto res = client.connect();
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(res.is_err());
        CHECK(parley::to_std(res.error().message).find("peer unreachable") == 0);
        CHECK_FALSE(client.is_connected());
        CHECK(elapsed < std::chrono::milliseconds(1500));
        CHECK(client.send_chat("nobody home").is_err());
    }

    SUBCASE("Start twice is refused") {
        Inbox inbox;
        parley::StreamServer server(stream_server_options(21204), inbox.callbacks());
        REQUIRE(server.start().is_ok());
        CHECK(server.start().is_err());
        server.stop();
        server.stop();
        CHECK_FALSE(server.is_running());
    }

    SUBCASE("Port 0 picks an ephemeral port") {
        Inbox server_inbox;
        parley::StreamServer server(stream_server_options(0), server_inbox.callbacks());
        REQUIRE(server.start().is_ok());
        dp::u16 port = server.port();
        REQUIRE(port != 0);

        Inbox alice_inbox;
        parley::StreamClient alice(stream_client_options(port, "alice"), alice_inbox.callbacks());
        REQUIRE(alice.connect().is_ok());
        CHECK(eventually([&] { return server_inbox.was_connected("alice"); }));

        alice.disconnect();
        server.stop();
        CHECK(server.port() == 0);
    }

    SUBCASE("Stop closes connected peers") {
        Inbox server_inbox;
        parley::StreamServer server(stream_server_options(21205), server_inbox.callbacks());
        REQUIRE(server.start().is_ok());

        Inbox alice_inbox;
        parley::StreamClient alice(stream_client_options(21205, "alice"), alice_inbox.callbacks());
        REQUIRE(alice.connect().is_ok());
        REQUIRE(eventually([&] { return server_inbox.was_connected("alice"); }));

        server.stop();
        CHECK(server.peer_count() == 0);
        CHECK(server_inbox.was_disconnected("alice"));
        CHECK(server_inbox.has_status("alice: server stopping"));
        CHECK(eventually([&] { return alice_inbox.has_status("server closed the connection"); }));
        CHECK(eventually([&] { return !alice.is_connected(); }));
    }

    SUBCASE("Decorator sees every stream") {
        std::atomic<int> server_wraps{0};
        std::atomic<int> client_wraps{0};

        Inbox server_inbox;
        auto server_options = stream_server_options(21206);
        server_options.decorator = [&](std::unique_ptr<parley::Stream> stream) -> dp::Res<std::unique_ptr<parley::Stream>> {
            server_wraps++;
            return dp::result::ok(std::move(stream));
        };
        parley::StreamServer server(server_options, server_inbox.callbacks());
        REQUIRE(server.start().is_ok());

        Inbox alice_inbox;
        auto client_options = stream_client_options(21206, "alice");
        client_options.decorator = [&](std::unique_ptr<parley::Stream> stream) -> dp::Res<std::unique_ptr<parley::Stream>> {
            client_wraps++;
            return dp::result::ok(std::move(stream));
        };
        parley::StreamClient alice(client_options, alice_inbox.callbacks());
        REQUIRE(alice.connect().is_ok());

        REQUIRE(alice.send_chat("wrapped").is_ok());
        CHECK(eventually([&] { return server_inbox.has_message("alice: wrapped"); }));
        CHECK(server_wraps.load() == 1);
        CHECK(client_wraps.load() == 1);

        alice.disconnect();
        server.stop();
    }
}

TEST_CASE("Factories pick the stream transport") {
    Inbox server_inbox;
    auto server = parley::make_server(stream_server_options(21207), server_inbox.callbacks());
    REQUIRE(server);
    CHECK(server->protocol() == parley::Protocol::Stream);
    REQUIRE(server->start().is_ok());

    Inbox client_inbox;
    auto client = parley::make_client(stream_client_options(21207, "carol"), client_inbox.callbacks());
    REQUIRE(client);
    CHECK(client->protocol() == parley::Protocol::Stream);
    CHECK(client->username() == "carol");
    REQUIRE(client->connect().is_ok());
    CHECK(eventually([&] { return server_inbox.was_connected("carol"); }));

    client->disconnect();
    server->stop();
}

TEST_CASE("StreamServer - transport errors tear the peer down") {
    Inbox server_inbox;
    parley::StreamServer server(stream_server_options(21208), server_inbox.callbacks());
    REQUIRE(server.start().is_ok());

    int fd = raw_connect(21208);
    raw_send(fd, parley::frame(parley::encode(parley::make_connect("mallory"))));
    REQUIRE(eventually([&] { return server_inbox.was_connected("mallory"); }));
    REQUIRE(server.peer_count() == 1);

    SUBCASE("Oversized length header") {
        raw_send(fd, parley::Bytes{0xFF, 0xFF, 0xFF, 0xFF});
        CHECK(eventually([&] { return server_inbox.has_error("mallory: connection lost (frame too large)"); }));
    }

    SUBCASE("Connection reset") {
        struct linger abortive = {1, 0};
        REQUIRE(::setsockopt(fd, SOL_SOCKET, SO_LINGER, &abortive, sizeof(abortive)) == 0);
        ::close(fd);
        fd = -1;
        CHECK(eventually([&] { return server_inbox.has_error("mallory: connection lost"); }));
    }

    CHECK(eventually([&] { return server.peer_count() == 0; }));
    CHECK(eventually([&] { return server_inbox.disconnected_count("mallory") == 1; }));

    if (fd >= 0) {
        ::close(fd);
    }
    server.stop();
    CHECK(server_inbox.disconnected_count("mallory") == 1);
    CHECK_FALSE(server_inbox.has_status("mallory: server stopping"));
}

TEST_CASE("StreamServer - stop from a callback") {
    Inbox server_inbox;
    parley::StreamServer *running_server = nullptr;
    auto callbacks = server_inbox.callbacks();
    auto record = callbacks.on_message;
    callbacks.on_message = [&](const parley::PeerInfo &peer, const std::string &text) {
        record(peer, text);
        if (text == "shutdown") {
            running_server->stop();
        }
    };
    parley::StreamServer server(stream_server_options(21209), callbacks);
    running_server = &server;
    REQUIRE(server.start().is_ok());

    Inbox alice_inbox;
    parley::StreamClient alice(stream_client_options(21209, "alice"), alice_inbox.callbacks());
    REQUIRE(alice.connect().is_ok());
    REQUIRE(eventually([&] { return server_inbox.was_connected("alice"); }));

    REQUIRE(alice.send_chat("shutdown").is_ok());
    CHECK(eventually([&] { return !server.is_running(); }));
    CHECK(eventually([&] { return server_inbox.has_status("alice: server stopping"); }));
    CHECK(eventually([&] { return server.peer_count() == 0; }));
    CHECK(eventually([&] { return alice_inbox.has_status("server closed the connection"); }));

    // The server comes back on the same port
    REQUIRE(server.start().is_ok());
    Inbox bob_inbox;
    parley::StreamClient bob(stream_client_options(21209, "bob"), bob_inbox.callbacks());
    REQUIRE(bob.connect().is_ok());
    CHECK(eventually([&] { return server_inbox.was_connected("bob"); }));

    bob.disconnect();
    server.stop();
}

TEST_CASE("StreamClient - reconnect") {
    Inbox server_inbox;
    parley::StreamServer server(stream_server_options(21210), server_inbox.callbacks());
    REQUIRE(server.start().is_ok());

    Inbox alice_inbox;
    parley::StreamClient alice(stream_client_options(21210, "alice"), alice_inbox.callbacks());
    REQUIRE(alice.connect().is_ok());
    REQUIRE(eventually([&] { return server_inbox.was_connected("alice"); }));
    CHECK(alice.connect().is_err());

    SUBCASE("Connect, disconnect, connect") {
        alice.disconnect();
        REQUIRE(eventually([&] { return server_inbox.disconnected_count("alice") == 1; }));

        REQUIRE(alice.connect().is_ok());
        CHECK(eventually([&] { return server_inbox.connected_count() == 2; }));
        REQUIRE(alice.send_chat("back again").is_ok());
        CHECK(eventually([&] { return server_inbox.has_message("alice: back again"); }));
    }

    SUBCASE("Connect after the server went away") {
        server.stop();
        CHECK(eventually([&] { return alice_inbox.has_status("server closed the connection"); }));
        REQUIRE(eventually([&] { return !alice.is_connected(); }));

        auto refused = alice.connect();
        REQUIRE(refused.is_err());
        CHECK(parley::to_std(refused.error().message).find("peer unreachable") == 0);

        REQUIRE(server.start().is_ok());
        REQUIRE(alice.connect().is_ok());
        CHECK(alice.is_connected());
        CHECK(eventually([&] { return server_inbox.connected_count() == 2; }));
    }

    alice.disconnect();
    server.stop();
}
