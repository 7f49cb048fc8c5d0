#pragma once

#include <parley/endpoint.hpp>
#include <parley/stream.hpp>

#include <cstdlib>

namespace parley {

    /// Default ports when nothing else is configured
    constexpr dp::u16 DEFAULT_TCP_PORT = 5050;
    constexpr dp::u16 DEFAULT_UDP_PORT = 5051;

    /// Retransmission policy of the reliable datagram layer
    struct ReliabilityOptions {
        dp::u32 retry_interval_ms = 500; // how often the retry thread wakes
        dp::u32 retry_timeout_ms = 2000; // age after which a pending send is resent
        dp::u32 max_retries = 30;        // 0 = retry forever
        dp::usize dedup_window = 1024;   // sequence numbers remembered per peer
    };

    namespace detail {
        inline dp::String env_or(const char *name, const char *fallback) {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return dp::String(fallback);
            }
            return dp::String(value);
        }

        inline dp::u16 env_port(const char *name, dp::u16 fallback) {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return fallback;
            }
            char *end = nullptr;
            long port = std::strtol(value, &end, 10);
            if (end == value || *end != '\0' || port <= 0 || port > 65535) {
                echo::warn("ignoring invalid ", name, "='", value, "'");
                return fallback;
            }
            return static_cast<dp::u16>(port);
        }

        inline dp::u16 default_port(Protocol protocol) {
            switch (protocol) {
            case Protocol::Stream:
                return env_port("CHAT_SERVER_TCP_PORT", DEFAULT_TCP_PORT);
            case Protocol::Datagram:
                return env_port("CHAT_SERVER_UDP_PORT", DEFAULT_UDP_PORT);
            }
            return DEFAULT_TCP_PORT;
        }
    } // namespace detail

    struct ServerOptions {
        Protocol protocol = Protocol::Stream;
        dp::String host = "0.0.0.0";
        dp::u16 port = DEFAULT_TCP_PORT;

        dp::u32 inactivity_timeout_ms = 30000; // datagram peers only
        dp::u32 reap_interval_ms = 1000;

        // Forward chat from one peer to every other peer
        bool relay_chat = true;

        // Applied to every accepted stream (stream protocol only)
        StreamDecorator decorator;

        ReliabilityOptions reliability;

        /// Defaults overridden by CHAT_SERVER_HOST / CHAT_SERVER_TCP_PORT / CHAT_SERVER_UDP_PORT
        static ServerOptions from_env(Protocol protocol) {
            ServerOptions options;
            options.protocol = protocol;
            options.host = detail::env_or("CHAT_SERVER_HOST", "0.0.0.0");
            options.port = detail::default_port(protocol);
            return options;
        }
    };

    struct ClientOptions {
        Protocol protocol = Protocol::Stream;
        dp::String host = "127.0.0.1";
        dp::u16 port = DEFAULT_TCP_PORT;
        std::string username = "anonymous";

        dp::u32 connect_timeout_ms = 3000; // stream connect
        dp::u32 probe_timeout_ms = 2000;   // first reply on datagram connect

        StreamDecorator decorator;

        ReliabilityOptions reliability;

        static ClientOptions from_env(Protocol protocol) {
            ClientOptions options;
            options.protocol = protocol;
            options.host = detail::env_or("CHAT_SERVER_HOST", "127.0.0.1");
            options.port = detail::default_port(protocol);
            return options;
        }
    };

} // namespace parley
