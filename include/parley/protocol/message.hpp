#pragma once

#include <parley/common.hpp>

namespace parley {

    /// Protocol version tag carried by every message
    constexpr const char *PROTOCOL_VERSION = "1.0";

    /// Message kinds - closed set, anything else on the wire is rejected
    enum class MessageKind : dp::u8 {
        Connect = 0,    // Peer announces itself, content is the display name
        Disconnect = 1, // Peer is leaving
        Chat = 2,       // User text ("message" on the wire)
        Status = 3,     // Informational notice
        Error = 4,      // Error notice from the other side
        Test = 5,       // Latency probe, echoed back unchanged
        Ack = 6         // Reliable datagram acknowledgement
    };

    /// Wire name of a message kind
    inline const char *kind_name(MessageKind kind) {
        switch (kind) {
        case MessageKind::Connect:
            return "connect";
        case MessageKind::Disconnect:
            return "disconnect";
        case MessageKind::Chat:
            return "message";
        case MessageKind::Status:
            return "status";
        case MessageKind::Error:
            return "error";
        case MessageKind::Test:
            return "test";
        case MessageKind::Ack:
            return "ack";
        }
        return "unknown";
    }

    /// Parse a wire name; unknown names are an error, never a default kind
    inline dp::Res<MessageKind> parse_kind(const std::string &name) {
        if (name == "connect")
            return dp::result::ok(MessageKind::Connect);
        if (name == "disconnect")
            return dp::result::ok(MessageKind::Disconnect);
        if (name == "message")
            return dp::result::ok(MessageKind::Chat);
        if (name == "status")
            return dp::result::ok(MessageKind::Status);
        if (name == "error")
            return dp::result::ok(MessageKind::Error);
        if (name == "test")
            return dp::result::ok(MessageKind::Test);
        if (name == "ack")
            return dp::result::ok(MessageKind::Ack);

        echo::warn("unknown message kind: ", name.c_str());
        return dp::result::err(dp::Error::invalid_argument(dp::String("unknown message kind: ") + name.c_str()));
    }

    /// Seconds since the epoch, the unit of Message::timestamp
    inline double now_seconds() {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }

    /// One unit of communication
    struct Message {
        MessageKind kind = MessageKind::Status;
        std::string content;
        std::string sender; // empty encodes as null
        double timestamp = 0.0;
        std::string version = PROTOCOL_VERSION;

        inline bool operator==(const Message &other) const {
            return kind == other.kind && content == other.content && sender == other.sender &&
                   timestamp == other.timestamp && version == other.version;
        }
        inline bool operator!=(const Message &other) const { return !(*this == other); }
    };

    inline Message make_message(MessageKind kind, const std::string &content, const std::string &sender) {
        Message msg;
        msg.kind = kind;
        msg.content = content;
        msg.sender = sender;
        msg.timestamp = now_seconds();
        return msg;
    }

    inline Message make_chat(const std::string &text, const std::string &sender) {
        return make_message(MessageKind::Chat, text, sender);
    }

    inline Message make_status(const std::string &text, const std::string &sender = SERVER_IDENTITY) {
        return make_message(MessageKind::Status, text, sender);
    }

    inline Message make_error(const std::string &text, const std::string &sender = SERVER_IDENTITY) {
        return make_message(MessageKind::Error, text, sender);
    }

    // Connect carries the display name as its content
    inline Message make_connect(const std::string &name) { return make_message(MessageKind::Connect, name, name); }

    inline Message make_disconnect(const std::string &name) {
        return make_message(MessageKind::Disconnect, "User " + name + " disconnected", name);
    }

    inline Message make_test(const std::string &sender) { return make_message(MessageKind::Test, "", sender); }

    /// Echo of a test probe: same timestamp and version, responder as sender
    inline Message make_test_echo(const Message &probe, const std::string &responder) {
        Message echo_msg = probe;
        echo_msg.sender = responder;
        return echo_msg;
    }

} // namespace parley
