#pragma once

#include <parley/protocol/codec.hpp>
#include <parley/session/peer.hpp>

#include <atomic>
#include <mutex>

namespace parley {

    enum class SessionState : dp::u8 { Handshaking, Active, Closing, Closed };

    inline const char *state_name(SessionState state) {
        switch (state) {
        case SessionState::Handshaking:
            return "handshaking";
        case SessionState::Active:
            return "active";
        case SessionState::Closing:
            return "closing";
        case SessionState::Closed:
            return "closed";
        }
        return "unknown";
    }

    /// Why a session ended, drives the status text reported on teardown
    enum class CloseReason : dp::u8 {
        PeerDisconnected, // Disconnect message or orderly close
        ConnectionLost,   // reset, I/O error, oversized frame
        SendFailed,       // outbound send or reliable delivery failed
        Expired,          // datagram peer inactive too long
        ProtocolError,    // too many undecodable frames
        ServerStopping
    };

    /// Server-side handler for one peer, independent of the transport
    ///
    /// Decoded messages are dispatched by kind; replies go out through the
    /// injected send function. close() runs exactly once: it calls the release
    /// function (deregistration, socket shutdown) and reports the peer gone.
    class Session {
      public:
        using SendFn = std::function<dp::Res<void>(const Message &)>;
        using ReleaseFn = std::function<void()>;

        static constexpr dp::u32 MAX_DECODE_FAILURES = 3;

      private:
        PeerInfo info_;
        mutable std::mutex info_mutex_;
        Callbacks callbacks_;
        SendFn send_;
        ReleaseFn release_;

        std::atomic<SessionState> state_;
        std::atomic<bool> closed_;
        std::atomic<bool> announced_;
        std::atomic<dp::u32> decode_failures_;

        void activate(const std::string &name) {
            PeerInfo snapshot;
            {
                std::lock_guard<std::mutex> lock(info_mutex_);
                if (!name.empty()) {
                    info_.display_name = name;
                } else if (info_.display_name.empty()) {
                    info_.display_name = info_.identifier;
                }
                snapshot = info_;
            }

            SessionState expected = SessionState::Handshaking;
            if (state_.compare_exchange_strong(expected, SessionState::Active)) {
                announced_ = true;
                echo::info("peer ", snapshot.identifier.c_str(), " is '", snapshot.display_name.c_str(), "'");
                callbacks_.connected(snapshot);
            }
        }

        dp::Res<void> reply(const Message &msg) {
            auto res = send_(msg);
            if (res.is_err()) {
                close(CloseReason::SendFailed, to_std(res.error().message));
            }
            return res;
        }

      public:
        Session(PeerInfo info, Callbacks callbacks, SendFn send, ReleaseFn release)
            : info_(std::move(info)), callbacks_(std::move(callbacks)), send_(std::move(send)),
              release_(std::move(release)), state_(SessionState::Handshaking), closed_(false), announced_(false),
              decode_failures_(0) {
            echo::trace("session created for ", info_.identifier.c_str());
        }

        /// Decode and dispatch one frame
        /// Undecodable frames are dropped; the third in a row is fatal and closes the session
        dp::Res<void> handle_payload(const Bytes &payload) {
            auto decode_res = decode(payload);
            if (decode_res.is_err()) {
                if (note_decode_failure()) {
                    return dp::result::err(decode_res.error());
                }
                return dp::result::ok();
            }
            return handle(decode_res.value());
        }

        /// Count an undecodable frame; true once the limit is hit and the session closed
        bool note_decode_failure() {
            touch();
            dp::u32 failures = decode_failures_.fetch_add(1) + 1;
            echo::warn("undecodable frame from ", identifier().c_str(), " (", failures, " in a row)");
            if (failures >= MAX_DECODE_FAILURES) {
                close(CloseReason::ProtocolError, "too many malformed messages");
                return true;
            }
            return false;
        }

        /// Dispatch one decoded message
        /// Returns an error only when a reply could not be sent (the session is closed then)
        dp::Res<void> handle(const Message &msg) {
            touch();
            decode_failures_ = 0;

            SessionState state = state_;
            if (state == SessionState::Closing || state == SessionState::Closed) {
                echo::debug("ignoring ", kind_name(msg.kind), " on ", state_name(state), " session");
                return dp::result::ok();
            }

            switch (msg.kind) {
            case MessageKind::Connect: {
                activate(msg.content.empty() ? msg.sender : msg.content);
                return reply(make_status("Welcome to the chat server, " + display_name() + "!"));
            }
            case MessageKind::Chat: {
                if (state == SessionState::Handshaking) {
                    activate(msg.sender);
                }
                callbacks_.message(info(), msg.content);
                return dp::result::ok();
            }
            case MessageKind::Status:
                callbacks_.status(msg.sender + ": " + msg.content, false);
                return dp::result::ok();
            case MessageKind::Error:
                callbacks_.status(msg.sender + ": " + msg.content, true);
                return dp::result::ok();
            case MessageKind::Test:
                echo::debug("test probe from ", identifier().c_str());
                return reply(make_test_echo(msg, SERVER_IDENTITY));
            case MessageKind::Ack:
                echo::trace("ignoring ack on unsequenced session");
                return dp::result::ok();
            case MessageKind::Disconnect:
                close(CloseReason::PeerDisconnected);
                return dp::result::ok();
            }
            return dp::result::ok();
        }

        /// Send a message to the peer; a failure closes the session
        dp::Res<void> send(const Message &msg) {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("session closed"));
            }
            return reply(msg);
        }

        /// Tear down once; later and concurrent callers return false immediately
        bool close(CloseReason reason, const std::string &detail = std::string()) {
            if (closed_.exchange(true)) {
                return false;
            }
            state_ = SessionState::Closing;

            PeerInfo snapshot = info();
            std::string who = snapshot.display_name.empty() ? snapshot.identifier : snapshot.display_name;
            std::string text;
            bool is_error = false;
            switch (reason) {
            case CloseReason::PeerDisconnected:
                text = who + ": peer disconnected";
                break;
            case CloseReason::ConnectionLost:
                text = who + ": connection lost";
                is_error = true;
                break;
            case CloseReason::SendFailed:
                text = who + ": send failed";
                is_error = true;
                break;
            case CloseReason::Expired:
                text = who + ": timed out";
                break;
            case CloseReason::ProtocolError:
                text = who + ": protocol error";
                is_error = true;
                break;
            case CloseReason::ServerStopping:
                text = who + ": server stopping";
                break;
            }
            if (!detail.empty()) {
                text += " (" + detail + ")";
            }
            echo::info("closing session ", snapshot.identifier.c_str(), ": ", text.c_str());

            if (release_) {
                release_();
            }
            state_ = SessionState::Closed;

            callbacks_.status(text, is_error);
            if (announced_) {
                callbacks_.disconnected(snapshot);
            }
            return true;
        }

        void touch() {
            std::lock_guard<std::mutex> lock(info_mutex_);
            info_.last_activity = Clock::now();
        }

        PeerInfo info() const {
            std::lock_guard<std::mutex> lock(info_mutex_);
            return info_;
        }

        std::string identifier() const {
            std::lock_guard<std::mutex> lock(info_mutex_);
            return info_.identifier;
        }

        std::string display_name() const {
            std::lock_guard<std::mutex> lock(info_mutex_);
            return info_.display_name.empty() ? info_.identifier : info_.display_name;
        }

        Clock::time_point last_activity() const {
            std::lock_guard<std::mutex> lock(info_mutex_);
            return info_.last_activity;
        }

        SessionState state() const { return state_; }

        bool is_closed() const { return closed_; }

        dp::u32 decode_failures() const { return decode_failures_; }
    };

} // namespace parley
