#pragma once

#include <parley/reliable/receiver.hpp>
#include <parley/reliable/sender.hpp>

namespace parley {

    /// Outcome of feeding one inbound message through a link
    enum class Inbound {
        Deliver,   // hand the (possibly unwrapped) message to the session
        Consumed,  // ack handled inside the link
        Duplicate  // chat already delivered once, acked again and dropped
    };

    /// Reliable datagram link to one peer
    ///
    /// Outbound chats go through the ReliableSender. Inbound, acks are consumed,
    /// enveloped chats are acked immediately and delivered once per sequence
    /// number, and everything else (plain chats included) passes through.
    ///
    /// Delivery is not FIFO: a retransmitted earlier sequence number can arrive,
    /// and be delivered, after a later one.
    class ReliableLink {
      private:
        ReliableSender::TransmitFn transmit_;
        std::string local_name_;
        LinkStats stats_;
        ReliableSender sender_;
        SequenceWindow window_;

      public:
        ReliableLink(ReliableSender::TransmitFn transmit, const std::string &local_name,
                     const ReliabilityOptions &options, bool auto_retry = true)
            : transmit_(transmit), local_name_(local_name), sender_(transmit, options, stats_, auto_retry),
              window_(options.dedup_window) {}

        ReliableLink(const ReliableLink &) = delete;
        ReliableLink &operator=(const ReliableLink &) = delete;

        /// Send a chat reliably, sender_name goes into the message's sender field
        dp::Res<dp::u64> send_chat(const std::string &text, const std::string &sender_name) {
            return sender_.send(text, sender_name);
        }

        /// Send any message without sequencing (status, error, test, connect)
        dp::Res<void> send_plain(const Message &msg) { return transmit_(encode(msg)); }

        /// Process one decoded inbound message; out is set when Deliver is returned
        Inbound receive(const Message &in, Message &out) {
            switch (in.kind) {
            case MessageKind::Ack: {
                auto ack_res = decode_ack(in.content);
                if (ack_res.is_err()) {
                    echo::warn("dropping malformed ack: ", ack_res.error().message.c_str());
                    return Inbound::Consumed;
                }
                sender_.acknowledge(ack_res.value().sequence);
                return Inbound::Consumed;
            }
            case MessageKind::Chat: {
                auto env_res = decode_envelope(in.content);
                if (env_res.is_err()) {
                    // Not sequenced, deliver as plain text
                    out = in;
                    return Inbound::Deliver;
                }
                const Envelope &env = env_res.value();

                // Ack every copy, the previous ack may have been lost
                AckInfo ack{env.sequence, env.test_id};
                auto ack_res = transmit_(encode(make_ack(ack, local_name_)));
                if (ack_res.is_err()) {
                    echo::warn("ack #", env.sequence, " not sent: ", ack_res.error().message.c_str());
                }

                if (!window_.accept(env.sequence)) {
                    stats_.duplicates.fetch_add(1);
                    echo::debug("duplicate #", env.sequence, " from '", in.sender.c_str(), "'");
                    return Inbound::Duplicate;
                }

                out = in;
                out.content = env.data;
                return Inbound::Deliver;
            }
            case MessageKind::Connect:
            case MessageKind::Disconnect:
            case MessageKind::Status:
            case MessageKind::Error:
            case MessageKind::Test:
                out = in;
                return Inbound::Deliver;
            }
            out = in;
            return Inbound::Deliver;
        }

        void set_on_exhausted(ReliableSender::ExhaustedFn fn) { sender_.set_on_exhausted(std::move(fn)); }

        dp::usize retransmit_due(Clock::time_point now) { return sender_.retransmit_due(now); }

        dp::usize pending_count() const { return sender_.pending_count(); }

        bool in_recovery() const { return sender_.in_recovery(); }

        const LinkStats &stats() const { return stats_; }

        /// Drop pending sends and stop retrying
        void stop() { sender_.stop(); }
    };

} // namespace parley
