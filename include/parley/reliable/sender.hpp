#pragma once

#include <parley/config.hpp>
#include <parley/protocol/codec.hpp>
#include <parley/protocol/envelope.hpp>
#include <parley/reliable/stats.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace parley {

    /// A chat waiting for its acknowledgement
    struct PendingSend {
        dp::u64 sequence;
        Bytes payload; // encoded message, resent byte for byte
        Clock::time_point sent_at;
        dp::u32 retries;
    };

    /// Outbound half of a reliable datagram link
    ///
    /// Every chat gets the next sequence number, is wrapped in an envelope and kept
    /// until acknowledged. A retry thread, started with the first send, resends
    /// everything older than retry_timeout every retry_interval. Sends that reach
    /// max_retries are dropped and reported through the exhausted hook.
    ///
    /// Recovery mode is entered on any retransmission and left only once nothing
    /// is pending.
    class ReliableSender {
      public:
        using TransmitFn = std::function<dp::Res<void>(const Bytes &)>;
        using ExhaustedFn = std::function<void(dp::u64 sequence)>;

      private:
        TransmitFn transmit_;
        ReliabilityOptions options_;
        LinkStats &stats_;
        bool auto_retry_;

        std::atomic<dp::u64> next_sequence_;
        std::map<dp::u64, PendingSend> pending_;
        mutable std::mutex pending_mutex_;

        std::atomic<bool> in_recovery_;
        ExhaustedFn on_exhausted_;

        std::thread retry_thread_;
        std::mutex retry_mutex_;
        std::condition_variable retry_cv_;
        std::mutex join_mutex_;
        std::atomic<bool> running_;
        std::atomic<bool> stopped_;

        void retry_loop() {
            echo::debug("retry thread started");
            while (running_) {
                {
                    std::unique_lock<std::mutex> lock(retry_mutex_);
                    retry_cv_.wait_for(lock, std::chrono::milliseconds(options_.retry_interval_ms),
                                       [this] { return !running_; });
                }
                if (!running_) {
                    break;
                }
                retransmit_due(Clock::now());
            }
            echo::debug("retry thread stopped");
        }

        void ensure_retry_thread() {
            if (!auto_retry_) {
                return;
            }
            std::lock_guard<std::mutex> lock(retry_mutex_);
            if (!stopped_ && !running_ && !retry_thread_.joinable()) {
                running_ = true;
                retry_thread_ = std::thread(&ReliableSender::retry_loop, this);
            }
        }

        // Caller holds pending_mutex_
        void leave_recovery_if_idle() {
            if (pending_.empty() && in_recovery_.exchange(false)) {
                echo::info("reliable link recovered");
            }
        }

      public:
        /// auto_retry = false leaves retransmission to explicit retransmit_due() calls
        ReliableSender(TransmitFn transmit, const ReliabilityOptions &options, LinkStats &stats,
                       bool auto_retry = true)
            : transmit_(std::move(transmit)), options_(options), stats_(stats), auto_retry_(auto_retry),
              next_sequence_(0), in_recovery_(false), running_(false), stopped_(false) {}

        ~ReliableSender() {
            stop();
            std::lock_guard<std::mutex> join_lock(join_mutex_);
            if (retry_thread_.joinable()) {
                // Only reached when stop() ran on the retry thread itself
                retry_thread_.detach();
            }
        }

        ReliableSender(const ReliableSender &) = delete;
        ReliableSender &operator=(const ReliableSender &) = delete;

        void set_on_exhausted(ExhaustedFn fn) { on_exhausted_ = std::move(fn); }

        /// Wrap text in an envelope, record it as pending and transmit it
        /// Returns the sequence number assigned
        dp::Res<dp::u64> send(const std::string &text, const std::string &sender_name,
                              const std::string &test_id = std::string()) {
            if (stopped_) {
                return dp::result::err(dp::Error::not_found("reliable link stopped"));
            }

            dp::u64 sequence = next_sequence_.fetch_add(1);
            Envelope env;
            env.sequence = sequence;
            env.data = text;
            env.test_id = test_id;
            Bytes payload = encode(make_chat(encode_envelope(env), sender_name));

            // Recorded before transmitting so a fast ack always finds it
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending_[sequence] = PendingSend{sequence, payload, Clock::now(), 0};
            }
            ensure_retry_thread();

            auto res = transmit_(payload);
            if (res.is_err()) {
                echo::error("reliable send #", sequence, " failed: ", res.error().message.c_str());
                std::lock_guard<std::mutex> lock(pending_mutex_);
                pending_.erase(sequence);
                leave_recovery_if_idle();
                return dp::result::err(res.error());
            }

            stats_.sent.fetch_add(1);
            echo::trace("reliable send #", sequence, " len=", payload.size());
            return dp::result::ok(sequence);
        }

        /// Clear the pending send matching an ack; false for unknown or repeated acks
        bool acknowledge(dp::u64 sequence) {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(sequence);
            if (it == pending_.end()) {
                echo::debug("ack for unknown sequence ", sequence);
                return false;
            }
            echo::trace("ack #", sequence, " after ", it->second.retries, " retries");
            pending_.erase(it);
            stats_.acknowledged.fetch_add(1);
            leave_recovery_if_idle();
            return true;
        }

        /// Resend every pending send older than retry_timeout as of now
        /// Returns the number of datagrams resent
        dp::usize retransmit_due(Clock::time_point now) {
            auto timeout = std::chrono::milliseconds(options_.retry_timeout_ms);
            dp::Vector<Bytes> resend;
            dp::Vector<dp::u64> exhausted;

            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                for (auto it = pending_.begin(); it != pending_.end();) {
                    PendingSend &p = it->second;
                    if (now - p.sent_at < timeout) {
                        ++it;
                        continue;
                    }
                    if (options_.max_retries != 0 && p.retries >= options_.max_retries) {
                        echo::warn("giving up on #", p.sequence, " after ", p.retries, " retries");
                        exhausted.push_back(p.sequence);
                        it = pending_.erase(it);
                        continue;
                    }
                    p.retries++;
                    p.sent_at = now;
                    resend.push_back(p.payload);
                    ++it;
                }
                if (!resend.empty() && !in_recovery_.exchange(true)) {
                    echo::warn("reliable link entering recovery, ", pending_.size(), " pending");
                }
                leave_recovery_if_idle();
            }

            for (const auto &payload : resend) {
                auto res = transmit_(payload);
                if (res.is_err()) {
                    echo::warn("retransmit failed: ", res.error().message.c_str());
                }
            }
            stats_.retransmitted.fetch_add(resend.size());
            stats_.exhausted.fetch_add(exhausted.size());

            if (on_exhausted_) {
                for (dp::u64 sequence : exhausted) {
                    on_exhausted_(sequence);
                }
            }
            return resend.size();
        }

        dp::usize pending_count() const {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            return pending_.size();
        }

        bool is_pending(dp::u64 sequence) const {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            return pending_.count(sequence) != 0;
        }

        bool in_recovery() const { return in_recovery_; }

        dp::u64 next_sequence() const { return next_sequence_; }

        /// Discard everything pending and stop the retry thread
        /// Nothing is retried afterwards; safe to call more than once
        void stop() {
            stopped_ = true;
            {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                if (!pending_.empty()) {
                    echo::debug("discarding ", pending_.size(), " pending sends");
                }
                pending_.clear();
                in_recovery_ = false;
            }
            {
                std::lock_guard<std::mutex> lock(retry_mutex_);
                stopped_ = true;
                running_ = false;
            }
            retry_cv_.notify_all();
            std::lock_guard<std::mutex> join_lock(join_mutex_);
            if (retry_thread_.joinable() && retry_thread_.get_id() != std::this_thread::get_id()) {
                retry_thread_.join();
            }
        }
    };

} // namespace parley
