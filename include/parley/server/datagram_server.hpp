#pragma once

#include <parley/datagram/udp.hpp>
#include <parley/reliable/link.hpp>
#include <parley/server.hpp>
#include <parley/server/registry.hpp>
#include <parley/session/session.hpp>

#include <atomic>
#include <condition_variable>
#include <thread>

namespace parley {

    /// One datagram source address: its reliable link and its session
    class DatagramPeer {
      private:
        UdpEndpoint endpoint_;
        std::unique_ptr<ReliableLink> link_;
        std::unique_ptr<Session> session_;
        std::atomic<bool> exhausted_;
        std::atomic<dp::u64> lost_sequence_;

      public:
        DatagramPeer(const UdpEndpoint &endpoint, Datagram &socket, const ServerOptions &options,
                     const Callbacks &callbacks, std::function<void(DatagramPeer *)> on_release)
            : endpoint_(endpoint), exhausted_(false), lost_sequence_(0) {
            link_ = std::make_unique<ReliableLink>(
                [&socket, endpoint](const Bytes &payload) { return socket.send_to(payload, endpoint); },
                SERVER_IDENTITY, options.reliability);

            PeerInfo info;
            info.identifier = to_std(endpoint.to_string());
            info.protocol = Protocol::Datagram;
            info.connected_at = Clock::now();
            info.last_activity = info.connected_at;

            session_ = std::make_unique<Session>(
                info, callbacks, [this](const Message &msg) { return link_->send_plain(msg); },
                [this, on_release]() {
                    link_->stop();
                    on_release(this);
                });

            // Undeliverable chat means the peer is gone; the reaper closes it
            link_->set_on_exhausted([this](dp::u64 sequence) {
                lost_sequence_ = sequence;
                exhausted_ = true;
            });
        }

        DatagramPeer(const DatagramPeer &) = delete;
        DatagramPeer &operator=(const DatagramPeer &) = delete;

        /// Run one decoded datagram through the link and, if it survives, the session
        void receive(const Message &msg) {
            Message delivered;
            switch (link_->receive(msg, delivered)) {
            case Inbound::Deliver: {
                auto res = session_->handle(delivered);
                if (res.is_err()) {
                    echo::warn("reply to ", endpoint_.to_string(), " failed: ", res.error().message.c_str());
                }
                break;
            }
            case Inbound::Consumed:
            case Inbound::Duplicate:
                session_->touch();
                break;
            }
        }

        /// Reliable chat to this peer; a send failure closes the session
        dp::Res<void> send_chat(const std::string &text, const std::string &sender_name) {
            if (session_->is_closed()) {
                return dp::result::err(dp::Error::not_found("session closed"));
            }
            auto res = link_->send_chat(text, sender_name);
            if (res.is_err()) {
                session_->close(CloseReason::SendFailed, to_std(res.error().message));
                return dp::result::err(res.error());
            }
            return dp::result::ok();
        }

        /// Close after a chat ran out of retries; false if there was none or already closed
        bool close_if_exhausted() {
            if (!exhausted_) {
                return false;
            }
            return session_->close(CloseReason::SendFailed, "no ack for #" + std::to_string(lost_sequence_.load()));
        }

        Session &session() { return *session_; }

        ReliableLink &link() { return *link_; }

        const UdpEndpoint &endpoint() const { return endpoint_; }
    };

    /// Datagram (UDP) chat server
    ///
    /// A single receive thread classifies datagrams by source address and handles
    /// them in arrival order. A reaper thread expires peers that stayed silent
    /// longer than inactivity_timeout. Chats to peers go through a per-peer
    /// reliable link.
    class DatagramServer : public Server {
      private:
        ServerOptions options_;
        Callbacks callbacks_;
        Callbacks session_callbacks_;

        UdpDatagram socket_;
        std::thread receive_thread_;
        std::thread reaper_thread_;
        std::atomic<bool> running_;
        std::mutex reaper_mutex_;
        std::condition_variable reaper_cv_;

        PeerRegistry<DatagramPeer> registry_;

        // Closed peers, destroyed by the reaper so no peer dies on one of its own threads
        dp::Vector<std::shared_ptr<DatagramPeer>> retired_;
        std::mutex retired_mutex_;

        void retire(DatagramPeer *peer) {
            std::string identifier = peer->session().identifier();
            auto current = registry_.find(identifier);
            if (current.get() == peer && registry_.remove_if_same(identifier, peer)) {
                std::lock_guard<std::mutex> lock(retired_mutex_);
                retired_.push_back(std::move(current));
            }
        }

        void flush_retired() {
            dp::Vector<std::shared_ptr<DatagramPeer>> doomed;
            {
                std::lock_guard<std::mutex> lock(retired_mutex_);
                doomed.swap(retired_);
            }
            doomed.clear();
        }

        void relay(const std::string &origin, const std::string &text, const std::string &sender_name) {
            for (auto &peer : registry_.snapshot()) {
                if (peer->session().identifier() == origin) {
                    continue;
                }
                auto res = peer->send_chat(text, sender_name);
                if (res.is_err()) {
                    echo::warn("relay to ", peer->endpoint().to_string(), " failed");
                }
            }
        }

        void reply_invalid(const UdpEndpoint &src) {
            auto res = socket_.send_to(encode(make_error("Invalid message format")), src);
            if (res.is_err()) {
                echo::warn("could not report invalid datagram to ", src.to_string());
            }
        }

        std::shared_ptr<DatagramPeer> admit(const UdpEndpoint &src) {
            auto peer = std::make_shared<DatagramPeer>(src, socket_, options_, session_callbacks_,
                                                       [this](DatagramPeer *released) { retire(released); });
            auto add_res = registry_.add(peer->session().identifier(), peer);
            if (add_res.is_err()) {
                return registry_.find(peer->session().identifier());
            }
            echo::info("new datagram peer ", src.to_string());
            return peer;
        }

        void receive_loop() {
            echo::debug("datagram receive thread started");
            while (running_) {
                auto recv_res = socket_.recv_from();
                if (recv_res.is_err()) {
                    if (recv_res.error().code != dp::Error::TIMEOUT && running_) {
                        echo::error("recv_from failed: ", recv_res.error().message.c_str());
                    }
                    continue;
                }

                auto [payload, src] = std::move(recv_res.value());
                std::string identifier = to_std(src.to_string());
                auto peer = registry_.find(identifier);

                auto decode_res = decode(payload);
                if (decode_res.is_err()) {
                    reply_invalid(src);
                    if (peer) {
                        peer->session().note_decode_failure();
                    }
                    continue;
                }
                const Message &msg = decode_res.value();

                if (!peer) {
                    if (msg.kind == MessageKind::Ack || msg.kind == MessageKind::Disconnect) {
                        echo::debug("ignoring stray ", kind_name(msg.kind), " from ", src.to_string());
                        continue;
                    }
                    peer = admit(src);
                    if (!peer) {
                        continue;
                    }
                }

                peer->receive(msg);
            }
            echo::debug("datagram receive thread stopped");
        }

        // A worker that called stop() from a callback is joined by the destructor or the next start()
        static void join_worker(std::thread &worker) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }

        void reaper_loop() {
            echo::debug("reaper thread started");
            auto inactivity = std::chrono::milliseconds(options_.inactivity_timeout_ms);
            while (running_) {
                {
                    std::unique_lock<std::mutex> lock(reaper_mutex_);
                    reaper_cv_.wait_for(lock, std::chrono::milliseconds(options_.reap_interval_ms),
                                        [this] { return !running_; });
                }
                if (!running_) {
                    break;
                }
                reap(Clock::now(), inactivity);
            }
            echo::debug("reaper thread stopped");
        }

      public:
        DatagramServer(const ServerOptions &options, Callbacks callbacks)
            : options_(options), callbacks_(std::move(callbacks)), running_(false) {
            session_callbacks_ = callbacks_;
            session_callbacks_.on_message = [this](const PeerInfo &peer, const std::string &text) {
                callbacks_.message(peer, text);
                if (options_.relay_chat) {
                    relay(peer.identifier, text, peer.display_name);
                }
            };
        }

        ~DatagramServer() override {
            stop();
            join_worker(receive_thread_);
            join_worker(reaper_thread_);
        }

        DatagramServer(const DatagramServer &) = delete;
        DatagramServer &operator=(const DatagramServer &) = delete;

        dp::Res<void> start() override {
            if (running_) {
                return dp::result::err(dp::Error::invalid_argument("server already running"));
            }
            join_worker(receive_thread_);
            join_worker(reaper_thread_);
            if (receive_thread_.joinable() || reaper_thread_.joinable()) {
                return dp::result::err(dp::Error::invalid_argument("cannot restart from a server thread"));
            }

            UdpEndpoint endpoint{options_.host, options_.port};
            auto bind_res = socket_.bind(endpoint);
            if (bind_res.is_err()) {
                return bind_res;
            }
            auto timeout_res = socket_.set_recv_timeout(POLL_INTERVAL_MS);
            if (timeout_res.is_err()) {
                socket_.close();
                return timeout_res;
            }

            running_ = true;
            receive_thread_ = std::thread(&DatagramServer::receive_loop, this);
            reaper_thread_ = std::thread(&DatagramServer::reaper_loop, this);
            echo::info("datagram server running on port ", socket_.local_port());
            return dp::result::ok();
        }

        void stop() override {
            {
                std::lock_guard<std::mutex> lock(reaper_mutex_);
                if (!running_.exchange(false)) {
                    return;
                }
            }
            echo::info("stopping datagram server");
            reaper_cv_.notify_all();

            join_worker(receive_thread_);
            join_worker(reaper_thread_);

            for (auto &peer : registry_.snapshot()) {
                peer->session().close(CloseReason::ServerStopping);
            }
            registry_.drain();
            flush_retired();
            socket_.close();
            echo::info("datagram server stopped");
        }

        /// Close peers that stayed silent for longer than inactivity as of now, or
        /// whose chats went unacknowledged, then free closed peers
        /// Returns the number of peers closed
        dp::usize reap(Clock::time_point now, std::chrono::milliseconds inactivity) {
            dp::usize expired = 0;
            for (auto &peer : registry_.snapshot()) {
                if (peer->close_if_exhausted()) {
                    ++expired;
                } else if (now - peer->session().last_activity() > inactivity) {
                    if (peer->session().close(CloseReason::Expired)) {
                        ++expired;
                    }
                }
            }
            flush_retired();
            return expired;
        }

        bool is_running() const override { return running_; }

        dp::Res<void> send_to(const std::string &identifier, const std::string &text) override {
            auto peer = registry_.find(identifier);
            if (!peer) {
                return dp::result::err(dp::Error::not_found(dp::String("unknown peer: ") + identifier.c_str()));
            }
            return peer->send_chat(text, SERVER_IDENTITY);
        }

        dp::usize broadcast(const std::string &text) override {
            dp::usize delivered = 0;
            for (auto &peer : registry_.snapshot()) {
                if (peer->send_chat(text, SERVER_IDENTITY).is_ok()) {
                    ++delivered;
                }
            }
            return delivered;
        }

        dp::Vector<PeerInfo> peers() const override {
            dp::Vector<PeerInfo> out;
            for (auto &peer : registry_.snapshot()) {
                out.push_back(peer->session().info());
            }
            return out;
        }

        dp::usize peer_count() const override { return registry_.size(); }

        dp::u16 port() const override { return socket_.local_port(); }

        Protocol protocol() const override { return Protocol::Datagram; }

        /// Reliable link of one peer, null when unknown
        std::shared_ptr<DatagramPeer> find_peer(const std::string &identifier) const {
            return registry_.find(identifier);
        }
    };

} // namespace parley
