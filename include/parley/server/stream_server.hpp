#pragma once

#include <parley/server.hpp>
#include <parley/server/registry.hpp>
#include <parley/session/session.hpp>
#include <parley/stream/tcp.hpp>

#include <atomic>
#include <list>
#include <thread>

namespace parley {

    /// One accepted stream with its session and its own receive thread
    class StreamConnection {
      private:
        std::unique_ptr<Stream> stream_;
        std::unique_ptr<Session> session_;
        std::thread thread_;
        std::atomic<bool> finished_;

      public:
        StreamConnection(std::unique_ptr<Stream> stream, const Callbacks &callbacks,
                         std::function<void(StreamConnection *)> on_release)
            : stream_(std::move(stream)), finished_(false) {
            PeerInfo info;
            info.identifier = to_std(stream_->remote_address());
            info.protocol = Protocol::Stream;
            info.connected_at = Clock::now();
            info.last_activity = info.connected_at;

            session_ = std::make_unique<Session>(
                info, callbacks, [this](const Message &msg) { return stream_->send(encode(msg)); },
                [this, on_release]() {
                    on_release(this);
                    stream_->shutdown();
                });
        }

        ~StreamConnection() {
            join();
            stream_->close();
        }

        StreamConnection(const StreamConnection &) = delete;
        StreamConnection &operator=(const StreamConnection &) = delete;

        void start(const std::atomic<bool> &server_running) {
            thread_ = std::thread([this, &server_running]() { run(server_running); });
        }

        /// Receive loop, ends when the session closes or the server stops
        void run(const std::atomic<bool> &server_running) {
            echo::debug("connection thread started for ", session_->identifier().c_str());

            auto timeout_res = stream_->set_recv_timeout(POLL_INTERVAL_MS);
            if (timeout_res.is_err()) {
                echo::warn("could not set receive timeout: ", timeout_res.error().message.c_str());
            }

            while (server_running && !session_->is_closed()) {
                auto recv_res = stream_->recv();
                if (recv_res.is_err()) {
                    if (recv_res.error().code == dp::Error::TIMEOUT) {
                        continue;
                    }
                    if (stream_->peer_closed()) {
                        session_->close(CloseReason::PeerDisconnected);
                    } else {
                        session_->close(CloseReason::ConnectionLost, to_std(recv_res.error().message));
                    }
                    break;
                }

                auto handle_res = session_->handle_payload(recv_res.value());
                if (handle_res.is_err()) {
                    break;
                }
            }

            echo::debug("connection thread finished for ", session_->identifier().c_str());
            finished_ = true;
        }

        void join() {
            if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
                thread_.join();
            }
        }

        Session &session() { return *session_; }

        bool finished() const { return finished_; }

        /// True when called from this connection's receive thread (i.e. from a callback)
        bool on_own_thread() const { return thread_.get_id() == std::this_thread::get_id(); }
    };

    /// Stream (TCP) chat server
    ///
    /// One accept thread plus one thread per connection. The accept thread wakes
    /// every POLL_INTERVAL_MS to observe stop() and to join connections that
    /// have finished.
    class StreamServer : public Server {
      private:
        ServerOptions options_;
        Callbacks callbacks_;
        Callbacks session_callbacks_;

        TcpStream listener_;
        std::thread accept_thread_;
        std::atomic<bool> running_;

        PeerRegistry<StreamConnection> registry_;

        // Every connection whose thread has not been joined yet
        std::list<std::shared_ptr<StreamConnection>> connections_;
        std::mutex connections_mutex_;

        void relay(const std::string &origin, const Message &msg) {
            for (auto &conn : registry_.snapshot()) {
                if (conn->session().identifier() == origin) {
                    continue;
                }
                auto res = conn->session().send(msg);
                if (res.is_err()) {
                    echo::warn("relay to ", conn->session().identifier().c_str(), " failed");
                }
            }
        }

        void reap_finished() {
            dp::Vector<std::shared_ptr<StreamConnection>> done;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                for (auto it = connections_.begin(); it != connections_.end();) {
                    if ((*it)->finished()) {
                        done.push_back(std::move(*it));
                        it = connections_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            for (auto &conn : done) {
                conn->join();
            }
        }

        // Join every tracked connection thread except the caller's own, which
        // stays tracked until the destructor or the next start()
        void join_connections() {
            std::list<std::shared_ptr<StreamConnection>> pending;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                pending.swap(connections_);
            }
            for (auto it = pending.begin(); it != pending.end();) {
                if ((*it)->on_own_thread()) {
                    ++it;
                    continue;
                }
                (*it)->join();
                it = pending.erase(it);
            }
            if (!pending.empty()) {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.splice(connections_.end(), pending);
            }
        }

        void accept_loop() {
            echo::debug("accept thread started");
            while (running_) {
                reap_finished();

                auto accept_res = listener_.accept();
                if (accept_res.is_err()) {
                    if (accept_res.error().code == dp::Error::TIMEOUT) {
                        continue;
                    }
                    if (running_) {
                        echo::error("accept failed: ", accept_res.error().message.c_str());
                        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
                    }
                    continue;
                }

                std::unique_ptr<Stream> stream = std::move(accept_res.value());
                if (options_.decorator) {
                    auto wrapped = options_.decorator(std::move(stream));
                    if (wrapped.is_err()) {
                        echo::warn("stream decorator rejected connection: ", wrapped.error().message.c_str());
                        continue;
                    }
                    stream = std::move(wrapped.value());
                }

                auto conn = std::make_shared<StreamConnection>(
                    std::move(stream), session_callbacks_, [this](StreamConnection *released) {
                        registry_.remove_if_same(released->session().identifier(), released);
                    });

                std::string identifier = conn->session().identifier();
                auto add_res = registry_.add(identifier, conn);
                if (add_res.is_err()) {
                    echo::warn("dropping duplicate connection from ", identifier.c_str());
                    continue;
                }
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    connections_.push_back(conn);
                }
                conn->start(running_);
            }
            echo::debug("accept thread stopped");
        }

      public:
        StreamServer(const ServerOptions &options, Callbacks callbacks)
            : options_(options), callbacks_(std::move(callbacks)), running_(false) {
            session_callbacks_ = callbacks_;
            session_callbacks_.on_message = [this](const PeerInfo &peer, const std::string &text) {
                callbacks_.message(peer, text);
                if (options_.relay_chat) {
                    relay(peer.identifier, make_chat(text, peer.display_name));
                }
            };
        }

        ~StreamServer() override {
            stop();
            join_connections();
        }

        StreamServer(const StreamServer &) = delete;
        StreamServer &operator=(const StreamServer &) = delete;

        dp::Res<void> start() override {
            if (running_) {
                return dp::result::err(dp::Error::invalid_argument("server already running"));
            }
            if (accept_thread_.joinable()) {
                accept_thread_.join();
            }
            join_connections();

            TcpEndpoint endpoint{options_.host, options_.port};
            auto listen_res = listener_.listen(endpoint);
            if (listen_res.is_err()) {
                return listen_res;
            }
            auto timeout_res = listener_.set_recv_timeout(POLL_INTERVAL_MS);
            if (timeout_res.is_err()) {
                listener_.close();
                return timeout_res;
            }

            running_ = true;
            accept_thread_ = std::thread(&StreamServer::accept_loop, this);
            echo::info("stream server running on port ", listener_.local_port());
            return dp::result::ok();
        }

        void stop() override {
            if (!running_.exchange(false)) {
                return;
            }
            echo::info("stopping stream server");

            listener_.shutdown();
            if (accept_thread_.joinable() && accept_thread_.get_id() != std::this_thread::get_id()) {
                accept_thread_.join();
            }
            listener_.close();

            dp::Vector<std::shared_ptr<StreamConnection>> live;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                for (auto &conn : connections_) {
                    live.push_back(conn);
                }
            }
            for (auto &conn : live) {
                conn->session().close(CloseReason::ServerStopping);
            }
            live.clear();
            join_connections();
            registry_.drain();
            echo::info("stream server stopped");
        }

        bool is_running() const override { return running_; }

        dp::Res<void> send_to(const std::string &identifier, const std::string &text) override {
            auto conn = registry_.find(identifier);
            if (!conn) {
                return dp::result::err(dp::Error::not_found(dp::String("unknown peer: ") + identifier.c_str()));
            }
            return conn->session().send(make_chat(text, SERVER_IDENTITY));
        }

        dp::usize broadcast(const std::string &text) override {
            Message msg = make_chat(text, SERVER_IDENTITY);
            dp::usize delivered = 0;
            for (auto &conn : registry_.snapshot()) {
                if (conn->session().send(msg).is_ok()) {
                    ++delivered;
                }
            }
            return delivered;
        }

        dp::Vector<PeerInfo> peers() const override {
            dp::Vector<PeerInfo> out;
            for (auto &conn : registry_.snapshot()) {
                out.push_back(conn->session().info());
            }
            return out;
        }

        dp::usize peer_count() const override { return registry_.size(); }

        dp::u16 port() const override { return listener_.local_port(); }

        Protocol protocol() const override { return Protocol::Stream; }
    };

} // namespace parley
