#pragma once

#include <parley/client.hpp>
#include <parley/datagram/udp.hpp>
#include <parley/reliable/link.hpp>

#include <thread>

namespace parley {

    /// Datagram (UDP) chat client
    ///
    /// Chats travel through a reliable link (sequence numbers, acks, retries);
    /// status, test and lifecycle messages are sent once.
    class DatagramClient : public Client {
      private:
        UdpDatagram socket_;
        UdpEndpoint server_;
        UdpEndpoint server_source_; // numeric address the server answered from
        std::unique_ptr<ReliableLink> link_;
        std::thread receive_thread_;
        std::atomic<bool> running_;

        void process(const Bytes &payload) {
            auto decode_res = decode(payload);
            if (decode_res.is_err()) {
                echo::warn("dropping undecodable datagram: ", decode_res.error().message.c_str());
                return;
            }
            Message delivered;
            if (link_->receive(decode_res.value(), delivered) == Inbound::Deliver) {
                dispatch(delivered);
            }
        }

        void receive_loop() {
            echo::debug("client receive thread started");
            while (running_) {
                auto recv_res = socket_.recv_from();
                if (recv_res.is_err()) {
                    if (recv_res.error().code != dp::Error::TIMEOUT && running_) {
                        echo::error("recv_from failed: ", recv_res.error().message.c_str());
                    }
                    continue;
                }
                auto [payload, src] = std::move(recv_res.value());
                if (!(src == server_source_)) {
                    echo::warn("dropping datagram from unknown source ", src.to_string());
                    continue;
                }
                echo::trace("datagram from ", src.to_string());
                process(payload);
            }
            echo::debug("client receive thread stopped");
        }

        // Wait for the first reply from the server, proof that it is there
        // The reply's source becomes the only address later datagrams are accepted from
        bool await_reply(dp::u32 timeout_ms) {
            auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
            while (Clock::now() < deadline) {
                auto recv_res = socket_.recv_from();
                if (recv_res.is_err()) {
                    if (recv_res.error().code != dp::Error::TIMEOUT) {
                        // ICMP port unreachable surfaces here on Linux
                        echo::debug("probe failed: ", recv_res.error().message.c_str());
                        return false;
                    }
                    continue;
                }
                auto [payload, src] = std::move(recv_res.value());
                if (src.port != server_.port) {
                    echo::warn("ignoring datagram from ", src.to_string(), " while waiting for the server");
                    continue;
                }
                server_source_ = src;
                process(payload);
                return true;
            }
            return false;
        }

        dp::Res<void> send_plain(const Message &msg) {
            if (!connected_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            auto res = link_->send_plain(msg);
            if (res.is_err()) {
                callbacks_.status("send failed: " + to_std(res.error().message), true);
            }
            return res;
        }

      public:
        DatagramClient(const ClientOptions &options, Callbacks callbacks)
            : Client(options, std::move(callbacks)), server_{options.host, options.port},
              server_source_{options.host, options.port}, running_(false) {}

        ~DatagramClient() override {
            disconnect();
            if (receive_thread_.joinable()) {
                receive_thread_.join();
            }
        }

        DatagramClient(const DatagramClient &) = delete;
        DatagramClient &operator=(const DatagramClient &) = delete;

        dp::Res<void> connect() override {
            if (running_ && connected_) {
                return dp::result::err(dp::Error::invalid_argument("already connected"));
            }
            if (receive_thread_.joinable() && receive_thread_.get_id() == std::this_thread::get_id()) {
                return dp::result::err(dp::Error::invalid_argument("cannot reconnect from the receive thread"));
            }
            // Finish tearing down a link that gave up, or a disconnect() made from a callback
            disconnect();
            if (receive_thread_.joinable()) {
                receive_thread_.join();
            }
            socket_.close();

            auto bind_res = socket_.bind(UdpEndpoint{"0.0.0.0", 0});
            if (bind_res.is_err()) {
                return bind_res;
            }

            link_ = std::make_unique<ReliableLink>(
                [this](const Bytes &payload) { return socket_.send_to(payload, server_); }, options_.username,
                options_.reliability);
            link_->set_on_exhausted([this](dp::u64 sequence) {
                connected_ = false;
                callbacks_.status("send failed: no acknowledgement for message #" + std::to_string(sequence), true);
            });

            auto timeout_res = socket_.set_recv_timeout(POLL_INTERVAL_MS);
            if (timeout_res.is_err()) {
                socket_.close();
                return timeout_res;
            }

            auto hello_res = link_->send_plain(make_connect(options_.username));
            if (hello_res.is_err() || !await_reply(options_.probe_timeout_ms)) {
                echo::error("no answer from ", server_.to_string());
                link_->stop();
                socket_.close();
                return dp::result::err(dp::Error::io_error(dp::String("peer unreachable: ") + server_.to_string()));
            }

            connected_ = true;
            running_ = true;
            receive_thread_ = std::thread(&DatagramClient::receive_loop, this);
            echo::info("connected to ", server_.to_string(), " as '", options_.username.c_str(), "'");
            return dp::result::ok();
        }

        dp::Res<void> send_chat(const std::string &text) override {
            if (!connected_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            auto res = link_->send_chat(text, options_.username);
            if (res.is_err()) {
                callbacks_.status("send failed: " + to_std(res.error().message), true);
                return dp::result::err(res.error());
            }
            return dp::result::ok();
        }

        dp::Res<void> send_status(const std::string &text) override {
            return send_plain(make_status(text, options_.username));
        }

        dp::Res<void> send_test() override { return send_plain(make_test(options_.username)); }

        void disconnect() override {
            if (!running_.exchange(false)) {
                return;
            }

            if (connected_) {
                auto res = link_->send_plain(make_disconnect(options_.username));
                if (res.is_err()) {
                    echo::debug("disconnect notice not sent: ", res.error().message.c_str());
                }
            }
            connected_ = false;

            link_->stop();
            if (receive_thread_.joinable() && receive_thread_.get_id() != std::this_thread::get_id()) {
                receive_thread_.join();
                socket_.close();
            }
            echo::info("disconnected");
        }

        /// Chats still waiting for an acknowledgement
        dp::usize pending_count() const { return link_ ? link_->pending_count() : 0; }

        bool in_recovery() const { return link_ && link_->in_recovery(); }

        dp::u16 local_port() const { return socket_.local_port(); }
    };

} // namespace parley
