#pragma once

#include <parley/client.hpp>
#include <parley/stream/tcp.hpp>

#include <thread>

namespace parley {

    /// Stream (TCP) chat client
    class StreamClient : public Client {
      private:
        std::unique_ptr<Stream> stream_;
        std::thread receive_thread_;
        std::atomic<bool> running_;

        void receive_loop() {
            echo::debug("client receive thread started");
            dp::u32 decode_failures = 0;
            while (running_) {
                auto recv_res = stream_->recv();
                if (recv_res.is_err()) {
                    if (recv_res.error().code == dp::Error::TIMEOUT) {
                        continue;
                    }
                    if (running_) {
                        if (stream_->peer_closed()) {
                            callbacks_.status("server closed the connection", false);
                        } else {
                            callbacks_.status("connection lost: " + to_std(recv_res.error().message), true);
                        }
                    }
                    connected_ = false;
                    break;
                }

                auto decode_res = decode(recv_res.value());
                if (decode_res.is_err()) {
                    echo::warn("dropping undecodable frame: ", decode_res.error().message.c_str());
                    if (++decode_failures >= 3) {
                        callbacks_.status("connection lost: too many malformed messages", true);
                        connected_ = false;
                        break;
                    }
                    continue;
                }
                decode_failures = 0;
                dispatch(decode_res.value());
            }
            echo::debug("client receive thread stopped");
        }

        dp::Res<void> send_message(const Message &msg) {
            if (!connected_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            auto res = stream_->send(encode(msg));
            if (res.is_err()) {
                callbacks_.status("send failed: " + to_std(res.error().message), true);
                connected_ = false;
            }
            return res;
        }

      public:
        StreamClient(const ClientOptions &options, Callbacks callbacks)
            : Client(options, std::move(callbacks)), running_(false) {}

        ~StreamClient() override {
            disconnect();
            if (receive_thread_.joinable()) {
                receive_thread_.join();
            }
        }

        StreamClient(const StreamClient &) = delete;
        StreamClient &operator=(const StreamClient &) = delete;

        dp::Res<void> connect() override {
            if (running_ && connected_) {
                return dp::result::err(dp::Error::invalid_argument("already connected"));
            }
            if (receive_thread_.joinable() && receive_thread_.get_id() == std::this_thread::get_id()) {
                return dp::result::err(dp::Error::invalid_argument("cannot reconnect from the receive thread"));
            }
            // Finish tearing down a connection the server dropped
            disconnect();
            if (receive_thread_.joinable()) {
                receive_thread_.join();
            }
            if (stream_) {
                stream_->close();
            }

            TcpEndpoint endpoint{options_.host, options_.port};
            std::unique_ptr<Stream> stream(new TcpStream());
            auto connect_res = stream->connect(endpoint, options_.connect_timeout_ms);
            if (connect_res.is_err()) {
                return connect_res;
            }

            if (options_.decorator) {
                auto wrapped = options_.decorator(std::move(stream));
                if (wrapped.is_err()) {
                    echo::error("stream decorator failed: ", wrapped.error().message.c_str());
                    return dp::result::err(wrapped.error());
                }
                stream = std::move(wrapped.value());
            }

            auto timeout_res = stream->set_recv_timeout(POLL_INTERVAL_MS);
            if (timeout_res.is_err()) {
                return timeout_res;
            }

            stream_ = std::move(stream);
            connected_ = true;
            auto hello_res = send_message(make_connect(options_.username));
            if (hello_res.is_err()) {
                stream_->close();
                return hello_res;
            }

            running_ = true;
            receive_thread_ = std::thread(&StreamClient::receive_loop, this);
            echo::info("connected to ", endpoint.to_string(), " as '", options_.username.c_str(), "'");
            return dp::result::ok();
        }

        dp::Res<void> send_chat(const std::string &text) override {
            return send_message(make_chat(text, options_.username));
        }

        dp::Res<void> send_status(const std::string &text) override {
            return send_message(make_status(text, options_.username));
        }

        dp::Res<void> send_test() override { return send_message(make_test(options_.username)); }

        void disconnect() override {
            if (!running_.exchange(false)) {
                return;
            }

            if (connected_) {
                auto res = stream_->send(encode(make_disconnect(options_.username)));
                if (res.is_err()) {
                    echo::debug("disconnect notice not sent: ", res.error().message.c_str());
                }
            }
            connected_ = false;

            stream_->shutdown();
            if (receive_thread_.joinable() && receive_thread_.get_id() != std::this_thread::get_id()) {
                receive_thread_.join();
                stream_->close();
            }
            echo::info("disconnected");
        }
    };

} // namespace parley
