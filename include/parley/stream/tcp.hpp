#pragma once

#include <parley/stream.hpp>
#include <parley/stream/framer.hpp>

#include <arpa/inet.h>
#include <atomic>
#include <fcntl.h>
#include <mutex>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace parley {

    // TCP stream implementation using BSD sockets
    // Reliable, ordered, connection-oriented transport with 4-byte length framing
    class TcpStream : public Stream {
      private:
        dp::i32 fd_;
        std::atomic<bool> connected_;
        std::atomic<bool> peer_closed_;
        bool listening_;
        TcpEndpoint local_endpoint_;
        TcpEndpoint remote_endpoint_;
        FrameAssembler assembler_;
        std::mutex send_mutex_;

        static constexpr dp::usize READ_CHUNK = 4096;

        // Private constructor for accepted connections
        TcpStream(dp::i32 fd, const TcpEndpoint &local, const TcpEndpoint &remote)
            : fd_(fd), connected_(true), peer_closed_(false), listening_(false), local_endpoint_(local),
              remote_endpoint_(remote) {
            echo::debug("TcpStream created from accepted connection fd=", fd);
        }

        // Resolve host:port to an IPv4 socket address
        static dp::Res<sockaddr_in> resolve(const TcpEndpoint &endpoint) {
            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(endpoint.port).c_str());
            dp::i32 ret = ::getaddrinfo(endpoint.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0 || result == nullptr) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("peer unreachable: cannot resolve ") +
                                                           endpoint.host));
            }
            sockaddr_in addr = *reinterpret_cast<sockaddr_in *>(result->ai_addr);
            ::freeaddrinfo(result);
            return dp::result::ok(addr);
        }

        void fail_connect() {
            ::close(fd_);
            fd_ = -1;
        }

      public:
        TcpStream() : fd_(-1), connected_(false), peer_closed_(false), listening_(false) {
            echo::trace("TcpStream constructed");
        }

        ~TcpStream() override {
            if (fd_ >= 0) {
                close();
            }
        }

        // Client side: connect to remote endpoint, bounded by timeout_ms
        dp::Res<void> connect(const TcpEndpoint &endpoint, dp::u32 timeout_ms) override {
            echo::trace("connecting to ", endpoint.to_string());

            auto addr_res = resolve(endpoint);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }
            sockaddr_in addr = addr_res.value();

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("socket created fd=", fd_);

            // Non-blocking connect so an unreachable peer fails fast
            dp::i32 flags = ::fcntl(fd_, F_GETFL, 0);
            ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

            dp::i32 ret = ::connect(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            if (ret < 0 && errno != EINPROGRESS) {
                echo::error("connect failed: ", strerror(errno));
                fail_connect();
                return dp::result::err(dp::Error::io_error(dp::String("peer unreachable: ") + endpoint.to_string()));
            }

            if (ret < 0) {
                struct pollfd pfd = {};
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                dp::i32 wait_ms = timeout_ms == 0 ? -1 : static_cast<dp::i32>(timeout_ms);
                dp::i32 ready = ::poll(&pfd, 1, wait_ms);
                if (ready == 0) {
                    echo::error("connect to ", endpoint.to_string(), " timed out after ", timeout_ms, "ms");
                    fail_connect();
                    return dp::result::err(dp::Error::timeout(dp::String("peer unreachable: ") + endpoint.to_string()));
                }
                if (ready < 0) {
                    echo::error("poll failed: ", strerror(errno));
                    fail_connect();
                    return dp::result::err(dp::Error::io_error("poll failed"));
                }

                dp::i32 so_error = 0;
                socklen_t len = sizeof(so_error);
                ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error != 0) {
                    echo::error("connect failed: ", strerror(so_error));
                    fail_connect();
                    return dp::result::err(
                        dp::Error::io_error(dp::String("peer unreachable: ") + endpoint.to_string()));
                }
            }

            ::fcntl(fd_, F_SETFL, flags);

            connected_ = true;
            peer_closed_ = false;
            remote_endpoint_ = endpoint;
            assembler_.reset();
            echo::info("TcpStream connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen
        dp::Res<void> listen(const TcpEndpoint &endpoint) override {
            echo::trace("listening on ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("socket created fd=", fd_);

            // Set SO_REUSEADDR to avoid "address already in use" errors
            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);

            if (endpoint.host == "0.0.0.0" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else {
                if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                    ::close(fd_);
                    fd_ = -1;
                    echo::error("invalid address: ", endpoint.host.c_str());
                    return dp::result::err(dp::Error::invalid_argument("invalid argument"));
                }
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("bind failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("bind failed"));
            }

            if (::listen(fd_, SOMAXCONN) < 0) {
                ::close(fd_);
                fd_ = -1;
                echo::error("listen failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("listen failed"));
            }

            listening_ = true;
            local_endpoint_ = endpoint;

            // Learn the ephemeral port when bound to 0
            struct sockaddr_in bound_addr = {};
            socklen_t bound_len = sizeof(bound_addr);
            if (::getsockname(fd_, (struct sockaddr *)&bound_addr, &bound_len) == 0) {
                local_endpoint_.port = ntohs(bound_addr.sin_port);
            }
            echo::info("TcpStream listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: accept incoming connection
        // With a receive timeout set, returns a timeout error when nobody connects in time
        dp::Res<std::unique_ptr<Stream>> accept() override {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            struct sockaddr_in client_addr = {};
            socklen_t client_len = sizeof(client_addr);

            dp::i32 client_fd = ::accept(fd_, (struct sockaddr *)&client_addr, &client_len);
            if (client_fd < 0) {
                dp::i32 err = errno;
                if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
                    echo::debug("accept failed: ", strerror(err));
                }
                if (err == EINTR) {
                    return dp::result::err(dp::Error::timeout("accept interrupted"));
                }
                return dp::result::err(socket_error("accept", err));
            }

            char client_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
            dp::u16 client_port = ntohs(client_addr.sin_port);

            TcpEndpoint client_endpoint{dp::String(client_ip), client_port};
            echo::info("TcpStream accepted connection from ", client_endpoint.to_string());

            auto client_stream = std::unique_ptr<Stream>(new TcpStream(client_fd, local_endpoint_, client_endpoint));
            return dp::result::ok(std::move(client_stream));
        }

        // Send one length-prefixed frame
        dp::Res<void> send(const Bytes &payload) override {
            if (!connected_) {
                echo::error("send called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            if (payload.size() > MAX_FRAME_SIZE) {
                echo::error("refusing to send frame of ", payload.size(), " bytes");
                return dp::result::err(dp::Error::invalid_argument("frame too large"));
            }

            Bytes wire = frame(payload);

            std::lock_guard<std::mutex> lock(send_mutex_);
            auto res = write_exact(fd_, wire.data(), wire.size());
            if (res.is_err()) {
                connected_ = false;
                echo::error("send failed: ", res.error().message.c_str());
                return res;
            }

            echo::debug("sent ", payload.size(), " bytes");
            return dp::result::ok();
        }

        // Receive one frame
        // TIMEOUT HANDLING:
        // - Timeouts are expected behavior when using set_recv_timeout()
        // - Partially received frames are kept across timeouts
        // - An orderly close by the peer sets peer_closed() and returns not_found
        // - An oversized length header is fatal: the stream is marked disconnected
        dp::Res<Bytes> recv() override {
            if (assembler_.has_frame()) {
                return dp::result::ok(assembler_.pop_frame());
            }
            if (!connected_) {
                echo::trace("recv called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            dp::Array<dp::u8, READ_CHUNK> chunk;
            while (!assembler_.has_frame()) {
                auto read_res = read_some(fd_, chunk.data(), chunk.size());
                if (read_res.is_err()) {
                    if (read_res.error().code != dp::Error::TIMEOUT) {
                        connected_ = false;
                        echo::debug("recv failed: ", read_res.error().message.c_str());
                    }
                    return dp::result::err(read_res.error());
                }

                dp::usize n = read_res.value();
                if (n == 0) {
                    connected_ = false;
                    peer_closed_ = true;
                    echo::debug("connection closed by peer ", remote_endpoint_.to_string());
                    return dp::result::err(dp::Error::not_found("connection closed by peer"));
                }

                auto feed_res = assembler_.feed(chunk.data(), n);
                if (feed_res.is_err()) {
                    connected_ = false;
                    return dp::result::err(feed_res.error());
                }
            }

            Bytes payload = assembler_.pop_frame();
            echo::debug("received ", payload.size(), " bytes");
            return dp::result::ok(std::move(payload));
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override { return set_socket_timeout(fd_, timeout_ms); }

        void shutdown() override {
            if (fd_ >= 0) {
                echo::trace("shutting down fd=", fd_);
                ::shutdown(fd_, SHUT_RDWR);
            }
        }

        // Close the connection
        void close() override {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                connected_ = false;
                listening_ = false;
                echo::debug("TcpStream closed");
            }
        }

        bool is_connected() const override { return connected_; }

        bool peer_closed() const override { return peer_closed_; }

        dp::String remote_address() const override { return remote_endpoint_.to_string(); }

        // Port the listener is bound to, 0 when not listening
        dp::u16 local_port() const { return listening_ ? local_endpoint_.port : 0; }
    };

} // namespace parley
