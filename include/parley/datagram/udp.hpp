#pragma once

#include <parley/datagram.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace parley {

    // UDP datagram implementation using BSD sockets
    // Unreliable, unordered, connectionless transport
    // Message boundaries preserved - no framing needed
    class UdpDatagram : public Datagram {
      private:
        dp::i32 fd_;
        bool bound_;
        dp::u16 local_port_;
        UdpEndpoint local_endpoint_;

      public:
        UdpDatagram() : fd_(-1), bound_(false), local_port_(0) { echo::trace("UdpDatagram constructed"); }

        ~UdpDatagram() override {
            if (fd_ >= 0) {
                close();
            }
        }

        // Bind to local address for receiving
        dp::Res<void> bind(const UdpEndpoint &endpoint) override {
            echo::trace("binding to ", endpoint.to_string());

            // Rebinding replaces the previous socket
            if (fd_ >= 0) {
                close();
            }

            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("udp socket created fd=", fd_);

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

            // Learn the ephemeral port when bound to 0
            struct sockaddr_in bound_addr = {};
            socklen_t bound_len = sizeof(bound_addr);
            if (::getsockname(fd_, (struct sockaddr *)&bound_addr, &bound_len) == 0) {
                local_port_ = ntohs(bound_addr.sin_port);
            } else {
                echo::warn("getsockname failed: ", strerror(errno));
                local_port_ = endpoint.port;
            }

            bound_ = true;
            local_endpoint_ = UdpEndpoint{endpoint.host, local_port_};
            echo::info("UdpDatagram listening on ", local_endpoint_.to_string());

            return dp::result::ok();
        }

        // Send one datagram
        dp::Res<void> send_to(const Bytes &payload, const UdpEndpoint &dest) override {
            if (fd_ < 0) {
                echo::error("send_to called but socket not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            if (payload.size() > MAX_DATAGRAM_SIZE) {
                echo::warn("datagram too large: ", payload.size(), " > ", MAX_DATAGRAM_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("datagram too large: ") +
                                                                   std::to_string(payload.size()).c_str()));
            }

            echo::trace("sendto ", dest.to_string(), " len=", payload.size());

            struct addrinfo hints = {};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_DGRAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(dest.port).c_str());
            dp::i32 ret = ::getaddrinfo(dest.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0 || result == nullptr) {
                echo::error("getaddrinfo failed: ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("peer unreachable: cannot resolve ") + dest.host));
            }

            dp::isize n = ::sendto(fd_, payload.data(), payload.size(), MSG_NOSIGNAL, result->ai_addr,
                                   result->ai_addrlen);
            ::freeaddrinfo(result);

            if (n < 0) {
                dp::i32 err = errno;
                echo::error("sendto failed: ", strerror(err));
                return dp::result::err(socket_error("sendto", err));
            }

            echo::debug("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok();
        }

        // Receive one datagram
        // A receive timeout surfaces as dp::Error::TIMEOUT and is not logged
        dp::Res<dp::Pair<Bytes, UdpEndpoint>> recv_from() override {
            if (!bound_) {
                echo::error("recv_from called but not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            Bytes payload(MAX_DATAGRAM_SIZE);
            struct sockaddr_in src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::isize n = -1;
            while (true) {
                n = ::recvfrom(fd_, payload.data(), payload.size(), 0, (struct sockaddr *)&src_addr, &src_len);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                break;
            }
            if (n < 0) {
                dp::i32 err = errno;
                if (err != EAGAIN && err != EWOULDBLOCK) {
                    echo::error("recvfrom failed: ", strerror(err));
                }
                return dp::result::err(socket_error("recvfrom", err));
            }

            payload.resize(static_cast<dp::usize>(n));

            char src_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &src_addr.sin_addr, src_ip, sizeof(src_ip));
            dp::u16 src_port = ntohs(src_addr.sin_port);

            UdpEndpoint src_endpoint{dp::String(src_ip), src_port};
            echo::debug("received ", n, " bytes from ", src_endpoint.to_string());

            return dp::result::ok(dp::Pair<Bytes, UdpEndpoint>(std::move(payload), src_endpoint));
        }

        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) override { return set_socket_timeout(fd_, timeout_ms); }

        dp::u16 local_port() const override { return bound_ ? local_port_ : 0; }

        // Close the socket
        void close() override {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                bound_ = false;
                echo::debug("UdpDatagram closed");
            }
        }
    };

} // namespace parley
