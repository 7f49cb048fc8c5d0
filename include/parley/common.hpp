#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace parley {

    // Raw payload bytes as they travel on a socket
    using Bytes = dp::Vector<dp::u8>;

    using Clock = std::chrono::steady_clock;

    // Largest stream frame body accepted by either side (1 MiB)
    constexpr dp::u32 MAX_FRAME_SIZE = 1024 * 1024;

    // Largest UDP payload over IPv4
    constexpr dp::usize MAX_DATAGRAM_SIZE = 65507;

    // Poll interval for blocking socket reads so loops can observe shutdown
    constexpr dp::u32 POLL_INTERVAL_MS = 200;

    // Reserved sender identity for server-origin messages
    constexpr const char *SERVER_IDENTITY = "server";

    // Big-endian encoding for length-prefix framing
    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        echo::trace("encode_u32_be: value=", value);
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    // Big-endian decoding for length-prefix framing
    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        dp::u32 value = (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
                        (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
        echo::trace("decode_u32_be: value=", value);
        return value;
    }

    // Helper to encode u32 directly into a vector
    inline void append_u32_be(Bytes &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    inline Bytes to_bytes(const std::string &text) { return Bytes(text.begin(), text.end()); }

    inline std::string to_text(const Bytes &bytes) {
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    inline std::string to_std(const dp::String &s) { return std::string(s.c_str(), s.size()); }

    // Map a failed socket call to the error categories used across the library
    // - timeout: EAGAIN/EWOULDBLOCK (expected with SO_RCVTIMEO, recoverable)
    // - not_found: connection gone (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: anything else
    inline dp::Error socket_error(const char *op, dp::i32 err) {
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return dp::Error::timeout(dp::String(op) + " timeout");
        }
        if (err == ECONNRESET) {
            return dp::Error::not_found("connection reset by peer");
        }
        if (err == EPIPE) {
            return dp::Error::not_found("broken pipe");
        }
        if (err == EBADF) {
            return dp::Error::not_found("bad file descriptor");
        }
        if (err == ENOTCONN) {
            return dp::Error::not_found("socket not connected");
        }
        return dp::Error::io_error(dp::String(op) + " error: " + strerror(err));
    }

    // Read whatever is available (at most count bytes) from a socket
    // Returns the number of bytes read; zero means the peer closed the connection
    inline dp::Res<dp::usize> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize count) {
        while (true) {
            dp::isize n = ::recv(fd, buffer, count, 0);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("recv interrupted by signal, retrying");
                    continue;
                }
                dp::i32 err = errno;
                if (err != EAGAIN && err != EWOULDBLOCK) {
                    echo::trace("recv failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                }
                return dp::result::err(socket_error("read", err));
            }
            echo::trace("read ", n, " bytes (fd=", fd, ")");
            return dp::result::ok(static_cast<dp::usize>(n));
        }
    }

    // Helper to write exactly n bytes to a socket
    // MSG_NOSIGNAL keeps a dead peer from raising SIGPIPE
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = ::send(fd, buffer + total_written, count - total_written, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }
                dp::i32 err = errno;
                echo::trace("write failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                if (err == EAGAIN || err == EWOULDBLOCK) {
                    return dp::result::err(dp::Error::io_error("write would block"));
                }
                return dp::result::err(socket_error("write", err));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

    // Apply SO_RCVTIMEO to a socket; 0 means block forever
    inline dp::Res<void> set_socket_timeout(dp::i32 fd, dp::u32 timeout_ms) {
        if (fd < 0) {
            echo::error("set_recv_timeout called but socket not created");
            return dp::result::err(dp::Error::invalid_argument("socket not created"));
        }

        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;

        if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            echo::error("setsockopt SO_RCVTIMEO failed: ", strerror(errno));
            return dp::result::err(dp::Error::io_error("failed to set timeout"));
        }

        echo::trace("set recv timeout to ", timeout_ms, "ms");
        return dp::result::ok();
    }

} // namespace parley
