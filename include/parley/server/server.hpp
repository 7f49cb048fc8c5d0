#pragma once

#include <parley/server/datagram_server.hpp>
#include <parley/server/stream_server.hpp>

namespace parley {

    /// Server for the configured transport family; not started yet
    inline std::unique_ptr<Server> make_server(const ServerOptions &options, Callbacks callbacks) {
        switch (options.protocol) {
        case Protocol::Stream:
            return std::make_unique<StreamServer>(options, std::move(callbacks));
        case Protocol::Datagram:
            return std::make_unique<DatagramServer>(options, std::move(callbacks));
        }
        return nullptr;
    }

} // namespace parley
