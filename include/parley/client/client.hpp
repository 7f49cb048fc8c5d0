#pragma once

#include <parley/client/datagram_client.hpp>
#include <parley/client/stream_client.hpp>

namespace parley {

    /// Client for the configured transport family; call connect() next
    inline std::unique_ptr<Client> make_client(const ClientOptions &options, Callbacks callbacks) {
        switch (options.protocol) {
        case Protocol::Stream:
            return std::make_unique<StreamClient>(options, std::move(callbacks));
        case Protocol::Datagram:
            return std::make_unique<DatagramClient>(options, std::move(callbacks));
        }
        return nullptr;
    }

} // namespace parley
