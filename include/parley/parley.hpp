#pragma once

// Parley - chat transport over TCP and UDP
// Stream family: length-prefixed frames over TCP, one thread per connection
// Datagram family: one message per UDP datagram, chats sent reliably
//                  (sequence numbers, acknowledgements, retransmission)

// Core types and utilities
#include <parley/common.hpp>
#include <parley/config.hpp>
#include <parley/endpoint.hpp>

// Wire format
#include <parley/protocol/codec.hpp>
#include <parley/protocol/envelope.hpp>
#include <parley/protocol/message.hpp>

// Transports
#include <parley/datagram.hpp>
#include <parley/datagram/udp.hpp>
#include <parley/stream.hpp>
#include <parley/stream/framer.hpp>
#include <parley/stream/tcp.hpp>

// Reliable datagram layer
#include <parley/reliable/link.hpp>
#include <parley/reliable/receiver.hpp>
#include <parley/reliable/sender.hpp>
#include <parley/reliable/stats.hpp>

// Sessions, servers and clients
#include <parley/client/client.hpp>
#include <parley/server/server.hpp>
#include <parley/session/peer.hpp>
#include <parley/session/session.hpp>

// All types are in the parley:: namespace
// Entry points:
//   - parley::make_server(ServerOptions, Callbacks) -> StreamServer | DatagramServer
//   - parley::make_client(ClientOptions, Callbacks) -> StreamClient | DatagramClient
//   - parley::encode / parley::decode for the JSON wire format
