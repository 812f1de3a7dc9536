// client_configs.hpp
// Pre-configured ClientSession instantiations using policy-based design
//
// Template parameters:
//   - OutboundCapacity: request ByteChannel size (power of 2)
//   - InboundCapacity: response ByteChannel size (power of 2); a response
//     head must fit in it
//   - Parser: http::ResponseParser
//   - ConnectionType: transport::Connection<BSDSocket, OpenSSLPolicy>
//
#pragma once

#include "client_session.hpp"

namespace sockclient {

// ============================================================================
// Configuration 1: Default
// ============================================================================
// Policy composition:
//   - Outbound: ByteChannel<64KB>  (requests are small, bodies stream through)
//   - Inbound:  ByteChannel<256KB> (headroom for large heads and body bursts)
//   - Parser: http::ResponseParser
//   - Connection: BSD socket + OpenSSL
using DefaultClientSession = ClientSession<64 * 1024, 256 * 1024>;

// ============================================================================
// Configuration 2: Compact
// ============================================================================
// Many concurrent sessions with small request/response pairs
using CompactClientSession = ClientSession<16 * 1024, 64 * 1024>;

// ============================================================================
// Configuration 3: Large body
// ============================================================================
// Bulk downloads: a large inbound window keeps the Receiver from stalling
// while the caller processes the body
using LargeBodyClientSession = ClientSession<64 * 1024, 4 * 1024 * 1024>;

} // namespace sockclient
