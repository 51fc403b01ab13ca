#pragma once

#include "relay/ForwardSession.h"
#include "relay/network/Buffer.h"
#include "relay/protocol/HttpContext.h"

#include <memory>

namespace relay {

// Per caller connection, stored in TcpConnection's context. One request is in
// flight at a time; pipelined bytes wait in `inbound`.
struct RelaySessionContext {
    protocol::HttpContext parser;
    network::Buffer inbound;
    ForwardSessionPtr session;
    // Stop parsing: an error response went out or the connection is closing.
    bool closing{false};
    bool readPaused{false};
    // The caller sent FIN; only a fully received request can still be answered.
    bool peerHalfClosed{false};
    int requestsServed{0};
};

using RelaySessionContextPtr = std::shared_ptr<RelaySessionContext>;

} // namespace relay
