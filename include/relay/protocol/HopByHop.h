#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <string>
#include <vector>

namespace relay {
namespace protocol {

// Connection-scoped fields that never cross the relay: the fixed RFC 7230
// set plus every field named by a Connection token.
bool IsHopByHopHeader(const std::string& name);

// Copy of `headers` without hop-by-hop fields, arrival order preserved.
// Content-Length is kept; the serializer decides framing.
HttpHeaders FilterHopByHop(const HttpHeaders& headers);

// Transfer-codings of the message in order, without a final chunked. The
// filter drops Transfer-Encoding, so these must be re-announced by whoever
// frames the relayed body.
std::vector<std::string> OuterTransferCodings(const HttpHeaders& headers);

} // namespace protocol
} // namespace relay
