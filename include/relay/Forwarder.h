#pragma once

#include "relay/ForwardSession.h"
#include "relay/ForwarderConfig.h"
#include "relay/common/noncopyable.h"
#include "relay/protocol/HttpContext.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponse.h"
#include "relay/protocol/HttpResponseContext.h"

#include <atomic>

namespace relay {

// Translates inbound requests into outbound calls to the one configured
// origin. Holds no per-request state; every Forward() is independent.
class Forwarder : relay::common::noncopyable {
public:
    explicit Forwarder(const ForwarderConfig& config);

    const ForwarderConfig& config() const { return config_; }

    // Starts one session on the caller connection's loop. The session reports
    // through `done` unless it is aborted.
    ForwardSessionPtr Forward(const protocol::HttpRequest& request,
                              protocol::HttpContext::BodyFraming framing,
                              const network::TcpConnectionPtr& clientConn,
                              const ForwardSession::DoneCallback& done);

    // Outbound head: same method and target, HTTP/1.1, filtered headers,
    // Host only if missing, framing for the relayed body, Connection: close.
    static protocol::HttpRequest BuildOutboundRequest(const protocol::HttpRequest& inbound,
                                                      protocol::HttpContext::BodyFraming framing,
                                                      const OriginAddress& origin);

    // False when the body carries a transfer-coding other than chunked and
    // the caller speaks HTTP/1.0, which has no way to be told about it.
    static bool RelayableTo(const protocol::HttpResponse& originHead,
                            protocol::HttpResponseContext::BodyFraming framing,
                            protocol::HttpRequest::Version clientVersion);

    // Head for the caller. *chunked tells whether the body must be chunk
    // encoded towards the caller, *keepAlive whether the caller connection
    // survives the response.
    static protocol::HttpResponse BuildRelayedResponse(const protocol::HttpResponse& originHead,
                                                       protocol::HttpResponseContext::BodyFraming framing,
                                                       protocol::HttpRequest::Version clientVersion,
                                                       bool clientWantsKeepAlive,
                                                       bool* chunked,
                                                       bool* keepAlive);

private:
    const ForwarderConfig config_;
    std::atomic<long> nextSessionId_;
};

} // namespace relay
