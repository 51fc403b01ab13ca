#include "relay/Forwarder.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"
#include "relay/protocol/HopByHop.h"

#include <string>
#include <vector>

namespace relay {

using protocol::HttpContext;
using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::HttpResponseContext;

Forwarder::Forwarder(const ForwarderConfig& config)
    : config_(config),
      nextSessionId_(1) {
    if (!config_.resolved) {
        LOG_WARN << "Forwarder created with an unresolved origin " << config_.origin.toString();
    }
}

ForwardSessionPtr Forwarder::Forward(const HttpRequest& request,
                                     HttpContext::BodyFraming framing,
                                     const network::TcpConnectionPtr& clientConn,
                                     const ForwardSession::DoneCallback& done) {
    relay::monitor::Stats::Instance().IncTotalRequests();
    const std::string name = "origin#" + std::to_string(nextSessionId_.fetch_add(1));
    auto session = std::make_shared<ForwardSession>(config_, request, framing, clientConn, name);
    session->SetDoneCallback(done);
    session->Start();
    return session;
}

HttpRequest Forwarder::BuildOutboundRequest(const HttpRequest& inbound,
                                            HttpContext::BodyFraming framing,
                                            const OriginAddress& origin) {
    HttpRequest out;
    out.setMethod(inbound.method());
    out.setTarget(inbound.target());
    out.setVersion(HttpRequest::kHttp11);
    out.headers() = protocol::FilterHopByHop(inbound.headers());

    if (framing == HttpContext::kChunked) {
        // A chunked body has no length up front. The body is re-chunked but
        // its other codings travel unchanged.
        std::vector<std::string> codings = protocol::OuterTransferCodings(inbound.headers());
        codings.push_back("chunked");
        out.headers().Remove("Content-Length");
        out.addHeader("Transfer-Encoding", protocol::HttpHeaders::JoinTokens(codings));
    }
    if (!out.headers().Contains("Host")) {
        out.addHeader("Host", origin.authority());
    }
    out.addHeader("Connection", "close");
    return out;
}

bool Forwarder::RelayableTo(const HttpResponse& originHead,
                            HttpResponseContext::BodyFraming framing,
                            HttpRequest::Version clientVersion) {
    if (clientVersion == HttpRequest::kHttp11) return true;
    if (framing != HttpResponseContext::kChunked && framing != HttpResponseContext::kUntilClose) {
        return true;
    }
    return protocol::OuterTransferCodings(originHead.headers()).empty();
}

HttpResponse Forwarder::BuildRelayedResponse(const HttpResponse& originHead,
                                             HttpResponseContext::BodyFraming framing,
                                             HttpRequest::Version clientVersion,
                                             bool clientWantsKeepAlive,
                                             bool* chunked,
                                             bool* keepAlive) {
    HttpResponse out;
    out.setStatusCode(originHead.statusCode());
    out.setStatusMessage(originHead.statusMessage().empty()
                             ? HttpResponse::DefaultReason(originHead.statusCode())
                             : originHead.statusMessage());
    out.headers() = protocol::FilterHopByHop(originHead.headers());

    bool delimited = true;
    *chunked = false;
    switch (framing) {
    case HttpResponseContext::kNoBody:
    case HttpResponseContext::kContentLength:
        break;
    case HttpResponseContext::kChunked:
    case HttpResponseContext::kUntilClose:
        out.headers().Remove("Content-Length");
        if (clientVersion == HttpRequest::kHttp11) {
            std::vector<std::string> codings = protocol::OuterTransferCodings(originHead.headers());
            codings.push_back("chunked");
            out.addHeader("Transfer-Encoding", protocol::HttpHeaders::JoinTokens(codings));
            *chunked = true;
        } else {
            delimited = false;
        }
        break;
    }

    *keepAlive = clientWantsKeepAlive && delimited;
    if (!*keepAlive) {
        out.addHeader("Connection", "close");
    } else if (clientVersion == HttpRequest::kHttp10) {
        out.addHeader("Connection", "keep-alive");
    }
    return out;
}

} // namespace relay
