#include "relay/ForwardSession.h"
#include "relay/Forwarder.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"
#include "relay/network/EventLoop.h"
#include "relay/protocol/HopByHop.h"

#include <cstdio>
#include <cstring>

namespace relay {

namespace {

void AppendChunkHeader(network::Buffer* out, size_t len) {
    char hex[32];
    std::snprintf(hex, sizeof hex, "%zx\r\n", len);
    out->Append(hex, std::strlen(hex));
}

const char kLastChunk[] = "0\r\n\r\n";

} // namespace

const char* ForwardSession::OutcomeName(Outcome o) {
    switch (o) {
    case kCompleted: return "completed";
    case kConnectFailed: return "connect-failed";
    case kTimedOut: return "timed-out";
    case kOriginError: return "origin-error";
    }
    return "unknown";
}

ForwardSession::ForwardSession(const ForwarderConfig& config,
                               const protocol::HttpRequest& request,
                               protocol::HttpContext::BodyFraming requestFraming,
                               const network::TcpConnectionPtr& clientConn,
                               const std::string& name)
    : config_(config),
      name_(name),
      loop_(clientConn->getLoop()),
      clientConn_(clientConn),
      clientVersion_(request.getVersion()),
      clientWantsKeepAlive_(request.keepAlive()),
      requestChunked_(requestFraming == protocol::HttpContext::kChunked),
      originClient_(clientConn->getLoop(), config.originAddr, name),
      connectTimer_(clientConn->getLoop(), [this]() { OnConnectTimeout(); }),
      requestTimer_(clientConn->getLoop(), [this]() { OnRequestTimeout(); }),
      clientReadPaused_(false),
      requestBodyDone_(requestFraming == protocol::HttpContext::kNoBody),
      chunkToClient_(false),
      responseStarted_(false),
      keepAlive_(false),
      status_(0),
      responseBodyBytes_(0),
      finished_(false),
      startTime_(std::chrono::steady_clock::now()) {
    const protocol::HttpRequest outbound =
        Forwarder::BuildOutboundRequest(request, requestFraming, config_.origin);
    outbound.appendHeadToBuffer(&pending_);
    response_.setRequestWasHead(request.isHead());
}

ForwardSession::~ForwardSession() {
    LOG_DEBUG << "ForwardSession::dtor[" << name_ << "]";
}

void ForwardSession::Start() {
    std::weak_ptr<ForwardSession> weakSelf(shared_from_this());

    originClient_.SetConnectionCallback([weakSelf](const network::TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->OnOriginConnection(conn);
    });
    originClient_.SetMessageCallback([weakSelf](const network::TcpConnectionPtr& conn,
                                                network::Buffer* buf,
                                                std::chrono::system_clock::time_point t) {
        if (auto self = weakSelf.lock()) {
            self->OnOriginMessage(conn, buf, t);
        } else {
            buf->RetrieveAll();
        }
    });
    originClient_.SetConnectFailedCallback([weakSelf](int err) {
        if (auto self = weakSelf.lock()) self->OnConnectFailed(err);
    });

    response_.setInterimCallback([this](const protocol::HttpResponse& r) { OnInterimHead(r); });
    response_.setHeadCallback([this](const protocol::HttpResponse& r) { OnResponseHead(r); });
    response_.setBodyCallback([this](const char* data, size_t len) { OnResponseBody(data, len); });

    if (config_.connectTimeoutMs > 0) {
        connectTimer_.Start(std::chrono::milliseconds(config_.connectTimeoutMs));
    }
    if (config_.requestTimeoutMs > 0) {
        requestTimer_.Start(std::chrono::milliseconds(config_.requestTimeoutMs));
    }

    LOG_DEBUG << "ForwardSession[" << name_ << "] connecting to " << config_.originAddr.toIpPort();
    originClient_.Connect();
}

void ForwardSession::SendToOrigin(const char* data, size_t len) {
    if (originConn_) {
        originConn_->Send(data, len);
        return;
    }
    pending_.Append(data, len);
    if (!clientReadPaused_ && pending_.ReadableBytes() >= config_.highWaterMark) {
        if (auto client = clientConn_.lock()) {
            clientReadPaused_ = true;
            client->StopRead();
        }
    }
}

void ForwardSession::SendRequestBody(const char* data, size_t len) {
    if (finished_ || requestBodyDone_ || len == 0) return;
    if (requestChunked_) {
        network::Buffer chunk;
        AppendChunkHeader(&chunk, len);
        chunk.Append(data, len);
        chunk.Append("\r\n", 2);
        SendToOrigin(chunk.Peek(), chunk.ReadableBytes());
    } else {
        SendToOrigin(data, len);
    }
}

void ForwardSession::FinishRequestBody() {
    if (finished_ || requestBodyDone_) return;
    requestBodyDone_ = true;
    if (requestChunked_) {
        SendToOrigin(kLastChunk, sizeof kLastChunk - 1);
    }
}

void ForwardSession::OnOriginConnection(const network::TcpConnectionPtr& conn) {
    if (finished_) return;

    if (conn->connected()) {
        connectTimer_.Cancel();
        originConn_ = conn;
        LOG_DEBUG << "ForwardSession[" << name_ << "] connected to " << conn->peerAddress().toIpPort();

        auto client = clientConn_.lock();
        if (client) {
            std::weak_ptr<network::TcpConnection> wClient = client;
            std::weak_ptr<network::TcpConnection> wOrigin = conn;
            const size_t hwm = config_.highWaterMark;

            // Caller -> origin: stop reading the caller while the origin lags.
            conn->SetHighWaterMarkCallback(
                [wClient](const network::TcpConnectionPtr&, size_t) {
                    if (auto c = wClient.lock()) c->StopRead();
                },
                hwm);
            conn->SetWriteCompleteCallback(
                [wClient](const network::TcpConnectionPtr&) {
                    if (auto c = wClient.lock()) c->StartRead();
                });

            // Origin -> caller: stop reading the origin while the caller lags.
            client->SetHighWaterMarkCallback(
                [wOrigin](const network::TcpConnectionPtr&, size_t) {
                    if (auto o = wOrigin.lock()) o->StopRead();
                },
                hwm);
            client->SetWriteCompleteCallback(
                [wOrigin](const network::TcpConnectionPtr&) {
                    if (auto o = wOrigin.lock()) o->StartRead();
                });
        }

        if (pending_.ReadableBytes() > 0) {
            conn->Send(pending_.Peek(), pending_.ReadableBytes());
            pending_.RetrieveAll();
        }
        if (clientReadPaused_ && client) {
            clientReadPaused_ = false;
            client->StartRead();
        }
        return;
    }

    // Origin closed its side.
    originConn_.reset();
    if (!response_.headReceived()) {
        Fail(kOriginError, "origin closed before a response");
    } else if (response_.finishOnClose()) {
        Complete();
    } else {
        Fail(kOriginError, "origin closed mid-response");
    }
}

void ForwardSession::OnOriginMessage(const network::TcpConnectionPtr& conn,
                                     network::Buffer* buf,
                                     std::chrono::system_clock::time_point) {
    (void)conn;
    if (finished_) {
        buf->RetrieveAll();
        return;
    }
    if (!response_.feed(buf)) {
        buf->RetrieveAll();
        Fail(kOriginError, "malformed origin response");
        return;
    }
    if (finished_) return;
    if (response_.gotAll()) {
        // Anything past the response is not ours to relay.
        buf->RetrieveAll();
        Complete();
    }
}

void ForwardSession::OnConnectFailed(int err) {
    if (finished_) return;
    Fail(kConnectFailed, std::string("connect: ") + std::strerror(err));
}

void ForwardSession::OnConnectTimeout() {
    if (finished_ || originConn_) return;
    relay::monitor::Stats::Instance().IncTimeouts();
    Fail(kTimedOut, "connect timeout after " + std::to_string(config_.connectTimeoutMs) + "ms");
}

void ForwardSession::OnRequestTimeout() {
    if (finished_) return;
    relay::monitor::Stats::Instance().IncTimeouts();
    Fail(kTimedOut, "request timeout after " + std::to_string(config_.requestTimeoutMs) + "ms");
}

void ForwardSession::OnInterimHead(const protocol::HttpResponse& interim) {
    // HTTP/1.0 callers do not understand 1xx.
    if (finished_ || clientVersion_ != protocol::HttpRequest::kHttp11) return;
    protocol::HttpResponse out;
    out.setStatusCode(interim.statusCode());
    out.setStatusMessage(interim.statusMessage().empty()
                             ? protocol::HttpResponse::DefaultReason(interim.statusCode())
                             : interim.statusMessage());
    out.headers() = protocol::FilterHopByHop(interim.headers());
    network::Buffer head;
    out.appendHeadToBuffer(&head);
    SendToClient(head.Peek(), head.ReadableBytes());
}

void ForwardSession::OnResponseHead(const protocol::HttpResponse& head) {
    if (finished_) return;
    if (!Forwarder::RelayableTo(head, response_.framing(), clientVersion_)) {
        Fail(kOriginError, "transfer-coding \"" + head.headers().Get("Transfer-Encoding")
                               + "\" cannot be relayed to an HTTP/1.0 caller");
        return;
    }
    status_ = head.statusCode();
    const protocol::HttpResponse out = Forwarder::BuildRelayedResponse(
        head, response_.framing(), clientVersion_, clientWantsKeepAlive_, &chunkToClient_, &keepAlive_);

    network::Buffer buf;
    out.appendHeadToBuffer(&buf);
    responseStarted_ = true;
    SendToClient(buf.Peek(), buf.ReadableBytes());
}

void ForwardSession::OnResponseBody(const char* data, size_t len) {
    if (finished_) return;
    responseBodyBytes_ += len;
    if (chunkToClient_) {
        network::Buffer chunk;
        AppendChunkHeader(&chunk, len);
        chunk.Append(data, len);
        chunk.Append("\r\n", 2);
        SendToClient(chunk.Peek(), chunk.ReadableBytes());
    } else {
        SendToClient(data, len);
    }
}

void ForwardSession::SendToClient(const char* data, size_t len) {
    if (auto client = clientConn_.lock()) {
        client->Send(data, len);
    }
}

void ForwardSession::Complete() {
    if (finished_) return;
    if (chunkToClient_) {
        SendToClient(kLastChunk, sizeof kLastChunk - 1);
    }
    finished_ = true;
    relay::monitor::Stats::Instance().IncForwarded();
    Release();
    if (doneCallback_) doneCallback_(shared_from_this(), kCompleted);
}

void ForwardSession::Fail(Outcome outcome, const std::string& reason) {
    if (finished_) return;
    finished_ = true;
    keepAlive_ = false;
    relay::monitor::Stats::Instance().IncOriginFailures();
    LOG_WARN << "ForwardSession[" << name_ << "] " << OutcomeName(outcome) << ": " << reason
             << (responseStarted_ ? " (response already started)" : "");
    Release();
    if (doneCallback_) doneCallback_(shared_from_this(), outcome);
}

void ForwardSession::Abort() {
    if (finished_) return;
    finished_ = true;
    keepAlive_ = false;
    relay::monitor::Stats::Instance().IncAborted();
    LOG_DEBUG << "ForwardSession[" << name_ << "] aborted by caller";
    Release();
}

void ForwardSession::Release() {
    connectTimer_.Cancel();
    requestTimer_.Cancel();
    pending_.RetrieveAll();
    originClient_.ForceClose();
    originConn_.reset();
    if (clientReadPaused_) {
        clientReadPaused_ = false;
        if (auto client = clientConn_.lock()) client->StartRead();
    }
}

} // namespace relay
