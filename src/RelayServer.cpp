#include "relay/RelayServer.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"
#include "relay/protocol/HttpResponse.h"

namespace relay {

RelayServer::RelayServer(network::EventLoop* loop,
                         const network::InetAddress& listenAddr,
                         const ForwarderConfig& config,
                         const std::string& name,
                         bool reusePort)
    : forwarder_(config),
      server_(loop, listenAddr, name,
              reusePort ? network::TcpServer::kReusePort : network::TcpServer::kNoReusePort) {
    server_.SetConnectionCallback([this](const network::TcpConnectionPtr& conn) { OnConnection(conn); });
    server_.SetMessageCallback([this](const network::TcpConnectionPtr& conn,
                                      network::Buffer* buf,
                                      std::chrono::system_clock::time_point t) {
        OnMessage(conn, buf, t);
    });
}

bool RelayServer::Start() {
    const ForwarderConfig& cfg = forwarder_.config();
    if (!server_.Start()) return false;
    LOG_INFO << "RelayServer forwarding to " << cfg.origin.toString()
             << " (" << cfg.originAddr.toIpPort() << ")";
    return true;
}

RelaySessionContext* RelayServer::GetContext(const network::TcpConnectionPtr& conn) {
    auto* ctx = std::any_cast<RelaySessionContextPtr>(conn->GetMutableContext());
    return (ctx && *ctx) ? ctx->get() : nullptr;
}

void RelayServer::ReleaseSession(network::EventLoop* loop, ForwardSessionPtr session) {
    if (session) {
        loop->QueueInLoop([session]() {});
    }
}

void RelayServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "New connection from " << conn->peerAddress().toIpPort();
        auto ctx = std::make_shared<RelaySessionContext>();
        RelaySessionContext* raw = ctx.get();
        std::weak_ptr<network::TcpConnection> weakConn(conn);

        // The headers callback starts forwarding before any body byte is read.
        raw->parser.setHeadersCallback([this, raw, weakConn](const protocol::HttpRequest& request) {
            if (auto c = weakConn.lock()) StartSession(c, raw, request);
        });
        raw->parser.setBodyCallback([raw](const char* data, size_t len) {
            if (raw->session) raw->session->SendRequestBody(data, len);
        });
        conn->SetContext(ctx);
        conn->SetHalfCloseCallback([this](const network::TcpConnectionPtr& c) { OnPeerHalfClose(c); });
        return;
    }

    LOG_DEBUG << "Connection closed: " << conn->name();
    RelaySessionContext* ctx = GetContext(conn);
    if (ctx) {
        ctx->closing = true;
        if (ctx->session) {
            ctx->session->Abort();
            LOG_INFO << conn->peerAddress().toIpPort() << " caller disconnected, abandoned "
                     << ctx->session->name();
            ReleaseSession(conn->getLoop(), ctx->session);
            ctx->session.reset();
        }
    }
}

void RelayServer::OnPeerHalfClose(const network::TcpConnectionPtr& conn) {
    RelaySessionContext* ctx = GetContext(conn);
    if (!ctx) return;
    LOG_DEBUG << "Caller half-closed: " << conn->name();
    ctx->peerHalfClosed = true;
    SettleHalfClosed(conn, ctx);
}

void RelayServer::SettleHalfClosed(const network::TcpConnectionPtr& conn, RelaySessionContext* ctx) {
    if (!ctx->peerHalfClosed || ctx->closing) return;
    if (!ctx->session && ctx->inbound.ReadableBytes() > 0) {
        ProcessInbound(conn, ctx, std::chrono::system_clock::now());
        if (ctx->closing) return;
    }
    if (ctx->session && ctx->parser.gotAll()) {
        // Answer it; the connection closes after the response.
        return;
    }
    ctx->closing = true;
    if (ctx->session) {
        // The request body can no longer complete.
        conn->ForceClose();
    } else {
        conn->Shutdown();
    }
}

void RelayServer::OnMessage(const network::TcpConnectionPtr& conn,
                            network::Buffer* buf,
                            std::chrono::system_clock::time_point receiveTime) {
    RelaySessionContext* ctx = GetContext(conn);
    if (!ctx || ctx->closing) {
        buf->RetrieveAll();
        return;
    }
    ctx->inbound.Append(buf->Peek(), buf->ReadableBytes());
    buf->RetrieveAll();
    ProcessInbound(conn, ctx, receiveTime);
}

void RelayServer::ProcessInbound(const network::TcpConnectionPtr& conn,
                                 RelaySessionContext* ctx,
                                 std::chrono::system_clock::time_point receiveTime) {
    if (ctx->closing) return;

    if (ctx->parser.gotAll()) {
        // Pipelined request waiting for the current response; bound the backlog.
        // Origin write-complete may have resumed reading, so check the socket state.
        if (conn->isReading() && ctx->inbound.ReadableBytes() > protocol::HttpContext::kMaxHeaderBytes) {
            ctx->readPaused = true;
            conn->StopRead();
        }
        return;
    }

    if (!ctx->parser.parseRequest(&ctx->inbound, receiveTime)) {
        RejectRequest(conn, ctx, ctx->parser.headerTooLarge() ? protocol::HttpResponse::k431RequestHeaderFieldsTooLarge
                                          : protocol::HttpResponse::k400BadRequest);
        return;
    }

    if (ctx->parser.gotAll() && ctx->session) {
        ctx->session->FinishRequestBody();
    }
}

void RelayServer::StartSession(const network::TcpConnectionPtr& conn,
                               RelaySessionContext* ctx,
                               const protocol::HttpRequest& request) {
    std::weak_ptr<network::TcpConnection> weakConn(conn);
    ctx->session = forwarder_.Forward(
        request, ctx->parser.framing(), conn,
        [this, weakConn](const ForwardSessionPtr& session, ForwardSession::Outcome outcome) {
            OnSessionDone(weakConn, session, outcome);
        });
}

void RelayServer::RejectRequest(const network::TcpConnectionPtr& conn, RelaySessionContext* ctx, int code) {
    LOG_WARN << "Rejecting request from " << conn->peerAddress().toIpPort() << " with " << code;
    ctx->closing = true;
    ctx->inbound.RetrieveAll();
    const bool responseStarted = ctx->session && ctx->session->responseStarted();
    if (ctx->session) {
        ctx->session->Abort();
        ReleaseSession(conn->getLoop(), ctx->session);
        ctx->session.reset();
    }
    if (responseStarted) {
        conn->ForceClose();
        return;
    }
    network::Buffer out;
    protocol::HttpResponse::MakeError(code).appendToBuffer(&out);
    conn->Send(out.Peek(), out.ReadableBytes());
    conn->Shutdown();
}

void RelayServer::OnSessionDone(const std::weak_ptr<network::TcpConnection>& weakConn,
                                const ForwardSessionPtr& session,
                                ForwardSession::Outcome outcome) {
    auto conn = weakConn.lock();
    RelaySessionContext* ctx = conn ? GetContext(conn) : nullptr;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session->startTime());

    int status = session->status();
    if (outcome != ForwardSession::kCompleted && !session->responseStarted()) {
        status = outcome == ForwardSession::kTimedOut ? protocol::HttpResponse::k504GatewayTimeout
                                                      : protocol::HttpResponse::k502BadGateway;
    }

    ReleaseSession(session->loop(), session);
    if (!ctx || ctx->session != session) {
        return;
    }

    const protocol::HttpRequest& request = ctx->parser.request();
    LOG_INFO << conn->peerAddress().toIpPort() << " \"" << request.method() << " " << request.target()
             << "\" " << status << " " << session->responseBodyBytes() << "B " << elapsed.count() << "ms "
             << ForwardSession::OutcomeName(outcome);

    ctx->session.reset();
    ++ctx->requestsServed;

    if (outcome != ForwardSession::kCompleted) {
        ctx->closing = true;
        if (session->responseStarted()) {
            // Bytes already went out; the caller must see a broken response.
            conn->ForceClose();
        } else {
            network::Buffer out;
            protocol::HttpResponse::MakeError(status).appendToBuffer(&out);
            conn->Send(out.Peek(), out.ReadableBytes());
            conn->Shutdown();
        }
        return;
    }

    if (!session->keepAlive() || !ctx->parser.gotAll()) {
        ctx->closing = true;
        conn->Shutdown();
        return;
    }

    // Next request on this connection, outside the session's callback stack.
    ctx->parser.reset();
    if (ctx->readPaused) {
        ctx->readPaused = false;
        conn->StartRead();
    }
    conn->getLoop()->QueueInLoop([this, weakConn]() {
        auto c = weakConn.lock();
        if (!c || !c->connected()) return;
        RelaySessionContext* next = GetContext(c);
        if (!next) return;
        if (next->inbound.ReadableBytes() > 0) {
            ProcessInbound(c, next, std::chrono::system_clock::now());
        }
        SettleHalfClosed(c, next);
    });
}

} // namespace relay
