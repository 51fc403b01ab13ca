#include "relay/network/TcpServer.h"
#include "relay/network/Acceptor.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/network/Timer.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"

#include <cstdio>
#include <unistd.h>
#include <vector>

namespace relay {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { NewConnection(sockfd, peerAddr); });
}

TcpServer::~TcpServer() {
    cleanupTimer_.reset();
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
    connections_.clear();
}

InetAddress TcpServer::listenAddress() const {
    return acceptor_->listenAddress();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    std::unique_ptr<TlsContext> ctx(new TlsContext());
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

bool TcpServer::Start() {
    if (started_++ != 0) return true;

    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot listen";
        return false;
    }
    threadPool_->Start();
    if (idleTimeoutSec_ > 0.0) {
        cleanupTimer_.reset(new Timer(loop_, [this]() { CleanupIdleConnections(); }));
        cleanupTimer_->Start(std::chrono::milliseconds(1000), std::chrono::milliseconds(1000));
    }
    LOG_INFO << "TcpServer [" << name_ << "] listening on " << listenAddress().toIpPort();
    return true;
}

void TcpServer::CleanupIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (const auto& item : connections_) {
        const TcpConnectionPtr& conn = item.second;
        if (conn && now - conn->LastActiveTime() > timeout) {
            LOG_WARN << "TcpServer [" << name_ << "] closing idle connection " << item.first
                     << " peer=" << conn->peerAddress().toIpPort();
            toClose.push_back(conn);
        }
    }
    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    const int current = static_cast<int>(connections_.size());
    if (maxConnections_ > 0 && current >= maxConnections_) {
        LOG_WARN << "TcpServer [" << name_ << "] reject " << peerAddr.toIpPort()
                 << ": " << current << " connections, limit " << maxConnections_;
        ::close(sockfd);
        return;
    }

    char buf[32];
    std::snprintf(buf, sizeof buf, "#%d", nextConnId_);
    ++nextConnId_;
    const std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer [" << name_ << "] new connection " << connName
              << " from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop,
                                                            connName,
                                                            sockfd,
                                                            Socket::LocalAddress(sockfd),
                                                            peerAddr,
                                                            tlsCtx_ ? tlsCtx_->ctx() : nullptr);
    connections_[connName] = conn;
    relay::monitor::Stats::Instance().IncActiveConnections();

    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Deferred so the connection is never erased from inside its own callback.
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer [" << name_ << "] remove connection " << conn->name();
    if (connections_.erase(conn->name()) > 0) {
        relay::monitor::Stats::Instance().DecActiveConnections();
    }
    conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace relay
