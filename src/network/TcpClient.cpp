#include "relay/network/TcpClient.h"
#include "relay/network/Connector.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/common/Logger.h"

#include <cstdio>

namespace relay {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg)
    : loop_(loop),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      name_(nameArg),
      nextConnId_(1) {
    connector_->SetNewConnectionCallback([this](int sockfd) { NewConnection(sockfd); });
    connector_->SetErrorCallback([this](int err) {
        if (connectFailedCallback_) connectFailedCallback_(err);
    });
}

TcpClient::~TcpClient() {
    LOG_DEBUG << "TcpClient::dtor[" << name_ << "]";
    connector_->Stop();
    if (connection_) {
        TcpConnectionPtr conn = connection_;
        connection_.reset();
        // Detach from the owner before closing; nothing may call back into it.
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback(MessageCallback());
        conn->SetWriteCompleteCallback(WriteCompleteCallback());
        conn->SetHighWaterMarkCallback(HighWaterMarkCallback(), 0);
        EventLoop* loop = loop_;
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
            loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
        });
        if (conn->disconnected()) {
            loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
        } else {
            conn->ForceClose();
        }
    }
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient::Connect[" << name_ << "] to " << connector_->serverAddress().toIpPort();
    connector_->Start();
}

void TcpClient::ForceClose() {
    connector_->Stop();
    if (connection_) {
        connection_->ForceClose();
    }
}

void TcpClient::NewConnection(int sockfd) {
    const InetAddress peerAddr = Socket::PeerAddress(sockfd);

    char buf[48];
    std::snprintf(buf, sizeof buf, ":%s#%d", peerAddr.toIpPort().c_str(), nextConnId_);
    ++nextConnId_;

    TcpConnectionPtr conn = std::make_shared<TcpConnection>(loop_,
                                                            name_ + buf,
                                                            sockfd,
                                                            Socket::LocalAddress(sockfd),
                                                            peerAddr);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });
    conn->SetTcpNoDelay(true);

    connection_ = conn;
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    if (connection_ == conn) {
        connection_.reset();
    }
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace relay
