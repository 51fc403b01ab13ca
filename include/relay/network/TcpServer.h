#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Callbacks.h"
#include "relay/network/EventLoopThreadPool.h"
#include "relay/network/InetAddress.h"
#include "relay/network/TcpConnection.h"
#include "relay/network/TlsContext.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace relay {
namespace network {

class Acceptor;
class EventLoop;
class Timer;

class TcpServer : relay::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    // Actual listen address; useful after binding port 0.
    InetAddress listenAddress() const;

    // 0 runs every connection on the acceptor loop.
    void SetThreadNum(int numThreads);

    // Listener accepts both TLS and plaintext clients, decided per connection
    // by sniffing the first byte.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // 0 means unlimited.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    // 0 disables idle cleanup.
    void SetIdleTimeout(double idleTimeoutSec) { idleTimeoutSec_ = idleTimeoutSec; }

    // Must be called on the acceptor loop thread. False if the port could
    // not be bound or listened on.
    bool Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::unique_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int nextConnId_;
    ConnectionMap connections_;

    int maxConnections_{0};
    double idleTimeoutSec_{0.0};
    std::unique_ptr<Timer> cleanupTimer_;
};

} // namespace network
} // namespace relay
