#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/TcpConnection.h"

#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {

class Connector;
class EventLoop;

// One outbound connection, no reconnect. Loop-thread only, and must be
// destroyed on its loop outside of its own callbacks.
class TcpClient : relay::common::noncopyable {
public:
    using ConnectFailedCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& nameArg);
    ~TcpClient();

    void Connect();
    // Drops the connect attempt or the established connection immediately.
    void ForceClose();

    TcpConnectionPtr connection() const { return connection_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { connectFailedCallback_ = cb; }

private:
    void NewConnection(int sockfd);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    std::shared_ptr<Connector> connector_;
    const std::string name_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    ConnectFailedCallback connectFailedCallback_;

    int nextConnId_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace relay
