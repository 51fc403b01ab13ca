#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Channel.h"
#include "relay/network/InetAddress.h"
#include "relay/network/Socket.h"

#include <functional>

namespace relay {
namespace network {

class EventLoop;

class Acceptor : relay::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        newConnectionCallback_ = cb;
    }

    // False when the listen address could not be bound.
    bool bound() const { return bound_; }
    bool listening() const { return listening_; }
    // The bound address; resolves port 0 to the kernel-chosen port.
    InetAddress listenAddress() const { return Socket::LocalAddress(acceptSocket_.fd()); }

    bool Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket acceptSocket_;
    Channel acceptChannel_;
    NewConnectionCallback newConnectionCallback_;
    bool bound_;
    bool listening_;
};

} // namespace network
} // namespace relay
