#pragma once

#include "relay/common/noncopyable.h"

namespace relay {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : relay::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static InetAddress LocalAddress(int sockfd);
    static InetAddress PeerAddress(int sockfd);
    static int SocketError(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace relay
