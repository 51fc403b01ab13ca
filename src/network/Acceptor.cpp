#include "relay/network/Acceptor.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace relay {
namespace network {

static int CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket() failed errno=" << errno;
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      acceptSocket_(CreateNonblocking()),
      acceptChannel_(loop, acceptSocket_.fd()),
      bound_(false),
      listening_(false) {
    acceptSocket_.SetReuseAddr(true);
    acceptSocket_.SetReusePort(reuseport);
    bound_ = acceptSocket_.BindAddress(listenAddr);

    acceptChannel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        acceptChannel_.DisableAll();
        acceptChannel_.Remove();
    }
}

bool Acceptor::Listen() {
    if (!bound_ || !acceptSocket_.Listen()) return false;
    listening_ = true;
    acceptChannel_.EnableReading();
    return true;
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = acceptSocket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (newConnectionCallback_) {
            newConnectionCallback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else if (errno != EAGAIN && errno != EINTR) {
        LOG_ERROR << "Acceptor::HandleRead accept errno=" << errno;
        if (errno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace relay
