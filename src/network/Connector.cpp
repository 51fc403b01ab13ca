#include "relay/network/Connector.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace relay {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr),
      connect_(false),
      state_(kDisconnected) {
}

Connector::~Connector() {
    if (channel_ && state_ == kConnecting) {
        // Stopped mid-connect without going through the loop.
        int sockfd = channel_->fd();
        channel_->DisableAll();
        channel_->Remove();
        ::close(sockfd);
    }
}

void Connector::Start() {
    connect_ = true;
    loop_->RunInLoop([self = shared_from_this()]() {
        if (self->connect_) self->Connect();
    });
}

void Connector::Stop() {
    connect_ = false;
    if (state_ == kConnecting) {
        SetState(kDisconnected);
        ::close(RemoveAndResetChannel());
    }
}

void Connector::Connect() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "Connector::Connect socket() failed errno=" << err;
        if (errorCallback_) errorCallback_(err);
        return;
    }

    const int ret = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int savedErrno = (ret == 0) ? 0 : errno;

    switch (savedErrno) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            Connecting(sockfd);
            break;

        default:
            Fail(sockfd, savedErrno);
            break;
    }
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetErrorCallback([this]() { HandleError(); });
    channel_->EnableWriting();
}

int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    const int sockfd = channel_->fd();
    // Can't reset channel_ here, we may be inside Channel::HandleEvent.
    loop_->QueueInLoop([self = shared_from_this()]() { self->ResetChannel(); });
    return sockfd;
}

void Connector::ResetChannel() {
    channel_.reset();
}

void Connector::HandleWrite() {
    if (state_ != kConnecting) return;

    const int sockfd = RemoveAndResetChannel();
    const int err = Socket::SocketError(sockfd);
    if (err) {
        Fail(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (connect_ && newConnectionCallback_) {
        newConnectionCallback_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::HandleError() {
    if (state_ != kConnecting) return;
    const int sockfd = RemoveAndResetChannel();
    int err = Socket::SocketError(sockfd);
    if (err == 0) err = ECONNABORTED;
    Fail(sockfd, err);
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    SetState(kDisconnected);
    LOG_DEBUG << "Connector to " << serverAddr_.toIpPort() << " failed: " << std::strerror(err);
    if (!connect_ || !errorCallback_) return;
    // Never report from inside Start(); the caller may still be setting up.
    ErrorCallback cb = errorCallback_;
    std::weak_ptr<Connector> weakSelf(shared_from_this());
    loop_->QueueInLoop([weakSelf, cb, err]() {
        auto self = weakSelf.lock();
        if (self && self->connect_) cb(err);
    });
}

} // namespace network
} // namespace relay
