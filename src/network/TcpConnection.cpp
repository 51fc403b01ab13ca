#include "relay/network/TcpConnection.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/network/Socket.h"
#include "relay/network/TlsContext.h"
#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"

#include <openssl/ssl.h>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace relay {
namespace network {

namespace {

std::int64_t SteadyNowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

const size_t kDefaultHighWaterMark = 64 * 1024 * 1024;
const ssize_t kWouldBlock = -2;

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      peerHalfClosed_(false),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(kDefaultHighWaterMark),
      lastActiveNs_(SteadyNowNs()),
      tlsCtx_(tlsCtx) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] fd=" << sockfd;
    socket_->SetKeepAlive(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd()
              << " state=" << StateName(state_);
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

const char* TcpConnection::StateName(StateE s) {
    switch (s) {
    case kDisconnected: return "kDisconnected";
    case kConnecting: return "kConnecting";
    case kConnected: return "kConnected";
    case kDisconnecting: return "kDisconnecting";
    }
    return "unknown";
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->EnableReading();
    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::tlsSniff() {
    unsigned char first = 0;
    const ssize_t n = ::recv(channel_->fd(), &first, 1, MSG_PEEK);
    if (n <= 0) return;

    if (first != 0x16) {
        tlsCtx_ = nullptr; // plaintext client
        return;
    }

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_WARN << "TLS: SSL_new failed for " << name_ << ": " << TlsContext::LastError();
        tlsCtx_ = nullptr;
        return;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = kTlsHandshake;
}

bool TcpConnection::tlsHandshake() {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_accept(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        LOG_DEBUG << "TLS established on " << name_;
        if (outputBuffer_.ReadableBytes() > 0 && !channel_->IsWriting()) {
            channel_->EnableWriting();
        } else if (outputBuffer_.ReadableBytes() == 0 && channel_->IsWriting()) {
            channel_->DisableWriting();
        }
        return true;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        if (channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
        }
        return true;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return true;
    }
    const std::string reason = TlsContext::LastError();
    LOG_WARN << "TLS handshake failed on " << name_ << ": "
             << (reason.empty() ? std::to_string(e) : reason);
    return false;
}

ssize_t TcpConnection::tlsRead(char* buf, size_t cap, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return kWouldBlock;
    if (e == SSL_ERROR_WANT_WRITE) {
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return kWouldBlock;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::tlsWrite(const void* data, size_t len, int* savedErrno) {
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return kWouldBlock;
    *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::WriteOnce(const void* data, size_t len, int* savedErrno) {
    if (ssl_) {
        if (tlsState_ != kTlsEstablished) return kWouldBlock;
        return tlsWrite(data, len, savedErrno);
    }
    const ssize_t n = ::write(channel_->fd(), data, len);
    if (n < 0) {
        *savedErrno = errno;
        if (errno == EWOULDBLOCK || errno == EAGAIN) return kWouldBlock;
    }
    return n;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsEnabled() && !ssl_) {
        tlsSniff();
    }
    if (ssl_ && tlsState_ == kTlsHandshake) {
        if (!tlsHandshake()) {
            HandleClose();
            return;
        }
        if (tlsState_ != kTlsEstablished) return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (ssl_) {
        char tmp[64 * 1024];
        n = tlsRead(tmp, sizeof(tmp), &savedErrno);
        if (n == kWouldBlock) return;
        if (n > 0) inputBuffer_.Append(tmp, static_cast<size_t>(n));
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
        if (n < 0 && (savedErrno == EAGAIN || savedErrno == EINTR)) return;
    }

    if (n > 0) {
        relay::monitor::Stats::Instance().AddBytesIn(n);
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandlePeerShutdown();
    } else {
        LOG_WARN << "TcpConnection::HandleRead[" << name_ << "] " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == kTlsHandshake) {
        if (!tlsHandshake()) {
            HandleClose();
        }
        return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd=" << channel_->fd() << " is down, no more writing";
        return;
    }

    int savedErrno = 0;
    const ssize_t n = WriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n == kWouldBlock) return;
    if (n < 0) {
        LOG_WARN << "TcpConnection::HandleWrite[" << name_ << "] " << std::strerror(savedErrno);
        HandleClose();
        return;
    }

    relay::monitor::Stats::Instance().AddBytesOut(n);
    Touch();
    outputBuffer_.Retrieve(static_cast<size_t>(n));
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        if (writeCompleteCallback_) {
            auto self = shared_from_this();
            loop_->QueueInLoop([self]() {
                if (self->writeCompleteCallback_) self->writeCompleteCallback_(self);
            });
        }
        if (state_ == kDisconnecting) {
            ShutdownInLoop();
        }
    }
}

void TcpConnection::HandlePeerShutdown() {
    if (!halfCloseCallback_ || state_ == kDisconnected) {
        HandleClose();
        return;
    }
    if (state_ == kDisconnecting && !channel_->IsWriting()) {
        // Our FIN is already out; both directions are done.
        HandleClose();
        return;
    }
    LOG_DEBUG << "TcpConnection::HandlePeerShutdown[" << name_ << "] state=" << StateName(state_);
    peerHalfClosed_ = true;
    reading_ = false;
    channel_->DisableReading();
    if (state_ == kConnected) {
        halfCloseCallback_(shared_from_this());
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose[" << name_ << "] state=" << StateName(state_);
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::SocketError(channel_->fd());
    if (err != 0) {
        LOG_WARN << "TcpConnection::HandleError[" << name_ << "] SO_ERROR=" << err
                 << " " << std::strerror(err);
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([self = shared_from_this(), msg = std::move(msg)]() {
            self->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "TcpConnection[" << name_ << "] disconnected, give up writing";
        return;
    }
    if (len == 0) return;

    size_t nwrote = 0;
    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        const ssize_t n = WriteOnce(data, len, &savedErrno);
        if (n >= 0) {
            nwrote = static_cast<size_t>(n);
            relay::monitor::Stats::Instance().AddBytesOut(n);
            Touch();
            if (nwrote == len && writeCompleteCallback_) {
                auto self = shared_from_this();
                loop_->QueueInLoop([self]() {
                    if (self->writeCompleteCallback_) self->writeCompleteCallback_(self);
                });
            }
        } else if (n != kWouldBlock) {
            LOG_WARN << "TcpConnection::SendInLoop[" << name_ << "] " << std::strerror(savedErrno);
            // The peer is gone; tear down on the next loop iteration.
            auto self = shared_from_this();
            loop_->QueueInLoop([self]() { self->ForceCloseInLoop(); });
            return;
        }
    }

    const size_t remaining = len - nwrote;
    if (remaining > 0) {
        const size_t oldLen = outputBuffer_.ReadableBytes();
        if (oldLen + remaining >= highWaterMark_ && oldLen < highWaterMark_ && highWaterMarkCallback_) {
            auto self = shared_from_this();
            const size_t total = oldLen + remaining;
            loop_->QueueInLoop([self, total]() {
                if (self->highWaterMarkCallback_) self->highWaterMarkCallback_(self, total);
            });
        }
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting() && !(ssl_ && tlsState_ != kTlsEstablished)) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        if (ssl_ && tlsState_ == kTlsEstablished) {
            SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
        }
        socket_->ShutdownWrite();
        if (peerHalfClosed_) {
            HandleClose();
        }
    }
}

void TcpConnection::ForceClose() {
    if (state_ != kDisconnected) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ != kDisconnected) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && !peerHalfClosed_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_ && state_ != kDisconnected) {
        reading_ = false;
        channel_->DisableReading();
    }
}

void TcpConnection::SetTcpNoDelay(bool on) {
    socket_->SetTcpNoDelay(on);
}

void TcpConnection::Touch() {
    lastActiveNs_.store(SteadyNowNs(), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(lastActiveNs_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace relay
