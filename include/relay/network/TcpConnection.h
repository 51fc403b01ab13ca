#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/Buffer.h"
#include "relay/network/Callbacks.h"
#include "relay/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace relay {
namespace network {

class Channel;
class EventLoop;
class Socket;

// One established TCP stream, inbound or outbound. Lives in shared_ptr; all
// I/O happens on the owning loop, the public mutators are thread safe.
class TcpConnection : relay::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }
    bool isReading() const { return reading_; }
    bool peerHalfClosed() const { return peerHalfClosed_; }
    size_t pendingOutputBytes() const { return outputBuffer_.ReadableBytes(); }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-close after the output buffer drains.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();
    void SetTcpNoDelay(bool on);

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // With this set, end-of-stream from the peer only stops reading and calls
    // cb; the connection closes once our own Shutdown() has gone out. Without
    // it, end-of-stream closes the connection.
    void SetHalfCloseCallback(const ConnectionCallback& cb) { halfCloseCallback_ = cb; }

    // Called by the owner (TcpServer/TcpClient) once, on the loop thread.
    void ConnectEstablished();
    // Called by the owner after removing the connection from its map.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsStateE { kTlsNone, kTlsHandshake, kTlsEstablished };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();
    void HandlePeerShutdown();

    void SendInLoop(const void* data, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();
    void Touch();

    bool tlsEnabled() const { return tlsCtx_ != nullptr; }
    void tlsSniff();
    // Returns false on a fatal handshake failure.
    bool tlsHandshake();
    ssize_t tlsRead(char* buf, size_t cap, int* savedErrno);
    ssize_t tlsWrite(const void* data, size_t len, int* savedErrno);
    ssize_t WriteOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }
    static const char* StateName(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;
    bool peerHalfClosed_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    CloseCallback closeCallback_;
    ConnectionCallback halfCloseCallback_;

    size_t highWaterMark_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;

    // Inbound TLS is detected from the first byte (0x16 handshake record).
    ssl_ctx_st* tlsCtx_{nullptr};
    ssl_st* ssl_{nullptr};
    TlsStateE tlsState_{kTlsNone};
};

} // namespace network
} // namespace relay
