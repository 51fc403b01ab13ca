#pragma once

#include "relay/common/noncopyable.h"
#include "relay/network/InetAddress.h"

#include <functional>
#include <memory>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// Makes one non-blocking connect attempt. Exactly one of the callbacks fires
// unless Stop() is called first. Loop-thread only; owned through shared_ptr.
class Connector : public std::enable_shared_from_this<Connector>,
                  relay::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    using ErrorCallback = std::function<void(int err)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void Connect();
    void Connecting(int sockfd);
    void HandleWrite();
    void HandleError();
    void Fail(int sockfd, int err);
    int RemoveAndResetChannel();
    void ResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    bool connect_;
    States state_;
    std::unique_ptr<Channel> channel_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

} // namespace network
} // namespace relay
