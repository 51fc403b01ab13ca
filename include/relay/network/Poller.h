#pragma once

#include "relay/common/noncopyable.h"

#include <chrono>
#include <unordered_map>
#include <vector>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// IO multiplexing interface. Only used from the owning loop's thread.
class Poller : relay::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    virtual ~Poller();

    virtual std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels) = 0;
    virtual void UpdateChannel(Channel* channel) = 0;
    virtual void RemoveChannel(Channel* channel) = 0;
    virtual bool HasChannel(Channel* channel) const;

    static Poller* NewDefaultPoller(EventLoop* loop);

protected:
    using ChannelMap = std::unordered_map<int, Channel*>;
    ChannelMap channels_;

private:
    EventLoop* ownerLoop_;
};

} // namespace network
} // namespace relay
