#include "relay/network/Poller.h"
#include "relay/network/Channel.h"

namespace relay {
namespace network {

Poller::Poller(EventLoop* loop) : ownerLoop_(loop) {}

Poller::~Poller() = default;

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

} // namespace network
} // namespace relay
