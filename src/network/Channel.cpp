#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <sys/epoll.h>

namespace relay {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1),
      addedToLoop_(false) {
}

Channel::~Channel() {
    if (addedToLoop_) {
        LOG_DEBUG << "Channel fd=" << fd_ << " destroyed without Remove()";
    }
}

void Channel::Update() {
    addedToLoop_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    addedToLoop_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (closeCallback_) closeCallback_();
    }

    if (revents_ & EPOLLERR) {
        if (errorCallback_) errorCallback_();
    }

    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (readCallback_) readCallback_(receiveTime);
    }

    if (revents_ & EPOLLOUT) {
        if (writeCallback_) writeCallback_();
    }
}

} // namespace network
} // namespace relay
