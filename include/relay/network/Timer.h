#pragma once

#include "relay/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>

namespace relay {
namespace network {

class Channel;
class EventLoop;

// timerfd-backed timer bound to one loop. Start/Cancel and destruction must
// happen on that loop's thread. The owner must not destroy the timer from
// inside its own callback.
class Timer : relay::common::noncopyable {
public:
    using Callback = std::function<void()>;

    Timer(EventLoop* loop, Callback cb);
    ~Timer();

    // interval == 0 makes it one-shot. Restarting re-arms from now.
    bool Start(std::chrono::milliseconds delay,
               std::chrono::milliseconds interval = std::chrono::milliseconds(0));
    void Cancel();
    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    const int timerfd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
    bool armed_;
    bool repeating_;
};

} // namespace network
} // namespace relay
