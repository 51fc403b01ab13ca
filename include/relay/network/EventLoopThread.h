#pragma once

#include "relay/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace relay {
namespace network {

class EventLoop;

class EventLoopThread : relay::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Blocks until the loop is running in the new thread.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace relay
