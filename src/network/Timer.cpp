#include "relay/network/Timer.h"
#include "relay/network/Channel.h"
#include "relay/network/EventLoop.h"
#include "relay/common/Logger.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>

namespace relay {
namespace network {

namespace {

int CreateTimerfd() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "timerfd_create failed errno=" << errno;
    }
    return fd;
}

struct timespec ToTimespec(std::chrono::milliseconds ms) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ms.count() / 1000);
    ts.tv_nsec = static_cast<long>((ms.count() % 1000) * 1000000);
    return ts;
}

} // namespace

Timer::Timer(EventLoop* loop, Callback cb)
    : loop_(loop),
      timerfd_(CreateTimerfd()),
      channel_(new Channel(loop, timerfd_)),
      callback_(std::move(cb)),
      armed_(false),
      repeating_(false) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

Timer::~Timer() {
    channel_->DisableAll();
    channel_->Remove();
    ::close(timerfd_);
}

bool Timer::Start(std::chrono::milliseconds delay, std::chrono::milliseconds interval) {
    // A zero it_value disarms a timerfd, so fire after 1ms at the earliest.
    if (delay.count() <= 0) delay = std::chrono::milliseconds(1);

    struct itimerspec value;
    std::memset(&value, 0, sizeof value);
    value.it_value = ToTimespec(delay);
    value.it_interval = ToTimespec(interval);
    if (::timerfd_settime(timerfd_, 0, &value, nullptr) != 0) {
        LOG_ERROR << "Timer timerfd_settime failed errno=" << errno;
        return false;
    }
    armed_ = true;
    repeating_ = interval.count() > 0;
    return true;
}

void Timer::Cancel() {
    if (!armed_) return;
    struct itimerspec value;
    std::memset(&value, 0, sizeof value);
    ::timerfd_settime(timerfd_, 0, &value, nullptr);
    armed_ = false;
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    const ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations) {
        // Cancelled between expiry and dispatch.
        return;
    }
    if (!armed_) return;
    if (!repeating_) armed_ = false;
    if (callback_) callback_();
}

} // namespace network
} // namespace relay
