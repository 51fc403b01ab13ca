#include "relay/network/EventLoop.h"
#include "relay/network/EventLoopThreadPool.h"
#include "relay/network/Timer.h"
#include "relay/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

using namespace relay::network;
using namespace relay::common;
using namespace std::chrono;

void testQuitFromOtherThread() {
    EventLoop loop;
    bool ranInLoop = false;
    loop.RunInLoop([&ranInLoop]() { ranInLoop = true; });
    assert(ranInLoop);

    std::atomic<bool> queued{false};
    std::thread t([&loop, &queued]() {
        std::this_thread::sleep_for(milliseconds(50));
        loop.QueueInLoop([&loop, &queued]() {
            assert(loop.IsInLoopThread());
            queued = true;
            loop.Quit();
        });
    });
    loop.Loop();
    t.join();
    assert(queued);
    LOG_INFO << "Quit from another thread PASS";
}

void testOneShotTimer() {
    EventLoop loop;
    int fired = 0;
    const auto start = steady_clock::now();
    Timer timer(&loop, [&]() {
        ++fired;
        loop.Quit();
    });
    assert(timer.Start(milliseconds(100)));
    assert(timer.armed());
    loop.Loop();
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
    assert(fired == 1);
    assert(!timer.armed());
    assert(elapsed >= 90);
    LOG_INFO << "One-shot timer PASS (" << elapsed << "ms)";
}

void testCancelledTimerDoesNotFire() {
    EventLoop loop;
    bool fired = false;
    Timer victim(&loop, [&fired]() { fired = true; });
    Timer stopper(&loop, [&loop]() { loop.Quit(); });
    assert(victim.Start(milliseconds(50)));
    victim.Cancel();
    assert(!victim.armed());
    assert(stopper.Start(milliseconds(200)));
    loop.Loop();
    assert(!fired);
    LOG_INFO << "Cancelled timer PASS";
}

void testRepeatingTimer() {
    EventLoop loop;
    int ticks = 0;
    Timer timer(&loop, [&]() {
        if (++ticks == 3) {
            timer.Cancel();
            loop.Quit();
        }
    });
    assert(timer.Start(milliseconds(20), milliseconds(20)));
    loop.Loop();
    assert(ticks == 3);
    assert(!timer.armed());
    LOG_INFO << "Repeating timer PASS";
}

void testThreadPoolLoops() {
    EventLoop baseLoop;
    EventLoopThreadPool pool(&baseLoop, "TestPool");
    pool.SetThreadNum(2);
    pool.Start();
    EventLoop* a = pool.GetNextLoop();
    EventLoop* b = pool.GetNextLoop();
    EventLoop* c = pool.GetNextLoop();
    assert(a != &baseLoop && b != &baseLoop);
    assert(a != b);
    assert(c == a);

    std::atomic<int> done{0};
    for (EventLoop* loop : {a, b}) {
        loop->QueueInLoop([loop, &done]() {
            assert(loop->IsInLoopThread());
            done.fetch_add(1);
        });
    }
    const auto deadline = steady_clock::now() + seconds(2);
    while (done.load() < 2 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    assert(done.load() == 2);

    // Without worker threads everything runs on the base loop.
    EventLoopThreadPool single(&baseLoop, "Single");
    single.Start();
    assert(single.GetNextLoop() == &baseLoop);
    LOG_INFO << "Loop thread pool PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testQuitFromOtherThread();
    testOneShotTimer();
    testCancelledTimerDoesNotFire();
    testRepeatingTimer();
    testThreadPoolLoops();
    LOG_INFO << "All event loop tests PASS";
    return 0;
}
