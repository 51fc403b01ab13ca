#pragma once

#include <atomic>
#include <string>

namespace relay {
namespace monitor {

class Stats {
public:
    static Stats& Instance();

    void IncActiveConnections() { activeConnections_.fetch_add(1, std::memory_order_relaxed); }
    void DecActiveConnections() { activeConnections_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveConnections() const { return activeConnections_.load(std::memory_order_relaxed); }

    void IncTotalRequests() { totalRequests_.fetch_add(1, std::memory_order_relaxed); }
    long GetTotalRequests() const { return totalRequests_.load(std::memory_order_relaxed); }

    void IncForwarded() { forwarded_.fetch_add(1, std::memory_order_relaxed); }
    long GetForwarded() const { return forwarded_.load(std::memory_order_relaxed); }

    void IncOriginFailures() { originFailures_.fetch_add(1, std::memory_order_relaxed); }
    long GetOriginFailures() const { return originFailures_.load(std::memory_order_relaxed); }

    void IncTimeouts() { timeouts_.fetch_add(1, std::memory_order_relaxed); }
    long GetTimeouts() const { return timeouts_.load(std::memory_order_relaxed); }

    void IncAborted() { aborted_.fetch_add(1, std::memory_order_relaxed); }
    long GetAborted() const { return aborted_.load(std::memory_order_relaxed); }

    void AddBytesIn(long long n) { bytesIn_.fetch_add(n, std::memory_order_relaxed); }
    void AddBytesOut(long long n) { bytesOut_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesIn() const { return bytesIn_.load(std::memory_order_relaxed); }
    long long GetBytesOut() const { return bytesOut_.load(std::memory_order_relaxed); }

    // One line, key=value pairs.
    std::string Summary() const;

private:
    Stats() = default;

    std::atomic<long> activeConnections_{0};
    std::atomic<long> totalRequests_{0};
    std::atomic<long> forwarded_{0};
    std::atomic<long> originFailures_{0};
    std::atomic<long> timeouts_{0};
    std::atomic<long> aborted_{0};
    std::atomic<long long> bytesIn_{0};
    std::atomic<long long> bytesOut_{0};
};

} // namespace monitor
} // namespace relay
