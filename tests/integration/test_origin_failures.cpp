#include "relay_harness.h"
#include "relay_test_util.h"

#include "relay/common/Logger.h"
#include "relay/monitor/Stats.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

using namespace relaytest;
using namespace relay::common;
using namespace std::chrono;

namespace {

std::string fetchOnce(uint16_t port, const std::string& request, bool* closed = nullptr) {
    int fd = connectTo(port);
    assert(fd >= 0);
    assert(sendAll(fd, request));
    const std::string response = readUntilClose(fd, 5000, closed);
    ::close(fd);
    return response;
}

const char* kGet = "GET /fail HTTP/1.1\r\nHost: edge\r\n\r\n";

// A loopback listener that is never accepted from, with its accept queue
// filled. Linux drops further SYNs, so a connect to it neither succeeds
// nor fails until the client gives up.
struct BlackholeListener {
    int lfd = -1;
    uint16_t port = 0;
    std::vector<int> fillers;

    BlackholeListener() {
        lfd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (lfd < 0) return;
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(0);
        socklen_t len = sizeof(addr);
        if (::bind(lfd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(lfd, 0) != 0 ||
            ::getsockname(lfd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            return;
        }
        port = ntohs(addr.sin_port);
        for (int i = 0; i < 4; ++i) {
            const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
            if (fd < 0) continue;
            ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            fillers.push_back(fd);
        }
        // Let the handshakes that fit complete and fill the queue.
        std::this_thread::sleep_for(milliseconds(200));
    }

    ~BlackholeListener() {
        for (int fd : fillers) ::close(fd);
        if (lfd >= 0) ::close(lfd);
    }

    bool ok() const { return port != 0 && !fillers.empty(); }
};

} // namespace

void testRefusedOriginIs502() {
    auto freePort = reserveFreeTcpPort();
    assert(freePort);
    const long failuresBefore = relay::monitor::Stats::Instance().GetOriginFailures();

    runRelay(configFor(*freePort), [](uint16_t port) {
        const auto start = steady_clock::now();
        bool closed = false;
        const std::string response = fetchOnce(port, kGet, &closed);
        const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        assert(closed);
        assert(statusLine(response) == "HTTP/1.1 502 Bad Gateway");
        assert(hasHeaderLine(response, "Connection: close"));
        assert(elapsed < 2000);
    });
    assert(relay::monitor::Stats::Instance().GetOriginFailures() == failuresBefore + 1);
    LOG_INFO << "Refused origin PASS";
}

void testRequestTimeoutIs504() {
    std::atomic<bool> originConnClosed{false};
    ScriptedOrigin origin([&](ScriptedOrigin* o, int cfd) {
        std::string request;
        if (!readHttpRequest(cfd, &request)) return;
        o->Record(request);
        // Never answer; the relay has to give up and hang up on us.
        bool closed = false;
        readUntilClose(cfd, 5000, &closed);
        originConnClosed = closed;
    });
    assert(origin.ok());
    origin.Start();

    relay::ForwarderConfig cfg = configFor(origin.port());
    cfg.requestTimeoutMs = 300;
    const long timeoutsBefore = relay::monitor::Stats::Instance().GetTimeouts();
    runRelay(cfg, [](uint16_t port) {
        const auto start = steady_clock::now();
        const std::string response = fetchOnce(port, kGet);
        const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        assert(statusLine(response) == "HTTP/1.1 504 Gateway Timeout");
        assert(elapsed >= 250);
        assert(elapsed < 3000);
    });
    origin.Stop();
    assert(originConnClosed);
    assert(relay::monitor::Stats::Instance().GetTimeouts() == timeoutsBefore + 1);
    LOG_INFO << "Request timeout PASS";
}

void testConnectTimeoutIs504() {
    BlackholeListener blackhole;
    assert(blackhole.ok());

    relay::ForwarderConfig cfg = configFor(blackhole.port);
    cfg.connectTimeoutMs = 200;
    const long timeoutsBefore = relay::monitor::Stats::Instance().GetTimeouts();
    runRelay(cfg, [](uint16_t port) {
        const auto start = steady_clock::now();
        bool closed = false;
        const std::string response = fetchOnce(port, kGet, &closed);
        const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        assert(closed);
        assert(statusLine(response) == "HTTP/1.1 504 Gateway Timeout");
        assert(elapsed >= 150);
        assert(elapsed < 3000);
    });
    assert(relay::monitor::Stats::Instance().GetTimeouts() == timeoutsBefore + 1);
    LOG_INFO << "Connect timeout PASS";
}

void testBrokenOriginResponsesAre502() {
    const char* responses[] = {
        // Not HTTP at all.
        "garbage\r\n\r\n",
        // Protocol switch was never requested.
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n",
        // Closed without a single byte.
        "",
        // Head cut short.
        "HTTP/1.1 200 OK\r\nContent-Le",
    };
    for (const char* canned : responses) {
        ScriptedOrigin origin(replyWith(canned));
        assert(origin.ok());
        origin.Start();
        runRelay(configFor(origin.port()), [](uint16_t port) {
            const std::string response = fetchOnce(port, kGet);
            assert(statusLine(response) == "HTTP/1.1 502 Bad Gateway");
        });
        origin.Stop();
        assert(origin.accepted() == 1);
    }
    LOG_INFO << "Broken origin responses PASS";
}

void testTransferCodingsAreNotDropped() {
    const std::string gzipBytes("\x1f\x8b\x08\x00zz", 6);
    ScriptedOrigin origin(replyWith("HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\n\r\n" + gzipBytes));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [&](uint16_t port) {
        // HTTP/1.1 caller: re-chunked, gzip still announced.
        bool closed = false;
        const std::string response = fetchOnce(
            port, "GET /z HTTP/1.1\r\nHost: edge\r\nConnection: close\r\n\r\n", &closed);
        assert(closed);
        assert(statusLine(response) == "HTTP/1.1 200 OK");
        assert(hasHeaderLine(response, "Transfer-Encoding: gzip, chunked"));
        std::string body;
        assert(dechunk(bodyOf(response), &body));
        assert(body == gzipBytes);

        // HTTP/1.0 caller: the coding cannot be expressed, nothing is relayed.
        const std::string old = fetchOnce(port, "GET /z HTTP/1.0\r\n\r\n");
        assert(statusLine(old) == "HTTP/1.1 502 Bad Gateway");
        assert(old.find(gzipBytes) == std::string::npos);

        // Uploads keep their codings too.
        const std::string upload = fetchOnce(
            port, "POST /u HTTP/1.1\r\nHost: edge\r\nConnection: close\r\n"
                  "Transfer-Encoding: gzip, chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n");
        assert(statusLine(upload) == "HTTP/1.1 200 OK");
    });
    origin.Stop();
    const auto requests = origin.requests();
    assert(requests.size() == 3);
    assert(hasHeaderLine(requests[2], "Transfer-Encoding: gzip, chunked"));
    std::string uploaded;
    assert(dechunk(bodyOf(requests[2]), &uploaded));
    assert(uploaded == "abc");
    LOG_INFO << "Transfer-codings not dropped PASS";
}

void testOriginDiesMidBody() {
    ScriptedOrigin origin(replyWith("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nonly ten b"));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [](uint16_t port) {
        bool closed = false;
        const std::string response = fetchOnce(port, kGet, &closed);
        // The head already went out; the caller sees a truncated body and a close.
        assert(closed);
        assert(statusLine(response) == "HTTP/1.1 200 OK");
        assert(hasHeaderLine(response, "Content-Length: 100"));
        assert(bodyOf(response) == "only ten b");
    });
    origin.Stop();
    LOG_INFO << "Origin dies mid-body PASS";
}

void testOriginErrorStatusIsRelayedVerbatim() {
    ScriptedOrigin origin(replyWith("HTTP/1.1 503 Service Unavailable\r\nRetry-After: 7\r\n"
                                    "Content-Length: 4\r\n\r\nbusy"));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, kGet));
        std::string response;
        assert(readLengthResponse(fd, &response));
        assert(statusLine(response) == "HTTP/1.1 503 Service Unavailable");
        assert(hasHeaderLine(response, "Retry-After: 7"));
        assert(bodyOf(response) == "busy");

        // Origin errors are ordinary responses; the caller connection lives on.
        assert(sendAll(fd, "GET /again HTTP/1.1\r\nHost: edge\r\nConnection: close\r\n\r\n"));
        const std::string again = readUntilClose(fd);
        ::close(fd);
        assert(statusLine(again) == "HTTP/1.1 503 Service Unavailable");
    });
    origin.Stop();
    assert(origin.accepted() == 2);
    LOG_INFO << "Origin error status relayed PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::FATAL);
    testRefusedOriginIs502();
    testRequestTimeoutIs504();
    testConnectTimeoutIs504();
    testBrokenOriginResponsesAre502();
    testTransferCodingsAreNotDropped();
    testOriginDiesMidBody();
    testOriginErrorStatusIsRelayedVerbatim();
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "All origin failure tests PASS";
    return 0;
}
