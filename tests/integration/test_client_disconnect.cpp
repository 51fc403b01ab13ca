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

using namespace relaytest;
using namespace relay::common;

namespace {

bool waitFor(const std::atomic<bool>& flag, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!flag.load()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// Origin that answers after a pause, with the request path as the body, so
// the caller's FIN always reaches the relay before the response does.
ScriptedOrigin::Handler slowEchoPath(int delayMs) {
    return [delayMs](ScriptedOrigin* o, int cfd) {
        std::string request;
        if (!readHttpRequest(cfd, &request)) return;
        o->Record(request);
        const size_t sp = request.find(' ');
        const std::string path = request.substr(sp + 1, request.find(' ', sp + 1) - sp - 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        sendAll(cfd, "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(path.size()) +
                         "\r\n\r\n" + path);
        readUntilClose(cfd, 1000);
    };
}

} // namespace

void testDisconnectMidResponseClosesOrigin() {
    std::atomic<bool> originSawClose{false};
    ScriptedOrigin origin([&](ScriptedOrigin* o, int cfd) {
        std::string request;
        if (!readHttpRequest(cfd, &request)) return;
        o->Record(request);
        sendAll(cfd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nfirst\r\n");
        // Keep streaming until the relay hangs up. A FIN from the caller reads
        // like a half-close; the relay learns the caller is gone when a write
        // towards it fails.
        bool closed = false;
        for (int i = 0; i < 100 && !closed; ++i) {
            if (pollReadable(cfd, 50)) {
                char c;
                closed = ::recv(cfd, &c, 1, 0) <= 0;
            } else if (!sendAll(cfd, "4\r\ntick\r\n")) {
                closed = true;
            }
        }
        originSawClose = closed;
    });
    assert(origin.ok());
    origin.Start();

    const long abortedBefore = relay::monitor::Stats::Instance().GetAborted();
    runRelay(configFor(origin.port()), [&](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "GET /events HTTP/1.1\r\nHost: edge\r\n\r\n"));
        const std::string partial = readUntilContains(fd, "first");
        assert(partial.find("first") != std::string::npos);
        ::close(fd);
        assert(waitFor(originSawClose, 3000));
    });
    origin.Stop();
    assert(originSawClose);
    assert(relay::monitor::Stats::Instance().GetAborted() == abortedBefore + 1);
    LOG_INFO << "Disconnect mid-response PASS";
}

void testDisconnectBeforeResponseClosesOrigin() {
    std::atomic<bool> originGotRequest{false};
    std::atomic<bool> originSawClose{false};
    ScriptedOrigin origin([&](ScriptedOrigin* o, int cfd) {
        std::string request;
        if (!readHttpRequest(cfd, &request)) return;
        o->Record(request);
        originGotRequest = true;
        bool closed = false;
        readUntilClose(cfd, 5000, &closed);
        originSawClose = closed;
    });
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [&](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "POST /slow HTTP/1.1\r\nHost: edge\r\nContent-Length: 3\r\n\r\nabc"));
        assert(waitFor(originGotRequest, 3000));
        abortiveClose(fd);
        assert(waitFor(originSawClose, 3000));
    });
    origin.Stop();
    assert(originSawClose);
    LOG_INFO << "Disconnect before response PASS";
}

void testDisconnectDuringUploadClosesOrigin() {
    std::atomic<bool> originSawClose{false};
    std::atomic<bool> originGotPiece{false};
    ScriptedOrigin origin([&](ScriptedOrigin*, int cfd) {
        const std::string head = readUntilContains(cfd, "piece");
        originGotPiece = head.find("piece") != std::string::npos;
        bool closed = false;
        readUntilClose(cfd, 5000, &closed);
        originSawClose = closed;
    });
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [&](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "PUT /blob HTTP/1.1\r\nHost: edge\r\nContent-Length: 1000\r\n\r\npiece"));
        assert(waitFor(originGotPiece, 3000));
        ::close(fd);
        assert(waitFor(originSawClose, 3000));
    });
    origin.Stop();
    LOG_INFO << "Disconnect during upload PASS";
}

void testHalfClosedCallerStillGetsResponse() {
    ScriptedOrigin origin(slowEchoPath(100));
    assert(origin.ok());
    origin.Start();

    const long abortedBefore = relay::monitor::Stats::Instance().GetAborted();
    runRelay(configFor(origin.port()), [](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "GET /half HTTP/1.0\r\n\r\n"));
        assert(::shutdown(fd, SHUT_WR) == 0);
        bool closed = false;
        const std::string response = readUntilClose(fd, 5000, &closed);
        ::close(fd);
        assert(closed);
        assert(statusLine(response) == "HTTP/1.1 200 OK");
        assert(bodyOf(response) == "/half");

        // Request body complete before the FIN.
        fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "POST /upload HTTP/1.1\r\nHost: edge\r\nContent-Length: 3\r\n\r\nabc"));
        assert(::shutdown(fd, SHUT_WR) == 0);
        const std::string posted = readUntilClose(fd, 5000, &closed);
        ::close(fd);
        assert(closed);
        assert(statusLine(posted) == "HTTP/1.1 200 OK");
        assert(bodyOf(posted) == "/upload");
    });
    origin.Stop();
    const auto requests = origin.requests();
    assert(requests.size() == 2);
    assert(requests[1].find("\r\n\r\nabc") != std::string::npos);
    assert(relay::monitor::Stats::Instance().GetAborted() == abortedBefore);
    LOG_INFO << "Half-closed caller PASS";
}

void testHalfClosedPipelineIsDrained() {
    ScriptedOrigin origin(slowEchoPath(50));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "GET /one HTTP/1.1\r\nHost: edge\r\n\r\n"
                           "GET /two HTTP/1.1\r\nHost: edge\r\n\r\n"));
        assert(::shutdown(fd, SHUT_WR) == 0);
        bool closed = false;
        const std::string both = readUntilClose(fd, 5000, &closed);
        ::close(fd);
        assert(closed);
        const size_t first = both.find("\r\n\r\n/one");
        const size_t second = both.find("\r\n\r\n/two");
        assert(first != std::string::npos);
        assert(second != std::string::npos);
        assert(first < second);
    });
    origin.Stop();
    assert(origin.requests().size() == 2);
    LOG_INFO << "Half-closed pipeline PASS";
}

void testHalfCloseMidUploadAborts() {
    std::atomic<bool> originSawClose{false};
    ScriptedOrigin origin([&](ScriptedOrigin*, int cfd) {
        readUntilContains(cfd, "part");
        bool closed = false;
        readUntilClose(cfd, 5000, &closed);
        originSawClose = closed;
    });
    assert(origin.ok());
    origin.Start();

    const long abortedBefore = relay::monitor::Stats::Instance().GetAborted();
    runRelay(configFor(origin.port()), [&](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        assert(sendAll(fd, "PUT /blob HTTP/1.1\r\nHost: edge\r\nContent-Length: 100\r\n\r\npart"));
        assert(::shutdown(fd, SHUT_WR) == 0);
        // The body can never complete; no response, just a close.
        bool closed = false;
        const std::string response = readUntilClose(fd, 5000, &closed);
        ::close(fd);
        assert(closed);
        assert(response.empty());
        assert(waitFor(originSawClose, 3000));
    });
    origin.Stop();
    assert(relay::monitor::Stats::Instance().GetAborted() == abortedBefore + 1);
    LOG_INFO << "Half-close mid-upload PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testDisconnectMidResponseClosesOrigin();
    testDisconnectBeforeResponseClosesOrigin();
    testDisconnectDuringUploadClosesOrigin();
    testHalfClosedCallerStillGetsResponse();
    testHalfClosedPipelineIsDrained();
    testHalfCloseMidUploadAborts();
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "All caller disconnect tests PASS";
    return 0;
}
