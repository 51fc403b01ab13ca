#include "relay_harness.h"
#include "relay_test_util.h"

#include "relay/common/Logger.h"

#include <cassert>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

using namespace relaytest;
using namespace relay::common;

void testMaxConnectionsRejectsExtraCaller() {
    ScriptedOrigin origin(replyWith("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [](uint16_t port) {
        int first = connectTo(port);
        assert(first >= 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // The kernel completes the handshake; the relay hangs up at once.
        int second = connectTo(port);
        assert(second >= 0);
        bool closed = false;
        const std::string nothing = readUntilClose(second, 2000, &closed);
        ::close(second);
        assert(closed);
        assert(nothing.empty());

        // The admitted caller is served normally.
        assert(sendAll(first, "GET / HTTP/1.1\r\nHost: edge\r\nConnection: close\r\n\r\n"));
        const std::string response = readUntilClose(first);
        ::close(first);
        assert(statusLine(response) == "HTTP/1.1 200 OK");
        assert(bodyOf(response) == "ok");
    }, 0, [](relay::RelayServer* server) { server->SetMaxConnections(1); });

    origin.Stop();
    assert(origin.accepted() == 1);
    LOG_INFO << "Max connections PASS";
}

void testIdleCallerIsClosed() {
    ScriptedOrigin origin(replyWith("HTTP/1.1 204 No Content\r\n\r\n"));
    assert(origin.ok());
    origin.Start();

    runRelay(configFor(origin.port()), [](uint16_t port) {
        int fd = connectTo(port);
        assert(fd >= 0);
        // One request keeps the connection alive, then silence.
        assert(sendAll(fd, "GET / HTTP/1.1\r\nHost: edge\r\n\r\n"));
        std::string response;
        assert(readLengthResponse(fd, &response));
        assert(statusLine(response) == "HTTP/1.1 204 No Content");

        const auto start = std::chrono::steady_clock::now();
        bool closed = false;
        readUntilClose(fd, 4000, &closed);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        ::close(fd);
        assert(closed);
        assert(elapsed >= 300);
    }, 0, [](relay::RelayServer* server) { server->SetIdleTimeout(0.5); });

    origin.Stop();
    LOG_INFO << "Idle caller closed PASS";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testMaxConnectionsRejectsExtraCaller();
    testIdleCallerIsClosed();
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "All connection limit tests PASS";
    return 0;
}
