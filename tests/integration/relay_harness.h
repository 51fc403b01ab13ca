#pragma once

// Runs a RelayServer on an ephemeral loopback port. The event loop owns the
// calling thread while `client` runs on its own thread; the loop quits when
// the client returns.

#include "relay/ForwarderConfig.h"
#include "relay/RelayServer.h"
#include "relay/network/EventLoop.h"
#include "relay/network/InetAddress.h"

#include <cassert>
#include <functional>
#include <thread>

namespace relaytest {

inline relay::ForwarderConfig configFor(uint16_t originPort) {
    relay::ForwarderConfig cfg;
    cfg.origin = relay::OriginAddress("127.0.0.1", originPort);
    const bool resolved = cfg.Resolve();
    assert(resolved);
    (void)resolved;
    return cfg;
}

inline void runRelay(const relay::ForwarderConfig& cfg,
                     const std::function<void(uint16_t relayPort)>& client,
                     int ioThreads = 0,
                     const std::function<void(relay::RelayServer*)>& setup = nullptr) {
    relay::network::EventLoop loop;
    relay::RelayServer server(&loop, relay::network::InetAddress(0, true), cfg, "TestRelay");
    server.SetThreadNum(ioThreads);
    if (setup) setup(&server);
    const bool started = server.Start();
    assert(started);
    (void)started;
    const uint16_t port = server.listenAddress().toPort();
    assert(port != 0);

    std::thread t([&]() {
        client(port);
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });
    loop.Loop();
    t.join();
}

} // namespace relaytest
