#pragma once

#include "relay/Forwarder.h"
#include "relay/ForwarderConfig.h"
#include "relay/RelaySessionContext.h"
#include "relay/network/EventLoop.h"
#include "relay/network/TcpServer.h"

#include <cstdint>
#include <string>

namespace relay {

// The edge entry point: accepts callers, parses their requests and hands each
// one to the Forwarder. Maps forwarding failures to edge error responses.
class RelayServer {
public:
    RelayServer(network::EventLoop* loop,
                const network::InetAddress& listenAddr,
                const ForwarderConfig& config,
                const std::string& name = "RelayServer",
                bool reusePort = false);

    // False if the listener could not be set up.
    bool Start();

    void SetThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    void SetMaxConnections(int maxConnections) { server_.SetMaxConnections(maxConnections); }
    void SetIdleTimeout(double idleTimeoutSec) { server_.SetIdleTimeout(idleTimeoutSec); }
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
        return server_.EnableTls(certPemPath, keyPemPath);
    }

    network::InetAddress listenAddress() const { return server_.listenAddress(); }
    const Forwarder& forwarder() const { return forwarder_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);

    void ProcessInbound(const network::TcpConnectionPtr& conn,
                        RelaySessionContext* ctx,
                        std::chrono::system_clock::time_point receiveTime);
    void StartSession(const network::TcpConnectionPtr& conn,
                      RelaySessionContext* ctx,
                      const protocol::HttpRequest& request);
    void OnSessionDone(const std::weak_ptr<network::TcpConnection>& weakConn,
                       const ForwardSessionPtr& session,
                       ForwardSession::Outcome outcome);
    void RejectRequest(const network::TcpConnectionPtr& conn, RelaySessionContext* ctx, int code);
    void OnPeerHalfClose(const network::TcpConnectionPtr& conn);
    void SettleHalfClosed(const network::TcpConnectionPtr& conn, RelaySessionContext* ctx);
    // Keeps a finished session alive until the current callback has unwound.
    static void ReleaseSession(network::EventLoop* loop, ForwardSessionPtr session);
    static RelaySessionContext* GetContext(const network::TcpConnectionPtr& conn);

    Forwarder forwarder_;
    // Last member: its destructor tears down connections that call back here.
    network::TcpServer server_;
};

} // namespace relay
