#pragma once

#include "relay/ForwarderConfig.h"
#include "relay/common/noncopyable.h"
#include "relay/network/Buffer.h"
#include "relay/network/TcpClient.h"
#include "relay/network/TcpConnection.h"
#include "relay/network/Timer.h"
#include "relay/protocol/HttpContext.h"
#include "relay/protocol/HttpRequest.h"
#include "relay/protocol/HttpResponseContext.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace relay {

class ForwardSession;
using ForwardSessionPtr = std::shared_ptr<ForwardSession>;

// One invocation: one inbound request, one outbound connection to the origin,
// one relayed response. Runs entirely on the caller connection's loop.
class ForwardSession : public std::enable_shared_from_this<ForwardSession>,
                       relay::common::noncopyable {
public:
    enum Outcome {
        kCompleted,
        kConnectFailed,
        kTimedOut,
        kOriginError,
    };

    // Fired exactly once unless Abort() comes first. The receiver must not
    // destroy the session synchronously.
    using DoneCallback = std::function<void(const ForwardSessionPtr&, Outcome)>;

    ForwardSession(const ForwarderConfig& config,
                   const protocol::HttpRequest& request,
                   protocol::HttpContext::BodyFraming requestFraming,
                   const network::TcpConnectionPtr& clientConn,
                   const std::string& name);
    ~ForwardSession();

    void SetDoneCallback(const DoneCallback& cb) { doneCallback_ = cb; }

    // Starts the connect attempt and the timers; the outbound head is queued.
    void Start();
    // Request body bytes as parsed from the caller (de-chunked).
    void SendRequestBody(const char* data, size_t len);
    // The inbound request has been read completely.
    void FinishRequestBody();
    // Caller went away: drop the origin connection and timers, no callback.
    void Abort();

    const std::string& name() const { return name_; }
    network::EventLoop* loop() const { return loop_; }
    bool finished() const { return finished_; }
    // True once any byte of the final response went to the caller.
    bool responseStarted() const { return responseStarted_; }
    // The caller connection may carry another request after this one.
    bool keepAlive() const { return keepAlive_; }
    int status() const { return status_; }
    size_t responseBodyBytes() const { return responseBodyBytes_; }
    std::chrono::steady_clock::time_point startTime() const { return startTime_; }

    static const char* OutcomeName(Outcome o);

private:
    void OnOriginConnection(const network::TcpConnectionPtr& conn);
    void OnOriginMessage(const network::TcpConnectionPtr& conn,
                         network::Buffer* buf,
                         std::chrono::system_clock::time_point receiveTime);
    void OnConnectFailed(int err);
    void OnConnectTimeout();
    void OnRequestTimeout();

    void OnInterimHead(const protocol::HttpResponse& interim);
    void OnResponseHead(const protocol::HttpResponse& head);
    void OnResponseBody(const char* data, size_t len);

    void SendToOrigin(const char* data, size_t len);
    void SendToClient(const char* data, size_t len);
    void Complete();
    void Fail(Outcome outcome, const std::string& reason);
    void Release();

    const ForwarderConfig config_;
    const std::string name_;
    network::EventLoop* loop_;
    std::weak_ptr<network::TcpConnection> clientConn_;
    const protocol::HttpRequest::Version clientVersion_;
    const bool clientWantsKeepAlive_;
    const bool requestChunked_;

    network::TcpClient originClient_;
    network::TcpConnectionPtr originConn_;
    network::Timer connectTimer_;
    network::Timer requestTimer_;
    DoneCallback doneCallback_;

    // Outbound bytes queued while the connection is being established.
    network::Buffer pending_;
    bool clientReadPaused_;
    bool requestBodyDone_;

    protocol::HttpResponseContext response_;
    bool chunkToClient_;
    bool responseStarted_;
    bool keepAlive_;
    int status_;
    size_t responseBodyBytes_;

    bool finished_;
    std::chrono::steady_clock::time_point startTime_;
};

} // namespace relay
