#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <string>

namespace relay {
namespace network {
class Buffer;
}

namespace protocol {

// A response head, either parsed from the origin or generated at the edge.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k400BadRequest = 400,
        k431RequestHeaderFieldsTooLarge = 431,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), versionMinor_(1), closeConnection_(close) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setVersionMinor(int minor) { versionMinor_ = minor; }
    int versionMinor() const { return versionMinor_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { headers_.Set("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) { headers_.Add(key, value); }
    const HttpHeaders& headers() const { return headers_; }
    HttpHeaders& headers() { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Complete response with Content-Length and the body.
    void appendToBuffer(relay::network::Buffer* output) const;
    // Status line and headers as they are, then the empty line.
    void appendHeadToBuffer(relay::network::Buffer* output) const;

    void swap(HttpResponse& that);

    static const char* DefaultReason(int code);
    // Edge-generated error page; always closes the caller connection.
    static HttpResponse MakeError(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    int versionMinor_;
    bool closeConnection_;
    HttpHeaders headers_;
    std::string body_;
};

} // namespace protocol
} // namespace relay
