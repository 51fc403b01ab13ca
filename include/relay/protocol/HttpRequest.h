#pragma once

#include "relay/protocol/HttpHeaders.h"

#include <string>

namespace relay {
namespace network {
class Buffer;
}

namespace protocol {

class HttpRequest {
public:
    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : version_(kUnknown) {}

    // Any RFC 7230 token is accepted; the relay does not interpret methods.
    bool setMethod(const char* start, const char* end);
    void setMethod(const std::string& m) { method_ = m; }
    const std::string& method() const { return method_; }
    bool isHead() const { return method_ == "HEAD"; }

    void setTarget(const char* start, const char* end) { target_.assign(start, end); }
    void setTarget(const std::string& t) { target_ = t; }
    // Path plus query, exactly as received.
    const std::string& target() const { return target_; }
    std::string path() const;
    std::string query() const;

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const { return version_ == kHttp10 ? "HTTP/1.0" : "HTTP/1.1"; }

    void addHeader(const std::string& name, const std::string& value) { headers_.Add(name, value); }
    std::string getHeader(const std::string& name) const { return headers_.Get(name); }
    const HttpHeaders& headers() const { return headers_; }
    HttpHeaders& headers() { return headers_; }

    // Persistent-connection semantics of the caller (RFC 7230 6.3).
    bool keepAlive() const;

    // Request line and header block, terminated by the empty line.
    void appendHeadToBuffer(relay::network::Buffer* output) const;

    void swap(HttpRequest& that);

private:
    std::string method_;
    std::string target_;
    Version version_;
    HttpHeaders headers_;
};

} // namespace protocol
} // namespace relay
