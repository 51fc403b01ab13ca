#include "relay/protocol/HttpRequest.h"
#include "relay/network/Buffer.h"

namespace relay {
namespace protocol {

bool HttpRequest::setMethod(const char* start, const char* end) {
    if (!HttpHeaders::IsToken(start, end)) return false;
    method_.assign(start, end);
    return true;
}

std::string HttpRequest::path() const {
    const size_t q = target_.find('?');
    return q == std::string::npos ? target_ : target_.substr(0, q);
}

std::string HttpRequest::query() const {
    const size_t q = target_.find('?');
    return q == std::string::npos ? std::string() : target_.substr(q);
}

bool HttpRequest::keepAlive() const {
    if (headers_.HasToken("Connection", "close")) return false;
    if (version_ == kHttp10) return headers_.HasToken("Connection", "keep-alive");
    return true;
}

void HttpRequest::appendHeadToBuffer(relay::network::Buffer* output) const {
    output->Append(method_);
    output->Append(" ");
    output->Append(target_);
    output->Append(" ");
    output->Append(versionString());
    output->Append("\r\n");
    for (const auto& field : headers_) {
        output->Append(field.first);
        output->Append(": ");
        output->Append(field.second);
        output->Append("\r\n");
    }
    output->Append("\r\n");
}

void HttpRequest::swap(HttpRequest& that) {
    method_.swap(that.method_);
    target_.swap(that.target_);
    std::swap(version_, that.version_);
    headers_.swap(that.headers_);
}

} // namespace protocol
} // namespace relay
