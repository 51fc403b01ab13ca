#include "relay/protocol/HttpResponse.h"
#include "relay/network/Buffer.h"

#include <cstdio>
#include <cstring>
#include <utility>

namespace relay {
namespace protocol {

const char* HttpResponse::DefaultReason(int code) {
    switch (code) {
    case 100: return "Continue";
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "";
    }
}

HttpResponse HttpResponse::MakeError(int code) {
    HttpResponse resp(true);
    resp.setStatusCode(code);
    resp.setStatusMessage(DefaultReason(code));
    resp.setContentType("text/plain");
    char body[64];
    std::snprintf(body, sizeof body, "%d %s\n", code, DefaultReason(code));
    resp.setBody(body);
    return resp;
}

void HttpResponse::appendHeadToBuffer(relay::network::Buffer* output) const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "HTTP/1.%d %d ", versionMinor_, statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }
    output->Append("\r\n");
}

void HttpResponse::appendToBuffer(relay::network::Buffer* output) const {
    HttpResponse copy(*this);
    char buf[32];
    std::snprintf(buf, sizeof buf, "%zu", body_.size());
    copy.headers_.Set("Content-Length", buf);
    copy.headers_.Set("Connection", closeConnection_ ? "close" : "keep-alive");
    copy.appendHeadToBuffer(output);
    output->Append(body_);
}

void HttpResponse::swap(HttpResponse& that) {
    std::swap(statusCode_, that.statusCode_);
    statusMessage_.swap(that.statusMessage_);
    std::swap(versionMinor_, that.versionMinor_);
    std::swap(closeConnection_, that.closeConnection_);
    headers_.swap(that.headers_);
    body_.swap(that.body_);
}

} // namespace protocol
} // namespace relay
