#include "relay/protocol/HopByHop.h"

#include <vector>

namespace relay {
namespace protocol {

namespace {

const char* const kHopByHop[] = {
    "Connection",
    "Keep-Alive",
    "Proxy-Connection",
    "Proxy-Authenticate",
    "Proxy-Authorization",
    "TE",
    "Trailer",
    "Transfer-Encoding",
    "Upgrade",
};

} // namespace

bool IsHopByHopHeader(const std::string& name) {
    for (const char* h : kHopByHop) {
        if (HttpHeaders::IEquals(name, h)) return true;
    }
    return false;
}

HttpHeaders FilterHopByHop(const HttpHeaders& headers) {
    std::vector<std::string> named;
    for (const auto& value : headers.GetAll("Connection")) {
        for (auto& token : HttpHeaders::SplitTokens(value)) {
            named.push_back(std::move(token));
        }
    }

    HttpHeaders out;
    for (const auto& field : headers) {
        if (IsHopByHopHeader(field.first)) continue;
        bool listed = false;
        for (const auto& n : named) {
            if (HttpHeaders::IEquals(field.first, n)) {
                listed = true;
                break;
            }
        }
        if (!listed) out.Add(field.first, field.second);
    }
    return out;
}

std::vector<std::string> OuterTransferCodings(const HttpHeaders& headers) {
    std::vector<std::string> codings;
    for (const auto& value : headers.GetAll("Transfer-Encoding")) {
        for (auto& c : HttpHeaders::SplitTokens(value)) codings.push_back(std::move(c));
    }
    if (!codings.empty() && HttpHeaders::IEquals(codings.back(), "chunked")) {
        codings.pop_back();
    }
    return codings;
}

} // namespace protocol
} // namespace relay
