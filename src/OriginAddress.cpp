#include "relay/OriginAddress.h"
#include "relay/common/Logger.h"

#include <cctype>

namespace relay {

namespace {

bool StartsWithNoCase(const std::string& s, const char* prefix) {
    size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

bool IsHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

} // namespace

std::optional<OriginAddress> OriginAddress::Parse(const std::string& text) {
    std::string rest = text;
    while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.back()))) rest.pop_back();
    size_t lead = 0;
    while (lead < rest.size() && std::isspace(static_cast<unsigned char>(rest[lead]))) ++lead;
    rest.erase(0, lead);

    if (StartsWithNoCase(rest, "http://")) {
        rest.erase(0, 7);
    } else if (rest.find("://") != std::string::npos) {
        LOG_ERROR << "origin address: only plain http is supported: " << text;
        return std::nullopt;
    }

    const size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        if (slash + 1 != rest.size()) {
            LOG_ERROR << "origin address: a path is not allowed: " << text;
            return std::nullopt;
        }
        rest.erase(slash);
    }

    std::string host = rest;
    uint16_t port = 80;
    const size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        host = rest.substr(0, colon);
        const std::string p = rest.substr(colon + 1);
        if (p.empty() || p.size() > 5) {
            LOG_ERROR << "origin address: bad port in " << text;
            return std::nullopt;
        }
        unsigned long v = 0;
        for (char c : p) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                LOG_ERROR << "origin address: bad port in " << text;
                return std::nullopt;
            }
            v = v * 10 + static_cast<unsigned long>(c - '0');
        }
        if (v == 0 || v > 65535) {
            LOG_ERROR << "origin address: port out of range in " << text;
            return std::nullopt;
        }
        port = static_cast<uint16_t>(v);
    }

    if (host.empty()) {
        LOG_ERROR << "origin address: missing host in " << text;
        return std::nullopt;
    }
    for (char c : host) {
        if (!IsHostChar(static_cast<unsigned char>(c))) {
            LOG_ERROR << "origin address: bad host in " << text;
            return std::nullopt;
        }
    }
    return OriginAddress(host, port);
}

std::string OriginAddress::authority() const {
    if (port_ == 80) return host_;
    return host_ + ":" + std::to_string(port_);
}

} // namespace relay
