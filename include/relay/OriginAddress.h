#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relay {

// The fixed internal service endpoint. Accepts "host", "host:port" or
// "http://host[:port][/]"; the port defaults to 80.
class OriginAddress {
public:
    static std::optional<OriginAddress> Parse(const std::string& text);

    OriginAddress() : port_(80) {}
    OriginAddress(const std::string& host, uint16_t port) : host_(host), port_(port) {}

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    // Value for a Host header: host, plus ":port" unless it is 80.
    std::string authority() const;
    std::string toString() const { return "http://" + authority(); }

private:
    std::string host_;
    uint16_t port_;
};

} // namespace relay
