#pragma once

#include "relay/OriginAddress.h"
#include "relay/network/InetAddress.h"

#include <cstddef>
#include <string>
#include <vector>

namespace relay {
namespace common {
class Config;
}

// Immutable after startup; the Forwarder keeps its own copy.
struct ForwarderConfig {
    OriginAddress origin;
    // Filled in by Resolve().
    network::InetAddress originAddr;
    bool resolved = false;

    std::vector<std::string> regions;
    std::string mode = "edge";

    // 0 disables the timeout.
    int connectTimeoutMs = 0;
    // Budget for a whole invocation, from request head to last response byte.
    int requestTimeoutMs = 0;

    // Pending bytes on either side before the opposite side stops reading.
    size_t highWaterMark = 1024 * 1024;

    // Reads [origin] and [edge]. False on an unparseable address or a
    // negative timeout.
    static bool FromConfig(const common::Config& conf, ForwarderConfig* out);

    // Resolves origin.host once; false if it does not resolve.
    bool Resolve();
};

} // namespace relay
