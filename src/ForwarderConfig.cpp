#include "relay/ForwarderConfig.h"
#include "relay/common/Config.h"
#include "relay/common/Logger.h"

namespace relay {

bool ForwarderConfig::FromConfig(const common::Config& conf, ForwarderConfig* out) {
    ForwarderConfig cfg;

    const std::string address = conf.GetString("origin", "address", "http://localhost:8501");
    auto origin = OriginAddress::Parse(address);
    if (!origin) {
        LOG_ERROR << "[origin] address is invalid: '" << address << "'";
        return false;
    }
    cfg.origin = *origin;

    cfg.connectTimeoutMs = conf.GetInt("origin", "connect_timeout_ms", 0);
    cfg.requestTimeoutMs = conf.GetInt("origin", "request_timeout_ms", 0);
    if (cfg.connectTimeoutMs < 0 || cfg.requestTimeoutMs < 0) {
        LOG_ERROR << "[origin] timeouts must be >= 0";
        return false;
    }
    const int hwm = conf.GetInt("origin", "high_water_mark", 1024 * 1024);
    if (hwm <= 0) {
        LOG_ERROR << "[origin] high_water_mark must be > 0";
        return false;
    }
    cfg.highWaterMark = static_cast<size_t>(hwm);

    cfg.regions = conf.GetList("edge", "regions");
    if (cfg.regions.empty()) cfg.regions.push_back("iad1");
    cfg.mode = conf.GetString("edge", "mode", "edge");

    *out = cfg;
    return true;
}

bool ForwarderConfig::Resolve() {
    auto addr = network::InetAddress::Resolve(origin.host(), origin.port());
    if (!addr) {
        LOG_ERROR << "cannot resolve origin host " << origin.host();
        resolved = false;
        return false;
    }
    originAddr = *addr;
    resolved = true;
    return true;
}

} // namespace relay
