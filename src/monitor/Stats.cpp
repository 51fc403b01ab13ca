#include "relay/monitor/Stats.h"

#include <sstream>

namespace relay {
namespace monitor {

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

std::string Stats::Summary() const {
    std::ostringstream os;
    os << "active_connections=" << GetActiveConnections()
       << " requests=" << GetTotalRequests()
       << " forwarded=" << GetForwarded()
       << " origin_failures=" << GetOriginFailures()
       << " timeouts=" << GetTimeouts()
       << " aborted=" << GetAborted()
       << " bytes_in=" << GetBytesIn()
       << " bytes_out=" << GetBytesOut();
    return os.str();
}

} // namespace monitor
} // namespace relay
