#include "Discovery/DiscoveryTypes.hpp"
#include <stdexcept>
#include "Network/MacAddress.hpp"

namespace DISCOVERY {

DiscoveryTarget DiscoveryTarget::make(std::string_view mac, std::string_view ifname) {
    std::string normalized = NETWORK::normalizeMac(mac);
    if (normalized.empty()) {
        throw std::invalid_argument("not a MAC address: " + std::string(mac));
    }
    return DiscoveryTarget{std::move(normalized), std::string(ifname)};
}

const char* toString(DiscoveryState state) noexcept {
    switch (state) {
        case DiscoveryState::Running:   return "running";
        case DiscoveryState::Found:     return "found";
        case DiscoveryState::TimedOut:  return "timed_out";
        case DiscoveryState::Cancelled: return "cancelled";
        default:                        return "unknown";
    }
}

} // namespace DISCOVERY
