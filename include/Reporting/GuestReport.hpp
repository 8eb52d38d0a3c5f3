#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "Discovery/DiscoveryTypes.hpp"

namespace REPORTING {

// Everything labspawn-guest knows about the guest once discovery ended.
struct GuestReport {
    std::string name;
    std::string overlay;
    std::string pidFile;
    std::string logFile;
    std::optional<int> pid;
    std::string mac;
    std::optional<NETWORK::Ipv4Address> address;
    std::string user{"gns3"};
    std::string password{"gns3"};
    unsigned short apiPort{3080};
};

/**
 * @brief The JSON record printed on stdout
 *
 * Keys: vm, overlay, pidfile, logfile, pid, mac, ip, api_url, auth, notes.
 * pid, ip and api_url are null when unknown.
 */
[[nodiscard]] nlohmann::ordered_json toJson(const GuestReport& report);

// Hints printed on stderr when the address was not found.
[[nodiscard]] std::string timeoutHints(const GuestReport& report);

} // namespace REPORTING
