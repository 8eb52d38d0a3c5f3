#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Network/Ipv4.hpp"
#include "Network/MacAddress.hpp"

namespace DISCOVERY {

/**
 * @brief Read-only view of the host's IPv4 neighbor (ARP) cache
 */
class INeighborTable {
public:
    virtual ~INeighborTable() = default;

    // First IPv4 address currently mapped to mac; nullopt when there is none.
    [[nodiscard]] virtual std::optional<NETWORK::Ipv4Address> lookup(const NETWORK::MacAddress& mac) = 0;
};

/**
 * Reads `ip -4 neigh show`, then `arp -an`, then /proc/net/arp, and stops at
 * the first source that produces any text. Failures of all three read as an
 * empty table.
 */
class SystemNeighborTable : public INeighborTable {
public:
    explicit SystemNeighborTable(std::shared_ptr<ICommandRunner> runner,
                                 std::string procPath = "/proc/net/arp");

    [[nodiscard]] std::optional<NETWORK::Ipv4Address> lookup(const NETWORK::MacAddress& mac) override;

    // Raw table text from the first source that answers.
    [[nodiscard]] std::string snapshot();

private:
    std::shared_ptr<ICommandRunner> runner;
    std::string procPath;
};

struct NeighborEntry {
    NETWORK::Ipv4Address address;
    NETWORK::MacAddress mac;
};

/**
 * @brief Extracts the address/MAC pair from one table line
 *
 * Understands the three common layouts:
 *   10.0.0.5 dev br0 lladdr 52:54:00:aa:bb:cc REACHABLE
 *   ? (10.0.0.5) at 52:54:00:aa:bb:cc on en1 ifscope [ethernet]
 *   10.0.0.5  0x1  0x2  52:54:00:aa:bb:cc  *  br0
 * Lines without both an IPv4 token and a MAC token yield nullopt.
 */
[[nodiscard]] std::optional<NeighborEntry> parseNeighborLine(std::string_view line);

[[nodiscard]] std::optional<NETWORK::Ipv4Address> findAddressByMac(std::string_view table,
                                                                   const NETWORK::MacAddress& mac);

} // namespace DISCOVERY
