#pragma once
#include <memory>
#include <stop_token>
#include "Core/interfaces/IClock.hpp"
#include "Core/interfaces/ICommandRunner.hpp"
#include "Discovery/DiscoveryTypes.hpp"
#include "Discovery/HostNetworkResolver.hpp"
#include "Discovery/NeighborTable.hpp"
#include "Discovery/ProbeSweep.hpp"

namespace DISCOVERY {

/**
 * @brief Finds a freshly launched guest's IPv4 address from its MAC
 *
 * Polls the neighbor table until the MAC shows up or the deadline passes.
 * While the table has nothing, a probe sweep over the host's subnet is fired
 * every sweepInterval to make neighbors (the guest among them) answer and
 * populate the table. Without a host address on the interface no sweeps are
 * fired and only the table is polled.
 *
 * State machine: Running -> Found | TimedOut | Cancelled.
 */
class AddressDiscovery {
public:
    AddressDiscovery(std::shared_ptr<INeighborTable> neighbors,
                     std::shared_ptr<IHostNetworkResolver> resolver,
                     std::shared_ptr<IProbeTransport> transport,
                     std::shared_ptr<IClock> clock,
                     DiscoveryConfig config = {});

    // Wires the system neighbor table, resolver, ping transport and clock.
    [[nodiscard]] static AddressDiscovery withSystemDefaults(std::shared_ptr<ICommandRunner> runner,
                                                             DiscoveryConfig config = {});

    // Blocks until a terminal state. Safe to abandon via stop at any point.
    [[nodiscard]] DiscoveryResult run(const DiscoveryTarget& target, std::stop_token stop = {});

    [[nodiscard]] const DiscoveryConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<INeighborTable> neighbors;
    std::shared_ptr<IHostNetworkResolver> resolver;
    std::shared_ptr<IClock> clock;
    ProbeSweep sweep;
    DiscoveryConfig config_;
};

} // namespace DISCOVERY
