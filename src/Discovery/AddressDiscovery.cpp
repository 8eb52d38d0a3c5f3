#include "Discovery/AddressDiscovery.hpp"
#include <algorithm>
#include <stdexcept>
#include "Network/MacAddress.hpp"
#include "System/Logger.hpp"

namespace DISCOVERY {

AddressDiscovery::AddressDiscovery(std::shared_ptr<INeighborTable> neighbors,
                                   std::shared_ptr<IHostNetworkResolver> resolver,
                                   std::shared_ptr<IProbeTransport> transport,
                                   std::shared_ptr<IClock> clock,
                                   DiscoveryConfig config)
    : neighbors(std::move(neighbors)),
      resolver(std::move(resolver)),
      clock(clock),
      sweep(std::move(transport), std::move(clock)),
      config_(config)
{}

AddressDiscovery AddressDiscovery::withSystemDefaults(std::shared_ptr<ICommandRunner> runner,
                                                      DiscoveryConfig config) {
    return AddressDiscovery(std::make_shared<SystemNeighborTable>(runner),
                            std::make_shared<SystemHostNetworkResolver>(runner),
                            std::make_shared<PingProbeTransport>(runner),
                            std::make_shared<SystemClock>(),
                            config);
}

DiscoveryResult AddressDiscovery::run(const DiscoveryTarget& target, std::stop_token stop) {
    auto mac = NETWORK::MacAddress::parse(target.macAddress);
    if (!mac) throw std::invalid_argument("discovery target has no valid MAC: " + target.macAddress);

    const auto start = clock->now();
    const auto deadline = start + config_.timeout;

    const HostNetworkContext context = resolver->resolve(target.interfaceName);
    if (!context.canProbe()) {
        LSLOG_WARN("no IPv4 network on {}; watching the neighbor table without probing",
                   target.interfaceName);
    }

    DiscoveryResult result;
    auto finish = [&](DiscoveryState state) {
        result.state = state;
        result.elapsed = clock->now() - start;
        return result;
    };

    auto nextSweep = start + config_.initialSweepDelay;
    LSLOG_DEBUG("discovering {} on {} (timeout {}ms)",
                mac->toString(), target.interfaceName, config_.timeout.count());

    while (clock->now() < deadline) {
        if (stop.stop_requested()) return finish(DiscoveryState::Cancelled);

        if (auto addr = neighbors->lookup(*mac)) {
            result.address = *addr;
            LSLOG_INFO("{} is at {}", mac->toString(), addr->to_string());
            return finish(DiscoveryState::Found);
        }

        if (context.canProbe() && clock->now() >= nextSweep) {
            sweep.fire(context, config_, stop);
            ++result.sweeps;
            nextSweep = clock->now() + config_.sweepInterval;
        }

        const auto remaining = deadline - clock->now();
        if (remaining <= IClock::duration::zero()) break;
        const IClock::duration nap = std::min<IClock::duration>(config_.pollInterval, remaining);
        if (!clock->sleepFor(nap, stop)) return finish(DiscoveryState::Cancelled);
    }

    if (stop.stop_requested()) return finish(DiscoveryState::Cancelled);
    LSLOG_WARN("{} not seen on {} within {}ms ({} sweeps)",
               mac->toString(), target.interfaceName, config_.timeout.count(), result.sweeps);
    return finish(DiscoveryState::TimedOut);
}

} // namespace DISCOVERY
