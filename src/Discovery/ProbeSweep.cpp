#include "Discovery/ProbeSweep.hpp"
#include <algorithm>
#include <string>
#include "System/Logger.hpp"

namespace DISCOVERY {

PingProbeTransport::PingProbeTransport(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

bool PingProbeTransport::probe(const NETWORK::Ipv4Address& target, std::chrono::milliseconds timeout) {
    return runner->spawnDetached("ping", pingArguments(target, timeout));
}

std::vector<std::string> PingProbeTransport::pingArguments(const NETWORK::Ipv4Address& target,
                                                           std::chrono::milliseconds timeout) {
#if defined(__APPLE__)
    // BSD ping takes -W in milliseconds.
    const auto wait = std::to_string(std::max<long long>(1, timeout.count()));
#else
    // iputils ping takes -W in whole seconds.
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    const auto wait = std::to_string(std::max<long long>(1, secs));
#endif
    return {"-c", "1", "-W", wait, target.to_string()};
}

std::vector<NETWORK::Ipv4Address> computeProbeWindow(const NETWORK::Ipv4Network& subnet,
                                                     const std::optional<NETWORK::Ipv4Address>& self,
                                                     std::size_t limit) {
    std::vector<NETWORK::Ipv4Address> window;
    const NETWORK::HostRange hosts(subnet.canonical());
    if (limit == 0 || hosts.empty()) return window;

    const std::uint64_t count = hosts.size();
    std::optional<std::uint64_t> index;
    if (self) index = hosts.indexOf(*self);
    const std::uint64_t center = index.value_or(count / 2);

    const std::uint64_t half = std::max<std::uint64_t>(1, std::min<std::uint64_t>(limit / 2, count / 2));
    const std::uint64_t begin = center > half ? center - half : 0;
    const std::uint64_t span = std::min<std::uint64_t>(limit, count - begin);
    const std::uint64_t end = std::min<std::uint64_t>(std::min(count, center + half), begin + span);

    window.reserve(static_cast<std::size_t>(end - begin));
    for (std::uint64_t i = begin; i < end; ++i) {
        window.push_back(hosts.at(i));
    }
    return window;
}

ProbeSweep::ProbeSweep(std::shared_ptr<IProbeTransport> transport, std::shared_ptr<IClock> clock)
    : transport(std::move(transport)), clock(std::move(clock)) {}

std::size_t ProbeSweep::fire(const HostNetworkContext& context,
                             const DiscoveryConfig& config,
                             std::stop_token stop) {
    if (!context.subnet) return 0;
    const auto window = computeProbeWindow(*context.subnet, context.selfAddress, config.sweepLimit);

    std::size_t started = 0;
    for (const auto& addr : window) {
        if (stop.stop_requested()) break;
        if (transport->probe(addr, config.probeTimeout)) ++started;
    }
    LSLOG_DEBUG("probe sweep: {}/{} probes started in {}",
                started, window.size(), context.subnet->to_string());

    // Give the answers a moment to land in the neighbor cache; the probes
    // themselves are left to finish on their own.
    clock->sleepFor(config.sweepGracePeriod, stop);
    return started;
}

} // namespace DISCOVERY
