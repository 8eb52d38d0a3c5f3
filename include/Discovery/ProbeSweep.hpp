#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>
#include "Core/interfaces/IClock.hpp"
#include "Core/interfaces/ICommandRunner.hpp"
#include "Discovery/DiscoveryTypes.hpp"

namespace DISCOVERY {

/**
 * @brief Sends one reachability probe and returns without waiting for it
 */
class IProbeTransport {
public:
    virtual ~IProbeTransport() = default;

    // false only if the probe could not be started; the answer is never observed.
    virtual bool probe(const NETWORK::Ipv4Address& target, std::chrono::milliseconds timeout) = 0;
};

// One `ping -c 1` per target, spawned detached through the command runner.
class PingProbeTransport : public IProbeTransport {
public:
    explicit PingProbeTransport(std::shared_ptr<ICommandRunner> runner);

    bool probe(const NETWORK::Ipv4Address& target, std::chrono::milliseconds timeout) override;

    [[nodiscard]] static std::vector<std::string> pingArguments(const NETWORK::Ipv4Address& target,
                                                                std::chrono::milliseconds timeout);

private:
    std::shared_ptr<ICommandRunner> runner;
};

/**
 * @brief Candidate addresses around self within subnet's host range
 *
 * Half-width is max(1, min(limit / 2, hosts / 2)); the slice is clamped to the
 * host range and then cut to limit. If self is not one of the subnet's hosts
 * the window centers on the middle of the range.
 */
[[nodiscard]] std::vector<NETWORK::Ipv4Address> computeProbeWindow(
    const NETWORK::Ipv4Network& subnet,
    const std::optional<NETWORK::Ipv4Address>& self,
    std::size_t limit);

class ProbeSweep {
public:
    ProbeSweep(std::shared_ptr<IProbeTransport> transport, std::shared_ptr<IClock> clock);

    /**
     * @brief Fires one probe per window address, then waits the grace period
     * @return Number of probes that were started
     */
    std::size_t fire(const HostNetworkContext& context,
                     const DiscoveryConfig& config,
                     std::stop_token stop = {});

private:
    std::shared_ptr<IProbeTransport> transport;
    std::shared_ptr<IClock> clock;
};

} // namespace DISCOVERY
