#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Discovery/DiscoveryTypes.hpp"

namespace DISCOVERY {

struct InterfaceAddress {
    std::optional<std::string> address;
    std::optional<std::string> mask;
};

class IHostNetworkResolver {
public:
    virtual ~IHostNetworkResolver() = default;

    // Raw address and mask text as the OS reports them; either may be absent.
    [[nodiscard]] virtual InterfaceAddress query(const std::string& ifname) = 0;

    // Snapshot used for one discovery attempt. Never throws.
    [[nodiscard]] HostNetworkContext resolve(const std::string& ifname);
};

/**
 * Asks `ip -o -4 addr show dev <if>` first and falls back to macOS
 * `ipconfig getifaddr` / `ipconfig getoption <if> subnet_mask`.
 */
class SystemHostNetworkResolver : public IHostNetworkResolver {
public:
    explicit SystemHostNetworkResolver(std::shared_ptr<ICommandRunner> runner);

    [[nodiscard]] InterfaceAddress query(const std::string& ifname) override;

private:
    std::optional<InterfaceAddress> queryIproute(const std::string& ifname);
    InterfaceAddress queryIpconfig(const std::string& ifname);

    std::shared_ptr<ICommandRunner> runner;
};

// First "inet a.b.c.d/len" of `ip -o -4 addr` output, split into address and prefix.
[[nodiscard]] std::optional<InterfaceAddress> parseIprouteAddress(std::string_view output);

// The host's default gateway from `ip route show default` or `route -n get default`.
[[nodiscard]] std::optional<NETWORK::Ipv4Address> queryDefaultGateway(ICommandRunner& runner);

} // namespace DISCOVERY
