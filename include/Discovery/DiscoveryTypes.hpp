#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "Network/Ipv4.hpp"

namespace DISCOVERY {

using namespace std::chrono_literals;

// What the launcher hands over once the guest process is up.
struct DiscoveryTarget {
    std::string macAddress;     // lowercase, colon separated
    std::string interfaceName;

    // Normalizes mac; throws std::invalid_argument if it is not a MAC address.
    [[nodiscard]] static DiscoveryTarget make(std::string_view mac, std::string_view ifname);
};

struct HostNetworkContext {
    std::optional<NETWORK::Ipv4Address> selfAddress;
    std::optional<NETWORK::Ipv4Network> subnet;

    [[nodiscard]] bool canProbe() const noexcept { return selfAddress.has_value() && subnet.has_value(); }
};

enum class DiscoveryState { Running, Found, TimedOut, Cancelled };

[[nodiscard]] const char* toString(DiscoveryState state) noexcept;

struct DiscoveryResult {
    DiscoveryState state{DiscoveryState::Running};
    std::optional<NETWORK::Ipv4Address> address;
    std::chrono::steady_clock::duration elapsed{};
    std::size_t sweeps{0};

    [[nodiscard]] bool found() const noexcept { return state == DiscoveryState::Found && address.has_value(); }
};

struct DiscoveryConfig {
    std::chrono::milliseconds timeout{180s};
    std::chrono::milliseconds pollInterval{500ms};
    std::chrono::milliseconds sweepInterval{5s};
    std::chrono::milliseconds initialSweepDelay{0ms};
    std::chrono::milliseconds sweepGracePeriod{500ms};
    std::chrono::milliseconds probeTimeout{1s};
    std::size_t sweepLimit{64};
};

} // namespace DISCOVERY
