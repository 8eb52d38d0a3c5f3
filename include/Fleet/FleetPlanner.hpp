#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "Network/Ipv4.hpp"
#include "Network/MacAddress.hpp"
#include "Virtualization/vmm/GuestConfig.hpp"

namespace FLEET {

namespace fs = std::filesystem;

struct FleetOptions {
    unsigned int count{3};
    std::string startIp{"10.193.80.101"};
    std::string namePrefix{"overlay"};
    std::string bridge{"en1"};
    fs::path baseQcow2{"base/root.qcow2"};
    fs::path vars{"base/vars.fd"};
    std::string bios;                    // empty: detectFirmware()
    unsigned int smp{4};
    unsigned long memMiB{4096};
    std::string iface{"enp0s1"};
    unsigned short prefixLength{24};
    std::string gateway;                 // empty: automatic
    std::string dns{"10.193.80.64,8.8.8.8"};
    fs::path workdir{"."};
    std::string backend{"qemu"};
    bool daemonize{true};
    bool useSudo{false};
    bool dryRun{false};
    bool discover{false};
    std::chrono::seconds timeout{180};
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds sweepInterval{5000};
    std::size_t sweepLimit{64};
};

struct PlannedGuest {
    unsigned int index{0};               // 1-based
    std::string name;
    NETWORK::Ipv4Address address;
    NETWORK::MacAddress mac;
    fs::path overlay;
    fs::path varsCopy;
    fs::path seedDir;
    fs::path seedIso;
    fs::path pidFile;
    fs::path logFile;
};

struct FleetPlan {
    NETWORK::Ipv4Network network;
    NETWORK::Ipv4Address gateway;
    std::vector<std::string> dns;
    fs::path workdir;
    fs::path baseImage;
    fs::path sharedVars;
    fs::path firmware;
    fs::path overlaysDir;
    fs::path seedsDir;
    fs::path instancesFile;
    std::vector<PlannedGuest> guests;
};

/**
 * @brief Turns fleet options into per-guest names, addresses and paths
 *
 * Guest i (1-based) gets <prefix>-i, start + (i - 1), a name-seeded MAC with
 * the last octet pinned to 50 + i, and its own overlay, NVRAM copy and seed.
 * Planning touches no files.
 */
class FleetPlanner {
public:
    static constexpr std::uint8_t kMacOctetBase = 50;

    explicit FleetPlanner(FleetOptions options);

    /**
     * @param hostGateway Host default route, used when no gateway was given
     *        and it lies inside the guests' network
     * @throws SetupException for unusable options
     */
    [[nodiscard]] FleetPlan plan(std::optional<NETWORK::Ipv4Address> hostGateway = std::nullopt) const;

    [[nodiscard]] GuestSpec guestSpec(const FleetPlan& plan, const PlannedGuest& guest) const;

    [[nodiscard]] const FleetOptions& options() const noexcept { return options_; }

    [[nodiscard]] static NETWORK::MacAddress macFor(const std::string& name, unsigned int index);

private:
    [[nodiscard]] NETWORK::Ipv4Address chooseGateway(const NETWORK::Ipv4Network& network,
                                                     std::optional<NETWORK::Ipv4Address> hostGateway) const;

    FleetOptions options_;
};

} // namespace FLEET
