#include "Fleet/FleetPlanner.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/seed/CloudInitSeed.hpp"

namespace FLEET {

FleetPlanner::FleetPlanner(FleetOptions options) : options_(std::move(options)) {}

NETWORK::MacAddress FleetPlanner::macFor(const std::string& name, unsigned int index) {
    return NETWORK::MacAddressGenerator::forName(name)
        .next(static_cast<std::uint8_t>((kMacOctetBase + index) & 0xff));
}

NETWORK::Ipv4Address FleetPlanner::chooseGateway(const NETWORK::Ipv4Network& network,
                                                 std::optional<NETWORK::Ipv4Address> hostGateway) const {
    if (!options_.gateway.empty()) {
        auto gw = NETWORK::parseIpv4(options_.gateway);
        if (!gw) throw SetupException("invalid gateway: " + options_.gateway);
        return *gw;
    }
    if (hostGateway && NETWORK::HostRange(network).indexOf(*hostGateway)) {
        return *hostGateway;
    }
    if (hostGateway) {
        LSLOG_DEBUG("host gateway {} is outside {}, using the first host", hostGateway->to_string(),
                    network.to_string());
    }
    return NETWORK::HostRange(network).first();
}

FleetPlan FleetPlanner::plan(std::optional<NETWORK::Ipv4Address> hostGateway) const {
    if (options_.count == 0) throw SetupException("--count must be at least 1");
    if (options_.prefixLength > 32) {
        throw SetupException("invalid prefix length: " + std::to_string(options_.prefixLength));
    }
    auto start = NETWORK::parseIpv4(options_.startIp);
    if (!start) throw SetupException("invalid start address: " + options_.startIp);

    FleetPlan plan;
    plan.network = NETWORK::Ipv4Network(*start, options_.prefixLength).canonical();
    plan.gateway = chooseGateway(plan.network, hostGateway);
    plan.dns = splitDnsList(options_.dns);

    std::error_code ec;
    plan.workdir = fs::absolute(options_.workdir, ec).lexically_normal();
    if (ec) throw SetupException("cannot resolve workdir " + options_.workdir.string() + ": " + ec.message());
    plan.overlaysDir = plan.workdir / "overlays";
    plan.seedsDir = plan.workdir / "seeds";
    plan.baseImage = (plan.workdir / options_.baseQcow2).lexically_normal();
    plan.sharedVars = (plan.workdir / options_.vars).lexically_normal();
    if (!options_.bios.empty()) {
        plan.firmware = options_.bios;
    } else if (auto detected = detectFirmware("aarch64")) {
        plan.firmware = *detected;
    }
    plan.instancesFile = plan.workdir / "instances.csv";

    const NETWORK::HostRange hosts(plan.network);
    for (unsigned int i = 1; i <= options_.count; ++i) {
        PlannedGuest g;
        g.index = i;
        g.name = options_.namePrefix + "-" + std::to_string(i);
        g.address = NETWORK::offsetAddress(*start, i - 1);
        g.mac = macFor(g.name, i);
        g.overlay = plan.overlaysDir / ("root-" + std::to_string(i) + ".qcow2");
        g.varsCopy = plan.overlaysDir / (g.name + "-vars.fd");
        g.seedDir = plan.seedsDir / ("seed-init-" + std::to_string(i));
        g.seedIso = plan.seedsDir / ("seed-" + std::to_string(i) + ".iso");
        g.pidFile = plan.workdir / (g.name + ".pid");
        g.logFile = plan.workdir / (g.name + ".log");

        if (!hosts.indexOf(g.address)) {
            LSLOG_WARN("{} gets {}, which is not a host address of {}", g.name, g.address.to_string(),
                       plan.network.to_string());
        }
        plan.guests.push_back(std::move(g));
    }
    return plan;
}

GuestSpec FleetPlanner::guestSpec(const FleetPlan& plan, const PlannedGuest& guest) const {
    GuestSpec spec;
    spec.name = guest.name;
    spec.uuid = generateGuestUuid();
    spec.vcpus = options_.smp;
    spec.memoryMiB = options_.memMiB;
    spec.firmware = FirmwareConfig{plan.firmware.string(), guest.varsCopy.string()};
    spec.disks.push_back(DiskConfig{guest.overlay.string(), "qcow2", "virtio", "none", "unmap", false});
    spec.disks.push_back(DiskConfig{guest.seedIso.string(), "raw", "virtio", "", "", true});
    spec.networks.push_back(NetworkConfig{defaultNicType(), options_.bridge, "virtio-net-pci", guest.mac.toString()});
    spec.pidFile = guest.pidFile.string();
    spec.logFile = guest.logFile.string();
    spec.daemonize = options_.daemonize;
    spec.useSudo = options_.useSudo;
    return spec;
}

} // namespace FLEET
