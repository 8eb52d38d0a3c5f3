#include "Fleet/FleetRunner.hpp"
#include <future>
#include <ostream>
#include "Discovery/AddressDiscovery.hpp"
#include "System/CommandRunner.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/launcher/QemuProcessLauncher.hpp"
#include "Virtualization/seed/CloudInitSeed.hpp"

namespace FLEET {

SeedNetwork seedNetworkFor(const FleetPlan& plan, const PlannedGuest& guest, const FleetOptions& options) {
    SeedNetwork net;
    net.iface = options.iface;
    net.address = guest.address;
    net.prefixLength = options.prefixLength;
    net.gateway = plan.gateway;
    net.dns = plan.dns;
    return net;
}

DISCOVERY::DiscoveryConfig discoveryConfigFor(const FleetOptions& options) {
    DISCOVERY::DiscoveryConfig config;
    config.timeout = options.timeout;
    config.pollInterval = options.pollInterval;
    config.sweepInterval = options.sweepInterval;
    config.sweepLimit = options.sweepLimit;
    return config;
}

FleetRunner::FleetRunner(FleetPlanner planner,
                         std::shared_ptr<ICommandRunner> runner,
                         std::shared_ptr<IGuestLauncher> launcher,
                         std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher,
                         std::ostream& out)
    : planner(std::move(planner)),
      runner(runner),
      launcher(std::move(launcher)),
      dispatcher(std::move(dispatcher)),
      disks(runner),
      isoBuilder(runner),
      out(out)
{
    discoverer = [runner, config = discoveryConfigFor(this->planner.options())](const DISCOVERY::DiscoveryTarget& target) {
        auto discovery = DISCOVERY::AddressDiscovery::withSystemDefaults(runner, config);
        return discovery.run(target);
    };
}

void FleetRunner::setDiscoverer(Discoverer d) {
    discoverer = std::move(d);
}

void FleetRunner::checkInputs(const FleetPlan& plan) const {
    std::error_code ec;
    if (!fs::exists(plan.baseImage, ec)) throw SetupException("Base qcow not found: " + plan.baseImage.string());
    if (!fs::exists(plan.sharedVars, ec)) throw SetupException("vars.fd not found: " + plan.sharedVars.string());
    if (plan.firmware.empty()) throw SetupException("no UEFI firmware found; pass --bios");
    if (!fs::exists(plan.firmware, ec)) throw SetupException("BIOS fd not found: " + plan.firmware.string());
}

std::vector<REPORTING::InstanceRow> FleetRunner::run(const FleetPlan& plan) {
    const auto& options = planner.options();
    checkInputs(plan);
    if (options.discover && !options.dryRun && !dispatcher) {
        throw SetupException("discovery needs a worker dispatcher");
    }

    out << "[*] Creating " << plan.guests.size() << " VM(s) starting at " << options.startIp << " ("
        << options.namePrefix << "-1.." << options.namePrefix << "-" << plan.guests.size() << ")\n"
        << "    Bridge: " << options.bridge << "  |  Base: " << plan.baseImage.string()
        << "  |  RAM: " << options.memMiB << "  |  vCPU: " << options.smp
        << "  |  Gateway: " << plan.gateway.to_string() << "\n";

    if (!options.dryRun) {
        std::error_code ec;
        fs::create_directories(plan.overlaysDir, ec);
        if (!ec) fs::create_directories(plan.seedsDir, ec);
        if (ec) throw StorageException("cannot create " + plan.seedsDir.string() + ": " + ec.message());
    }

    std::vector<REPORTING::InstanceRow> rows;
    rows.reserve(plan.guests.size());
    for (const auto& guest : plan.guests) {
        rows.push_back(options.dryRun ? describe(plan, guest) : provision(plan, guest));
    }

    if (options.dryRun) {
        out << "DRYRUN: would write " << plan.instancesFile.string() << "\n";
        return rows;
    }

    if (options.discover) {
        discoverAll(plan, rows);
    }
    REPORTING::writeInstancesCsv(plan.instancesFile, rows);
    LSLOG_INFO("wrote {}", plan.instancesFile.string());
    return rows;
}

REPORTING::InstanceRow FleetRunner::provision(const FleetPlan& plan, const PlannedGuest& guest) {
    const auto& options = planner.options();
    LSLOG_INFO("provisioning {} ({}, {})", guest.name, guest.address.to_string(), guest.mac.toString());

    if (!disks.create(plan.baseImage, guest.overlay)) {
        out << "[!] Overlay exists, skipping create: " << guest.overlay.string() << "\n";
    }
    disks.copyVars(plan.sharedVars, guest.varsCopy);

    CloudInitSeed seed(guest.name, seedNetworkFor(plan, guest, options));
    seed.writeTo(guest.seedDir);
    const std::string tool = isoBuilder.build(guest.seedDir, guest.seedIso);
    LSLOG_DEBUG("{} built by {}", guest.seedIso.string(), tool);

    const LaunchedGuest launched = launcher->launch(planner.guestSpec(plan, guest));

    REPORTING::InstanceRow row;
    row.name = guest.name;
    row.ip = guest.address.to_string();
    row.mac = guest.mac.toString();
    row.disk = guest.overlay.string();
    row.seedIso = guest.seedIso.string();
    if (launched.pid) {
        row.pid = std::to_string(*launched.pid);
    } else if (auto pid = readPidFile(guest.pidFile)) {
        row.pid = std::to_string(*pid);
    }
    return row;
}

REPORTING::InstanceRow FleetRunner::describe(const FleetPlan& plan, const PlannedGuest& guest) {
    out << "DRYRUN: " << formatCommandLine("qemu-img", OverlayDisk::createArguments(plan.baseImage, guest.overlay)) << "\n";
    out << "DRYRUN: cp " << plan.sharedVars.string() << " " << guest.varsCopy.string() << "\n";
    out << "DRYRUN: write " << guest.seedDir.filename().string()
        << " (user-data, network-config, meta-data, cfgs)\n";

    const auto tools = isoBuilder.availableTools();
    const std::string tool = tools.empty() ? SeedImageBuilder::knownTools().front() : tools.front();
    out << "DRYRUN: " << formatCommandLine(tool, SeedImageBuilder::arguments(tool, guest.seedDir, guest.seedIso)) << "\n";
    out << "DRYRUN: " << launcher->describe(planner.guestSpec(plan, guest)) << "\n";

    REPORTING::InstanceRow row;
    row.name = guest.name;
    row.ip = guest.address.to_string();
    row.mac = guest.mac.toString();
    row.disk = guest.overlay.string();
    row.seedIso = guest.seedIso.string();
    return row;
}

void FleetRunner::discoverAll(const FleetPlan& plan, std::vector<REPORTING::InstanceRow>& rows) {
    const auto& options = planner.options();
    std::vector<std::future<DISCOVERY::DiscoveryResult>> pending;
    pending.reserve(plan.guests.size());
    for (const auto& guest : plan.guests) {
        auto target = DISCOVERY::DiscoveryTarget::make(guest.mac.toString(), options.bridge);
        pending.push_back(dispatcher->submit([this, target]() { return discoverer(target); }));
    }

    for (std::size_t i = 0; i < pending.size(); ++i) {
        auto& row = rows[i];
        try {
            const auto result = pending[i].get();
            row.discovered = result.address ? result.address->to_string() : std::string{};
            row.discoveryState = DISCOVERY::toString(result.state);
            if (result.found() && *row.discovered != row.ip) {
                LSLOG_WARN("{} answers at {}, expected {}", row.name, *row.discovered, row.ip);
            }
        } catch (const std::exception& e) {
            LSLOG_ERROR("discovery for {} failed: {}", row.name, e.what());
            row.discovered = std::string{};
            row.discoveryState = "error";
        }
    }
}

} // namespace FLEET
