#include <algorithm>
#include <iostream>
#include <memory>
#include "Core/concurrency/EventDispatcher.hpp"
#include "Discovery/HostNetworkResolver.hpp"
#include "Fleet/FleetRunner.hpp"
#include "System/CommandLine.hpp"
#include "System/CommandRunner.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/launcher/LibvirtGuestLauncher.hpp"
#include "Virtualization/launcher/QemuProcessLauncher.hpp"

namespace {

int run(int argc, char** argv) {
    FLEET::FleetOptions opts;
    CommonOptions common;
    std::string workdir = opts.workdir.string();
    std::string baseQcow2 = opts.baseQcow2.string();
    std::string vars = opts.vars.string();
    std::string connectUri = HypervisorConnector::kDefaultUri;
    unsigned int timeout = static_cast<unsigned int>(opts.timeout.count());
    double pollInterval = 0.5;
    double sweepInterval = 5.0;
    bool noDaemonize = false;

    po::options_description desc("labspawn-fleet: create and launch overlay guests with sequential static IPs");
    desc.add_options()
        ("count", po::value<unsigned int>(&opts.count)->default_value(opts.count), "number of guests")
        ("start-ip", po::value<std::string>(&opts.startIp)->default_value(opts.startIp), "first static IP")
        ("name-prefix", po::value<std::string>(&opts.namePrefix)->default_value(opts.namePrefix), "names are <prefix>-1, <prefix>-2, ...")
        ("bridge", po::value<std::string>(&opts.bridge)->default_value(opts.bridge), "host interface or bridge for the guest NICs")
        ("base-qcow2", po::value<std::string>(&baseQcow2)->default_value(baseQcow2), "base image, relative to workdir")
        ("vars", po::value<std::string>(&vars)->default_value(vars), "UEFI variable store template, relative to workdir")
        ("bios", po::value<std::string>(&opts.bios), "UEFI code ROM (default: auto-detect)")
        ("smp", po::value<unsigned int>(&opts.smp)->default_value(opts.smp), "vCPUs per guest")
        ("mem", po::value<unsigned long>(&opts.memMiB)->default_value(opts.memMiB), "RAM per guest in MiB")
        ("iface", po::value<std::string>(&opts.iface)->default_value(opts.iface), "guest interface name used in netplan")
        ("prefix", po::value<unsigned short>(&opts.prefixLength)->default_value(opts.prefixLength), "CIDR prefix length")
        ("gateway", po::value<std::string>(&opts.gateway), "gateway (default: host default route, else first host)")
        ("dns", po::value<std::string>(&opts.dns)->default_value(opts.dns), "comma separated DNS servers")
        ("workdir", po::value<std::string>(&workdir)->default_value(workdir), "holds overlays/, seeds/ and instances.csv")
        ("backend", po::value<std::string>(&opts.backend)->default_value(opts.backend), "qemu or libvirt")
        ("connect", po::value<std::string>(&connectUri)->default_value(connectUri), "libvirt URI")
        ("sudo", po::bool_switch(&opts.useSudo), "run QEMU through sudo (vmnet needs root)")
        ("no-daemonize", po::bool_switch(&noDaemonize), "run QEMU in the foreground")
        ("dry-run", po::bool_switch(&opts.dryRun), "print the actions without executing them")
        ("discover", po::bool_switch(&opts.discover), "discover every guest's address after launch")
        ("timeout", po::value<unsigned int>(&timeout)->default_value(timeout), "discovery budget per guest, seconds")
        ("poll-interval", po::value<double>(&pollInterval)->default_value(pollInterval), "seconds between neighbor table lookups")
        ("sweep-interval", po::value<double>(&sweepInterval)->default_value(sweepInterval), "seconds between probe sweeps")
        ("sweep-limit", po::value<std::size_t>(&opts.sweepLimit)->default_value(opts.sweepLimit), "max probes per sweep");
    addCommonOptions(desc, common);

    po::variables_map vm;
    if (!parseCommandLine(argc, argv, desc, vm, std::cout)) return 0;
    initLogging(common);

    opts.workdir = workdir;
    opts.baseQcow2 = baseQcow2;
    opts.vars = vars;
    opts.daemonize = !noDaemonize;
    opts.timeout = std::chrono::seconds(timeout);
    opts.pollInterval = secondsToMillis(pollInterval);
    opts.sweepInterval = secondsToMillis(sweepInterval);

    auto reaper = std::make_shared<CONCURRENCY::EventDispatcher>(1);
    auto runner = std::make_shared<CommandRunner>(reaper);

    std::shared_ptr<IGuestLauncher> launcher;
    if (opts.backend == "qemu") {
        launcher = std::make_shared<QemuProcessLauncher>(runner, std::make_shared<SystemClock>());
    } else if (opts.backend == "libvirt") {
        launcher = std::make_shared<LibvirtGuestLauncher>(std::make_shared<HypervisorConnector>(connectUri));
    } else {
        throw SetupException("unknown backend '" + opts.backend + "' (qemu or libvirt)");
    }

    std::optional<NETWORK::Ipv4Address> hostGateway;
    if (opts.gateway.empty()) {
        hostGateway = DISCOVERY::queryDefaultGateway(*runner);
    }

    FLEET::FleetPlanner planner(opts);
    const auto plan = planner.plan(hostGateway);

    // One worker per guest so discoveries run side by side.
    std::shared_ptr<CONCURRENCY::EventDispatcher> workers;
    if (opts.discover) {
        workers = std::make_shared<CONCURRENCY::EventDispatcher>(std::max<std::size_t>(1, plan.guests.size()));
    }
    FLEET::FleetRunner fleet(planner, runner, launcher, workers, std::cout);
    const auto rows = fleet.run(plan);

    std::cout << "\n" << REPORTING::formatSummaryTable(rows)
              << "\nInstances file: " << plan.instancesFile.string() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const po::error& e) {
        std::cerr << "ERROR: " << e.what() << "\n(see --help)" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
