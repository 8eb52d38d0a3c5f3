#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>
#include "Core/concurrency/EventDispatcher.hpp"
#include "Discovery/AddressDiscovery.hpp"
#include "Network/MacAddress.hpp"
#include "Reporting/GuestReport.hpp"
#include "System/CommandLine.hpp"
#include "System/CommandRunner.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/launcher/LibvirtGuestLauncher.hpp"
#include "Virtualization/launcher/QemuProcessLauncher.hpp"
#include "Virtualization/storage/OverlayDisk.hpp"

namespace {

struct GuestOptions {
    std::string name;
    std::string baseDir{"~/gns3-qemu-B"};
    std::string ifname{"en1"};
    unsigned int cpus{4};
    unsigned long ramMiB{4096};
    unsigned int timeout{180};
    double pollInterval{0.5};
    double sweepInterval{5.0};
    std::size_t sweepLimit{64};
    std::string backend{"qemu"};
    std::string firmware;
    std::string connectUri{HypervisorConnector::kDefaultUri};
    bool sudo{false};
};

std::shared_ptr<IGuestLauncher> makeLauncher(const GuestOptions& opts,
                                             std::shared_ptr<ICommandRunner> runner) {
    if (opts.backend == "qemu") {
        return std::make_shared<QemuProcessLauncher>(std::move(runner), std::make_shared<SystemClock>());
    }
    if (opts.backend == "libvirt") {
        return std::make_shared<LibvirtGuestLauncher>(std::make_shared<HypervisorConnector>(opts.connectUri));
    }
    throw SetupException("unknown backend '" + opts.backend + "' (qemu or libvirt)");
}

int run(int argc, char** argv) {
    GuestOptions opts;
    CommonOptions common;

    po::options_description desc("labspawn-guest: launch one overlay guest and discover its IPv4 address");
    desc.add_options()
        ("name", po::value<std::string>(&opts.name)->required(), "guest name, also seeds the MAC")
        ("base-dir", po::value<std::string>(&opts.baseDir)->default_value(opts.baseDir), "tree holding base/, overlays/, logs/")
        ("ifname", po::value<std::string>(&opts.ifname)->default_value(opts.ifname), "host interface to bridge and discover on")
        ("cpus", po::value<unsigned int>(&opts.cpus)->default_value(opts.cpus), "vCPUs")
        ("ram-mb", po::value<unsigned long>(&opts.ramMiB)->default_value(opts.ramMiB), "RAM in MiB")
        ("timeout", po::value<unsigned int>(&opts.timeout)->default_value(opts.timeout), "seconds to wait for the address")
        ("poll-interval", po::value<double>(&opts.pollInterval)->default_value(opts.pollInterval), "seconds between neighbor table lookups")
        ("sweep-interval", po::value<double>(&opts.sweepInterval)->default_value(opts.sweepInterval), "seconds between probe sweeps")
        ("sweep-limit", po::value<std::size_t>(&opts.sweepLimit)->default_value(opts.sweepLimit), "max probes per sweep")
        ("backend", po::value<std::string>(&opts.backend)->default_value(opts.backend), "qemu or libvirt")
        ("firmware", po::value<std::string>(&opts.firmware), "UEFI code ROM (default: auto-detect)")
        ("connect", po::value<std::string>(&opts.connectUri)->default_value(opts.connectUri), "libvirt URI")
        ("sudo", po::bool_switch(&opts.sudo), "run QEMU through sudo (vmnet needs root)");
    addCommonOptions(desc, common);

    po::variables_map vm;
    if (!parseCommandLine(argc, argv, desc, vm, std::cout)) return 0;
    initLogging(common);

    DISCOVERY::DiscoveryConfig discovery;
    discovery.timeout = std::chrono::seconds(opts.timeout);
    discovery.pollInterval = secondsToMillis(opts.pollInterval);
    discovery.sweepInterval = secondsToMillis(opts.sweepInterval);
    discovery.sweepLimit = opts.sweepLimit;

    auto dispatcher = std::make_shared<CONCURRENCY::EventDispatcher>(1);
    auto runner = std::make_shared<CommandRunner>(dispatcher);
    auto launcher = makeLauncher(opts, runner);

    const GuestLayout layout = GuestLayout::forGuest(expandUser(opts.baseDir), opts.name);
    layout.ensureDirectories();

    GuestSpec spec;
    spec.name = opts.name;
    spec.uuid = generateGuestUuid();
    spec.vcpus = opts.cpus;
    spec.memoryMiB = opts.ramMiB;
    if (!opts.firmware.empty()) {
        spec.firmware.code = opts.firmware;
    } else if (auto detected = detectFirmware(spec.arch)) {
        spec.firmware.code = *detected;
    } else {
        throw SetupException("UEFI code ROM not found; pass --firmware");
    }
    if (!std::filesystem::exists(spec.firmware.code)) {
        throw SetupException("UEFI code ROM not found: " + spec.firmware.code);
    }

    OverlayDisk disks(runner);
    disks.create(layout.goldImage, layout.overlay);
    disks.copyVars(layout.varsFile, layout.guestVars);
    spec.firmware.vars = layout.guestVars.string();

    const auto mac = NETWORK::MacAddressGenerator::forName(opts.name).next();
    spec.disks.push_back(DiskConfig{layout.overlay.string(), "qcow2", "virtio", "none", "unmap", false});
    spec.networks.push_back(NetworkConfig{defaultNicType(), opts.ifname, "virtio-net-pci", mac.toString()});
    spec.pidFile = layout.pidFile.string();
    spec.logFile = layout.logFile.string();
    spec.useSudo = opts.sudo;

    const LaunchedGuest launched = launcher->launch(spec);

    // Ctrl-C ends discovery early; the guest keeps running.
    std::stop_source stopSource;
    boost::asio::signal_set signals(dispatcher->context(), SIGINT, SIGTERM);
    signals.async_wait([&stopSource](const boost::system::error_code& ec, int) {
        if (!ec) stopSource.request_stop();
    });

    auto finder = DISCOVERY::AddressDiscovery::withSystemDefaults(runner, discovery);
    const auto result = finder.run(DISCOVERY::DiscoveryTarget::make(mac.toString(), opts.ifname),
                                   stopSource.get_token());
    signals.cancel();
    LSLOG_DEBUG("discovery ended {} after {} sweeps", DISCOVERY::toString(result.state), result.sweeps);

    REPORTING::GuestReport report;
    report.name = opts.name;
    report.overlay = layout.overlay.string();
    report.pidFile = launched.pidFile;
    report.logFile = launched.logFile;
    report.pid = launched.pid ? launched.pid : readPidFile(layout.pidFile);
    report.mac = mac.toString();
    report.address = result.address;

    std::cout << REPORTING::toJson(report).dump(2) << std::endl;
    if (!result.found()) {
        std::cerr << "\n" << REPORTING::timeoutHints(report);
    }
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
