#include "Virtualization/launcher/QemuProcessLauncher.hpp"
#include <fstream>
#include <unistd.h>
#include "System/CommandRunner.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

namespace {

std::string driveArgument(const DiskConfig& disk) {
    std::string drive = "if=" + disk.bus + ",file=" + disk.source + ",format=" + disk.format;
    if (!disk.cache.empty()) drive += ",cache=" + disk.cache;
    if (!disk.discard.empty()) drive += ",discard=" + disk.discard;
    if (disk.readOnly) drive += ",readonly=on";
    return drive;
}

void appendNic(std::vector<std::string>& args, const NetworkConfig& nic, std::size_t index) {
    const std::string mac = nic.macAddress.empty() ? "" : ",mac=" + nic.macAddress;
    if (nic.type == "vmnet-bridged") {
        args.insert(args.end(), {"-nic", "vmnet-bridged,ifname=" + nic.source + ",model=" + nic.model + mac});
        return;
    }
    const std::string id = "net" + std::to_string(index);
    args.insert(args.end(), {
        "-netdev", "bridge,id=" + id + ",br=" + nic.source,
        "-device", nic.model + ",netdev=" + id + mac,
    });
}

} // namespace

QemuProcessLauncher::QemuProcessLauncher(std::shared_ptr<ICommandRunner> runner, std::shared_ptr<IClock> clock)
    : runner(std::move(runner)), clock(std::move(clock)) {}

std::vector<std::string> QemuProcessLauncher::arguments(const GuestSpec& spec) {
    std::vector<std::string> args = {
        "-accel", spec.accelerator(),
        "-machine", spec.machine,
        "-cpu", spec.cpuModel,
        "-smp", std::to_string(spec.vcpus),
        "-m", std::to_string(spec.memoryMiB),
    };

    if (!spec.firmware.code.empty()) {
        args.insert(args.end(), {"-bios", spec.firmware.code});
    }
    if (!spec.firmware.vars.empty()) {
        args.insert(args.end(), {"-drive", "if=pflash,format=raw,unit=1,file=" + spec.firmware.vars});
    }
    for (const auto& disk : spec.disks) {
        args.insert(args.end(), {"-drive", driveArgument(disk)});
    }
    for (std::size_t i = 0; i < spec.networks.size(); ++i) {
        appendNic(args, spec.networks[i], i);
    }
    if (!spec.uuid.empty()) {
        args.insert(args.end(), {"-uuid", spec.uuid});
    }
    args.insert(args.end(), {"-name", spec.name});

    if (spec.daemonize) {
        args.insert(args.end(), {"-display", "none", "-serial", "null", "-monitor", "none", "-daemonize"});
        if (!spec.pidFile.empty()) args.insert(args.end(), {"-pidfile", spec.pidFile});
        if (!spec.logFile.empty()) args.insert(args.end(), {"-D", spec.logFile});
    } else {
        args.push_back("-nographic");
    }
    return args;
}

std::pair<std::string, std::vector<std::string>> QemuProcessLauncher::commandLine(const GuestSpec& spec) {
    auto args = arguments(spec);
    if (spec.useSudo && ::geteuid() != 0) {
        args.insert(args.begin(), spec.emulator());
        return {"sudo", std::move(args)};
    }
    return {spec.emulator(), std::move(args)};
}

std::string QemuProcessLauncher::describe(const GuestSpec& spec) const {
    auto [program, args] = commandLine(spec);
    return formatCommandLine(program, args);
}

LaunchedGuest QemuProcessLauncher::launch(const GuestSpec& spec) {
    if (auto valid = spec.validate(); valid.isErr()) {
        throw SetupException(valid.unwrapErr());
    }

    auto [program, args] = commandLine(spec);
    LaunchedGuest guest{spec.name, backend(), std::nullopt, spec.pidFile, spec.logFile};

    if (!spec.daemonize) {
        LSLOG_INFO("starting {} in the foreground", spec.name);
        auto code = expectOr<LaunchException>(runner->runAttached(program, args), "qemu");
        if (code != 0) {
            throw LaunchException(spec.emulator() + " exited with status " + std::to_string(code));
        }
        return guest;
    }

    if (!spec.pidFile.empty()) {
        std::error_code ec;
        std::filesystem::remove(spec.pidFile, ec);
    }

    auto out = expectOr<LaunchException>(runner->run(program, args), "qemu");
    if (!out.ok()) {
        throw LaunchException(spec.emulator() + " failed (status " + std::to_string(out.exitCode) + "): " + out.err);
    }

    if (!spec.pidFile.empty()) {
        guest.pid = waitForPidFile(spec.pidFile);
        if (!guest.pid) {
            throw LaunchException("QEMU did not create a PID file; check " + spec.logFile);
        }
    }
    LSLOG_INFO("{} started (pid {})", spec.name, guest.pid ? std::to_string(*guest.pid) : "?");
    return guest;
}

std::optional<int> QemuProcessLauncher::waitForPidFile(const std::filesystem::path& pidFile) {
    const auto deadline = clock->now() + kPidFileTimeout;
    while (true) {
        if (auto pid = readPidFile(pidFile)) return pid;
        if (clock->now() >= deadline) return std::nullopt;
        clock->sleepFor(kPidFilePoll);
    }
}

std::optional<int> readPidFile(const std::filesystem::path& pidFile) {
    std::ifstream in(pidFile);
    int pid = 0;
    if (in >> pid && pid > 0) return pid;
    return std::nullopt;
}
