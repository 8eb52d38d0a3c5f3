#include "Virtualization/storage/OverlayDisk.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

GuestLayout GuestLayout::forGuest(const fs::path& baseDir, const std::string& name) {
    GuestLayout layout;
    layout.baseDir = baseDir;
    layout.goldImage = baseDir / "base" / "gold.qcow2";
    layout.varsFile = baseDir / "base" / "vars.fd";
    layout.overlay = baseDir / "overlays" / (name + ".qcow2");
    layout.guestVars = baseDir / "overlays" / (name + "-vars.fd");
    layout.pidFile = baseDir / "overlays" / (name + ".pid");
    layout.logFile = baseDir / "logs" / (name + ".log");
    return layout;
}

void GuestLayout::ensureDirectories() const {
    for (const auto& dir : {baseDir / "base", baseDir / "overlays", baseDir / "logs"}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw StorageException("cannot create " + dir.string() + ": " + ec.message());
    }
}

OverlayDisk::OverlayDisk(std::shared_ptr<ICommandRunner> runner) : runner(std::move(runner)) {}

bool OverlayDisk::create(const fs::path& base, const fs::path& overlay) {
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        throw SetupException("Base image not found: " + base.string());
    }
    if (fs::exists(overlay, ec)) {
        LSLOG_INFO("Overlay exists, reusing: {}", overlay.string());
        return false;
    }

    const auto res = expectOr<StorageException>(runner->run("qemu-img", createArguments(base, overlay)), "qemu-img");
    if (!res.ok()) {
        throw StorageException("qemu-img create failed for " + overlay.string() + ": " + res.err);
    }
    LSLOG_INFO("Created overlay {} (backing {})", overlay.string(), base.string());
    return true;
}

bool OverlayDisk::copyVars(const fs::path& sharedVars, const fs::path& guestVars) {
    std::error_code ec;
    if (!fs::exists(sharedVars, ec)) {
        throw SetupException("vars.fd not found: " + sharedVars.string());
    }
    if (fs::exists(guestVars, ec)) {
        LSLOG_INFO("Guest vars exist, reusing: {}", guestVars.string());
        return false;
    }
    fs::copy_file(sharedVars, guestVars, ec);
    if (ec) throw StorageException("cannot copy " + sharedVars.string() + ": " + ec.message());
    return true;
}

std::vector<std::string> OverlayDisk::createArguments(const fs::path& base, const fs::path& overlay) {
    return {"create", "-f", "qcow2", "-F", "qcow2", "-b", base.string(), overlay.string()};
}
