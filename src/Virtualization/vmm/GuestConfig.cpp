#include "Virtualization/vmm/GuestConfig.hpp"
#include <filesystem>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "Network/MacAddress.hpp"

std::string GuestSpec::accelerator() const {
    return accel.empty() ? defaultAccelerator() : accel;
}

Result<void> GuestSpec::validate() const {
    if (name.empty()) return Err("guest name is empty");
    if (memoryMiB == 0 || vcpus == 0) return Err("guest '" + name + "' needs at least one vCPU and some memory");
    if (disks.empty()) return Err("guest '" + name + "' has no disk");
    for (const auto& d : disks) {
        if (d.source.empty()) return Err("guest '" + name + "' has a disk without a source");
    }
    for (const auto& n : networks) {
        if (n.source.empty()) return Err("guest '" + name + "' has a NIC without a host interface");
        if (!n.macAddress.empty() && !NETWORK::MacAddress::parse(n.macAddress)) {
            return Err("guest '" + name + "' has an invalid MAC: " + n.macAddress);
        }
    }
    return {};
}

std::string generateGuestUuid() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string defaultAccelerator() {
#if defined(__APPLE__)
    return "hvf";
#else
    return "kvm";
#endif
}

std::string defaultNicType() {
#if defined(__APPLE__)
    return "vmnet-bridged";
#else
    return "bridge";
#endif
}

std::vector<std::string> firmwareSearchPaths(const std::string& arch) {
    if (arch == "aarch64") {
        return {
            "/opt/homebrew/share/qemu/edk2-aarch64-code.fd",
            "/usr/local/share/qemu/edk2-aarch64-code.fd",
            "/usr/share/AAVMF/AAVMF_CODE.fd",
            "/usr/share/edk2/aarch64/QEMU_EFI.fd",
            "/usr/share/qemu-efi-aarch64/QEMU_EFI.fd",
            "/usr/share/edk2-ovmf/aarch64/QEMU_CODE.fd",
        };
    }
    return {
        "/opt/homebrew/share/qemu/edk2-x86_64-code.fd",
        "/usr/share/OVMF/OVMF_CODE.fd",
        "/usr/share/edk2/ovmf/OVMF_CODE.fd",
        "/usr/share/edk2-ovmf/x64/OVMF_CODE.fd",
        "/usr/share/qemu/OVMF.fd",
    };
}

std::optional<std::string> detectFirmware(const std::string& arch) {
    std::error_code ec;
    for (const auto& p : firmwareSearchPaths(arch)) {
        if (std::filesystem::is_regular_file(p, ec)) return p;
    }
    return std::nullopt;
}
