#ifndef GUESTCONFIG_H
#define GUESTCONFIG_H

#include <optional>
#include <string>
#include <vector>
#include "Utils/Result.hpp"

struct DiskConfig {
    std::string source;          // path to image
    std::string format{"qcow2"}; // qcow2, raw
    std::string bus{"virtio"};
    std::string cache;           // e.g. none
    std::string discard;         // e.g. unmap
    bool readOnly{false};
};

struct NetworkConfig {
    std::string type{"bridge"};        // bridge, vmnet-bridged
    std::string source;                // host interface or bridge name
    std::string model{"virtio-net-pci"};
    std::string macAddress;
};

struct FirmwareConfig {
    std::string code;  // UEFI code ROM, read-only
    std::string vars;  // writable NVRAM copy
};

struct GuestSpec {
    std::string name;
    std::string uuid;
    std::string arch{"aarch64"};
    std::string machine{"virt,highmem=on"};
    std::string cpuModel{"host"};
    std::string accel;               // empty: platform default

    // resources
    unsigned int vcpus{4};
    unsigned long memoryMiB{4096};

    FirmwareConfig firmware;
    std::vector<DiskConfig> disks;
    std::vector<NetworkConfig> networks;

    std::string pidFile;
    std::string logFile;
    bool daemonize{true};
    bool useSudo{false};

    [[nodiscard]] std::string emulator() const { return "qemu-system-" + arch; }
    [[nodiscard]] std::string accelerator() const;

    [[nodiscard]] Result<void> validate() const;
};

// Random RFC 4122 UUID for -uuid / <uuid>.
[[nodiscard]] std::string generateGuestUuid();

// vmnet-bridged on macOS, a Linux bridge elsewhere.
[[nodiscard]] std::string defaultNicType();

// hvf on macOS, kvm elsewhere.
[[nodiscard]] std::string defaultAccelerator();

// Known UEFI code ROM locations for arch, first existing one wins.
[[nodiscard]] std::optional<std::string> detectFirmware(const std::string& arch);

[[nodiscard]] std::vector<std::string> firmwareSearchPaths(const std::string& arch);

#endif // GUESTCONFIG_H
