#pragma once
#include <optional>
#include <string>
#include "Virtualization/vmm/GuestConfig.hpp"

struct LaunchedGuest {
    std::string name;
    std::string backend;
    std::optional<int> pid;   // unknown for libvirt guests
    std::string pidFile;
    std::string logFile;
};

/**
 * @brief Starts a guest described by a GuestSpec
 *
 * Implementations throw LaunchException (or a subclass) when the guest could
 * not be started.
 */
class IGuestLauncher {
public:
    virtual ~IGuestLauncher() = default;

    virtual LaunchedGuest launch(const GuestSpec& spec) = 0;

    // Human readable form of what launch() would do (dry runs).
    [[nodiscard]] virtual std::string describe(const GuestSpec& spec) const = 0;

    [[nodiscard]] virtual const char* backend() const noexcept = 0;
};
