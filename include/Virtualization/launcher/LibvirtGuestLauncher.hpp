#pragma once
#include <memory>
#include "Core/interfaces/IGuestLauncher.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief Defines and starts guests through libvirt
 *
 * The domain is persistent so the NVRAM and overlay survive a restart. If
 * the start fails the definition is rolled back.
 */
class LibvirtGuestLauncher : public IGuestLauncher {
public:
    explicit LibvirtGuestLauncher(std::shared_ptr<HypervisorConnector> connector);

    LaunchedGuest launch(const GuestSpec& spec) override;
    [[nodiscard]] std::string describe(const GuestSpec& spec) const override;
    [[nodiscard]] const char* backend() const noexcept override { return "libvirt"; }

    [[nodiscard]] static std::string domainXml(const GuestSpec& spec);

private:
    std::shared_ptr<HypervisorConnector> connector;
};
