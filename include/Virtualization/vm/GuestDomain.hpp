#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <libvirt/libvirt.h>
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief Handle to one libvirt domain; frees the handle on destruction
 *
 * Destruction never stops or undefines the guest itself.
 */
class GuestDomain {
public:
    enum class State { Running, Paused, Shutdown, Crashed, Suspended, Unknown };

    // Defines a persistent domain from XML. Throws LibvirtException.
    static std::unique_ptr<GuestDomain> define(std::shared_ptr<HypervisorConnector> conn,
                                               const std::string& xml);

    // Looks up an existing domain by name. Throws LibvirtException if absent.
    static std::unique_ptr<GuestDomain> lookup(std::shared_ptr<HypervisorConnector> conn,
                                               std::string_view name);

    ~GuestDomain();

    GuestDomain(const GuestDomain&) = delete;
    GuestDomain& operator=(const GuestDomain&) = delete;

    void start();
    void destroy();
    void undefine();

    [[nodiscard]] const std::string& getName() const noexcept { return name; }
    [[nodiscard]] std::string getUuid() const;
    [[nodiscard]] State getState() const;
    [[nodiscard]] bool isActive() const;

    [[nodiscard]] static const char* toString(State state) noexcept;

private:
    GuestDomain(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom);

    std::shared_ptr<HypervisorConnector> connector;
    virDomainPtr domain{nullptr};
    std::string name;

    static void checkLibvirtError(int result, const std::string& action);
    static State mapLibvirtState(int state);
};
