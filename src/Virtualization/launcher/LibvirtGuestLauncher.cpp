#include "Virtualization/launcher/LibvirtGuestLauncher.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include "Virtualization/builder/GuestDomainBuilder.hpp"
#include "Virtualization/vm/GuestDomain.hpp"

LibvirtGuestLauncher::LibvirtGuestLauncher(std::shared_ptr<HypervisorConnector> connector)
    : connector(std::move(connector)) {}

std::string LibvirtGuestLauncher::domainXml(const GuestSpec& spec) {
    return GuestDomainBuilder::fromSpec(spec).build();
}

std::string LibvirtGuestLauncher::describe(const GuestSpec& spec) const {
    return "virsh -c " + connector->uri() + " define <<EOF\n" + domainXml(spec) + "EOF\n"
         + "virsh -c " + connector->uri() + " start " + spec.name;
}

LaunchedGuest LibvirtGuestLauncher::launch(const GuestSpec& spec) {
    if (auto valid = spec.validate(); valid.isErr()) {
        throw SetupException(valid.unwrapErr());
    }

    const std::string xml = domainXml(spec);
    LSLOG_DEBUG("domain XML for {}:\n{}", spec.name, xml);

    auto domain = GuestDomain::define(connector, xml);
    try {
        domain->start();
    } catch (const LibvirtException&) {
        LSLOG_WARN("start failed, undefining {}", domain->getName());
        try {
            domain->undefine();
        } catch (const LibvirtException& undefineError) {
            LSLOG_ERROR("{}", undefineError.what());
        }
        throw;
    }

    LSLOG_INFO("{} running under {} (uuid {}, state {})", domain->getName(), connector->uri(),
               domain->getUuid(), GuestDomain::toString(domain->getState()));
    return LaunchedGuest{spec.name, backend(), std::nullopt, spec.pidFile, spec.logFile};
}
