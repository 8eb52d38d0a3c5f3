#include "Virtualization/vm/GuestDomain.hpp"
#include <libvirt/virterror.h>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

GuestDomain::GuestDomain(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom)
    : connector(std::move(conn)), domain(dom) {
    const char* n = virDomainGetName(domain);
    name = n ? n : "";
}

GuestDomain::~GuestDomain() {
    if (domain) virDomainFree(domain);
}

std::unique_ptr<GuestDomain> GuestDomain::define(std::shared_ptr<HypervisorConnector> conn,
                                                 const std::string& xml) {
    virConnectPtr handle = conn->ensureConnected();
    virDomainPtr dom = virDomainDefineXML(handle, xml.c_str());
    if (!dom) {
        throw LibvirtException("define domain: " + HypervisorConnector::lastError());
    }
    return std::unique_ptr<GuestDomain>(new GuestDomain(std::move(conn), dom));
}

std::unique_ptr<GuestDomain> GuestDomain::lookup(std::shared_ptr<HypervisorConnector> conn,
                                                 std::string_view name) {
    const std::string n(name);
    virConnectPtr handle = conn->ensureConnected();
    virDomainPtr dom = virDomainLookupByName(handle, n.c_str());
    if (!dom) {
        throw LibvirtException("domain not found: " + n);
    }
    return std::unique_ptr<GuestDomain>(new GuestDomain(std::move(conn), dom));
}

void GuestDomain::start() {
    checkLibvirtError(virDomainCreate(domain), "start " + name);
    LSLOG_INFO("domain {} started", name);
}

void GuestDomain::destroy() { checkLibvirtError(virDomainDestroy(domain), "destroy " + name); }

void GuestDomain::undefine() {
    if (virDomainUndefineFlags(domain, VIR_DOMAIN_UNDEFINE_NVRAM) == 0) return;

    // Drivers without NVRAM support reject the flag; nothing to remove there.
    virErrorPtr e = virGetLastError();
    if (e && (e->code == VIR_ERR_INVALID_ARG || e->code == VIR_ERR_NO_SUPPORT)) {
        LSLOG_DEBUG("undefine {} without NVRAM: {}", name, e->message ? e->message : "");
        checkLibvirtError(virDomainUndefine(domain), "undefine " + name);
        return;
    }
    checkLibvirtError(-1, "undefine " + name);
}

std::string GuestDomain::getUuid() const {
    char buf[VIR_UUID_STRING_BUFLEN] = {};
    if (virDomainGetUUIDString(domain, buf) < 0) return {};
    return buf;
}

GuestDomain::State GuestDomain::getState() const {
    int s = 0;
    if (virDomainGetState(domain, &s, nullptr, 0) < 0) return State::Unknown;
    return mapLibvirtState(s);
}

bool GuestDomain::isActive() const { return virDomainIsActive(domain) == 1; }

const char* GuestDomain::toString(State state) noexcept {
    switch (state) {
        case State::Running: return "running";
        case State::Paused: return "paused";
        case State::Shutdown: return "shutoff";
        case State::Crashed: return "crashed";
        case State::Suspended: return "pmsuspended";
        default: return "unknown";
    }
}

void GuestDomain::checkLibvirtError(int result, const std::string& action) {
    if (result < 0) {
        throw LibvirtException(action + ": " + HypervisorConnector::lastError());
    }
}

GuestDomain::State GuestDomain::mapLibvirtState(int state) {
    switch (state) {
        case VIR_DOMAIN_RUNNING: return State::Running;
        case VIR_DOMAIN_PAUSED: return State::Paused;
        case VIR_DOMAIN_SHUTOFF: return State::Shutdown;
        case VIR_DOMAIN_CRASHED: return State::Crashed;
        case VIR_DOMAIN_PMSUSPENDED: return State::Suspended;
        default: return State::Unknown;
    }
}
