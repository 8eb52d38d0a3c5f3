#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/virterror.h>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

HypervisorConnector::HypervisorConnector(std::string uri)
    : uri_(std::move(uri)) {}

HypervisorConnector::~HypervisorConnector() {
    close();
}

bool HypervisorConnector::connect() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) return true;
    conn = virConnectOpen(uri_.c_str());
    return conn != nullptr;
}

void HypervisorConnector::connectOrThrow() {
    if (!connect()) {
        throw LibvirtException("connect to " + uri_ + " failed: " + lastError());
    }
    LSLOG_DEBUG("connected to {}", uri_);
}

void HypervisorConnector::close() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
    }
}

virConnectPtr HypervisorConnector::ensureConnected() {
    connectOrThrow();
    std::scoped_lock lock(mutex_);
    return conn;
}

bool HypervisorConnector::isConnected() const noexcept {
    std::scoped_lock lock(mutex_);
    return conn != nullptr;
}

std::string HypervisorConnector::lastError() {
    virErrorPtr e = virGetLastError();
    return (e && e->message) ? e->message : "unknown";
}
