#pragma once

#include <libvirt/libvirt.h>
#include <mutex>
#include <string>

/**
 * @brief Owns the libvirt connection handle
 *
 * The connection opens lazily on the first ensureConnected() and closes
 * with the object.
 */
class HypervisorConnector {
public:
    static constexpr const char* kDefaultUri = "qemu:///system";

    explicit HypervisorConnector(std::string uri = kDefaultUri);
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    bool connect() noexcept;
    void connectOrThrow();
    void close() noexcept;

    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& uri() const noexcept { return uri_; }

    // Message of the last libvirt error on this thread, or "unknown".
    [[nodiscard]] static std::string lastError();

private:
    mutable std::mutex mutex_;
    virConnectPtr conn{nullptr};
    std::string uri_;
};
