#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/vmm/GuestConfig.hpp"
#include <string_view>

/**
 * @brief Builder for a libvirt <interface> device
 *
 * "bridge" attaches to a host bridge, "direct" to a physical NIC through
 * macvtap in bridge mode, "network" to a libvirt managed network.
 */
class GuestNicBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;

    std::string model{"virtio"};
    std::string macAddress;
    std::string deviceType{"bridge"};
    std::string sourceDevice;

public:
    GuestNicBuilder() = default;

    // Maps a QEMU style NIC description onto libvirt terms.
    static GuestNicBuilder fromConfig(const NetworkConfig& nic);

    /**
     * @brief Sets the device model
     * @param model libvirt model type (e.g. "virtio", "e1000")
     */
    GuestNicBuilder& setModel(std::string_view model);

    /**
     * @brief Sets the MAC address, "xx:xx:xx:xx:xx:xx"
     */
    GuestNicBuilder& setMacAddress(std::string_view mac);

    /**
     * @brief Sets the device type ("bridge", "direct", "network")
     */
    GuestNicBuilder& setDeviceType(std::string_view type);

    /**
     * @brief Sets the bridge, host NIC or network name depending on the type
     */
    GuestNicBuilder& setSourceDevice(std::string_view device);

    // Writes the <interface> element under parent (normally <devices>).
    void appendTo(pugi::xml_node parent) const;
};
