#include "Virtualization/builder/GuestNicBuilder.hpp"
#include <pugixml.hpp>

GuestNicBuilder GuestNicBuilder::fromConfig(const NetworkConfig& nic) {
    GuestNicBuilder builder;
    // vmnet has no libvirt counterpart; a host NIC is reached through macvtap.
    builder.setDeviceType(nic.type == "bridge" ? "bridge" : "direct")
           .setSourceDevice(nic.source)
           .setMacAddress(nic.macAddress)
           .setModel(nic.model.starts_with("virtio") ? "virtio" : nic.model);
    return builder;
}

void GuestNicBuilder::buildDocument() {
    appendTo(doc);
}

void GuestNicBuilder::appendTo(pugi::xml_node parent) const {
    auto interface = parent.append_child("interface");
    interface.append_attribute("type") = deviceType.c_str();

    if (!macAddress.empty()) {
        interface.append_child("mac").append_attribute("address") = macAddress.c_str();
    }

    auto source = interface.append_child("source");
    if (deviceType == "network") {
        source.append_attribute("network") = sourceDevice.c_str();
    } else if (deviceType == "bridge") {
        source.append_attribute("bridge") = sourceDevice.c_str();
    } else if (deviceType == "direct") {
        source.append_attribute("dev") = sourceDevice.c_str();
        source.append_attribute("mode") = "bridge";
    }

    interface.append_child("model").append_attribute("type") = model.c_str();
}

GuestNicBuilder& GuestNicBuilder::setModel(std::string_view model) {
    this->model = model;
    return *this;
}

GuestNicBuilder& GuestNicBuilder::setMacAddress(std::string_view mac) {
    this->macAddress = mac;
    return *this;
}

GuestNicBuilder& GuestNicBuilder::setDeviceType(std::string_view type) {
    this->deviceType = type;
    return *this;
}

GuestNicBuilder& GuestNicBuilder::setSourceDevice(std::string_view device) {
    this->sourceDevice = device;
    return *this;
}
