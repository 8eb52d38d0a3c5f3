#include "Virtualization/builder/GuestDomainBuilder.hpp"
#include <pugixml.hpp>

namespace {

std::string domainTypeFor(const std::string& accel) {
  if (accel == "tcg") return "qemu";
  return accel;
}

} // namespace

std::string virtioDiskTarget(std::size_t index) {
  return std::string("vd") + static_cast<char>('a' + (index % 26));
}

GuestDomainBuilder GuestDomainBuilder::fromSpec(const GuestSpec& spec) {
  GuestDomainBuilder builder;
  builder.setName(spec.name)
         .setUuid(spec.uuid)
         .setDomainType(domainTypeFor(spec.accelerator()))
         .setMemoryMiB(spec.memoryMiB)
         .setCpuCount(spec.vcpus)
         .setArchitecture(spec.arch)
         .setMachine(spec.machine.substr(0, spec.machine.find(',')))
         .setFirmware(spec.firmware.code, spec.firmware.vars);
  if (spec.cpuModel.empty()) {
    builder.setCpu("");
  } else if (spec.cpuModel == "host") {
    builder.setCpu("host-passthrough");
  } else {
    builder.setCpu("custom", spec.cpuModel);
  }
  for (const auto& disk : spec.disks) builder.addDisk(disk);
  for (const auto& nic : spec.networks) builder.addNic(GuestNicBuilder::fromConfig(nic));
  return builder;
}

void GuestDomainBuilder::buildDocument() {
  auto root = doc.append_child("domain");
  root.append_attribute("type") = domainType.c_str();
  root.append_child("name").text() = name.c_str();
  if (!uuid.empty()) {
    root.append_child("uuid").text() = uuid.c_str();
  }

  auto memory = root.append_child("memory");
  memory.append_attribute("unit") = "MiB";
  memory.text() = memoryMiB;
  root.append_child("vcpu").text() = vcpuCount;

  buildOsSection(root);
  root.append_child("features").append_child("acpi");
  buildCpuSection(root);

  root.append_child("on_poweroff").text() = "destroy";
  root.append_child("on_reboot").text() = "restart";
  root.append_child("on_crash").text() = "destroy";

  buildDevicesSection(root);
}

void GuestDomainBuilder::buildOsSection(pugi::xml_node domain) {
  auto os = domain.append_child("os");
  auto type = os.append_child("type");
  type.append_attribute("arch") = architecture.c_str();
  if (!machine.empty()) type.append_attribute("machine") = machine.c_str();
  type.text() = "hvm";

  if (!loaderPath.empty()) {
    auto loader = os.append_child("loader");
    loader.append_attribute("readonly") = "yes";
    loader.append_attribute("type") = "pflash";
    loader.text() = loaderPath.c_str();
  }
  if (!nvramPath.empty()) {
    os.append_child("nvram").text() = nvramPath.c_str();
  }
  os.append_child("boot").append_attribute("dev") = "hd";
}

void GuestDomainBuilder::buildCpuSection(pugi::xml_node domain) {
  if (cpuMode.empty()) return;
  auto cpu = domain.append_child("cpu");
  cpu.append_attribute("mode") = cpuMode.c_str();
  if (!cpuModel.empty()) cpu.append_child("model").text() = cpuModel.c_str();
}

void GuestDomainBuilder::buildDevicesSection(pugi::xml_node domain) {
  auto devices = domain.append_child("devices");

  for (std::size_t i = 0; i < disks.size(); ++i) {
    buildDisk(devices, disks[i], i);
  }
  for (const auto& nic : nics) {
    nic.appendTo(devices);
  }

  // Headless guest: serial console only.
  devices.append_child("serial").append_attribute("type") = "pty";
  auto console = devices.append_child("console");
  console.append_attribute("type") = "pty";
  auto target = console.append_child("target");
  target.append_attribute("type") = "serial";
  target.append_attribute("port") = 0;
}

void GuestDomainBuilder::buildDisk(pugi::xml_node devices, const DiskConfig& cfg, std::size_t index) {
  auto disk = devices.append_child("disk");
  disk.append_attribute("type") = "file";
  disk.append_attribute("device") = "disk";

  auto driver = disk.append_child("driver");
  driver.append_attribute("name") = "qemu";
  driver.append_attribute("type") = cfg.format.c_str();
  if (!cfg.cache.empty()) driver.append_attribute("cache") = cfg.cache.c_str();
  if (!cfg.discard.empty()) driver.append_attribute("discard") = cfg.discard.c_str();

  disk.append_child("source").append_attribute("file") = cfg.source.c_str();

  auto target = disk.append_child("target");
  target.append_attribute("dev") = virtioDiskTarget(index).c_str();
  target.append_attribute("bus") = cfg.bus.c_str();

  if (cfg.readOnly) disk.append_child("readonly");
}

GuestDomainBuilder& GuestDomainBuilder::setName(std::string_view name) {
  this->name = name;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setUuid(std::string_view uuid) {
  this->uuid = uuid;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setDomainType(std::string_view type) {
  this->domainType = type;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setMemoryMiB(unsigned long memory) {
  this->memoryMiB = memory;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setCpuCount(unsigned int vcpus) {
  this->vcpuCount = vcpus;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setArchitecture(std::string_view arch) {
  this->architecture = arch;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setMachine(std::string_view machine) {
  this->machine = machine;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setCpu(std::string_view mode, std::string_view model) {
  this->cpuMode = mode;
  this->cpuModel = model;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::setFirmware(std::string_view loader, std::string_view nvram) {
  this->loaderPath = loader;
  this->nvramPath = nvram;
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::addDisk(const DiskConfig& disk) {
  disks.push_back(disk);
  return *this;
}

GuestDomainBuilder& GuestDomainBuilder::addNic(GuestNicBuilder nic) {
  nics.push_back(std::move(nic));
  return *this;
}
