#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/builder/GuestNicBuilder.hpp"
#include "Virtualization/vmm/GuestConfig.hpp"
#include <string_view>
#include <vector>

/**
 * @brief Builder for libvirt domain definition XML
 *
 * Produces a persistent definition equivalent to the QEMU command line the
 * direct launcher uses: UEFI firmware with a per-guest NVRAM, the overlay
 * disk, the read-only seed image and bridged NICs.
 */
class GuestDomainBuilder : public IXmlBuilderBase {
private:
  std::string name;
  std::string uuid;
  std::string domainType{ "kvm" };
  unsigned long memoryMiB{ 0 };
  unsigned int vcpuCount{ 0 };
  std::string architecture{ "aarch64" };
  std::string machine{ "virt" };
  std::string cpuMode{ "host-passthrough" };
  std::string cpuModel;
  std::string loaderPath;
  std::string nvramPath;
  std::vector<DiskConfig> disks;
  std::vector<GuestNicBuilder> nics;

  void buildDocument() override;

  void buildOsSection(pugi::xml_node domain);
  void buildCpuSection(pugi::xml_node domain);
  void buildDevicesSection(pugi::xml_node domain);
  void buildDisk(pugi::xml_node devices, const DiskConfig& disk, std::size_t index);

public:
  GuestDomainBuilder() = default;

  /**
   * @brief Fills every field from a guest description
   *
   * The QEMU accelerator picks the libvirt domain type (kvm, hvf, or qemu
   * for TCG); machine options after the first comma are dropped. An empty
   * CPU model or machine leaves the choice to the hypervisor.
   */
  static GuestDomainBuilder fromSpec(const GuestSpec& spec);

  GuestDomainBuilder& setName(std::string_view name);
  GuestDomainBuilder& setUuid(std::string_view uuid);
  GuestDomainBuilder& setDomainType(std::string_view type);
  GuestDomainBuilder& setMemoryMiB(unsigned long memory);
  GuestDomainBuilder& setCpuCount(unsigned int vcpus);
  GuestDomainBuilder& setArchitecture(std::string_view arch);
  GuestDomainBuilder& setMachine(std::string_view machine);
  GuestDomainBuilder& setCpu(std::string_view mode, std::string_view model = {});
  GuestDomainBuilder& setFirmware(std::string_view loader, std::string_view nvram);
  GuestDomainBuilder& addDisk(const DiskConfig& disk);
  GuestDomainBuilder& addNic(GuestNicBuilder nic);
};

// vda, vdb, ... vdz
[[nodiscard]] std::string virtioDiskTarget(std::size_t index);
