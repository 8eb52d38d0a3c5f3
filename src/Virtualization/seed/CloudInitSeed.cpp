#include "Virtualization/seed/CloudInitSeed.hpp"
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include "Utils/Exception.hpp"

namespace {

constexpr const char kUserDataTpl[] = R"tpl(#cloud-config
preserve_hostname: false
hostname: {hostname}
fqdn: {hostname}.local

ssh_pwauth: true
users:
  - name: {user}
    groups: [sudo]
    shell: /bin/bash
    sudo: 'ALL=(ALL) NOPASSWD:ALL'
    lock_passwd: false

chpasswd:
  list: |
    {user}:{password}
  expire: false

package_update: true
packages:
  - openssh-server
  - python3
  - python3-pip
  - git
  - ufw
  - qemu-guest-agent

write_files:
  - path: /etc/ssh/sshd_config.d/99-cloud-ssh.conf
    owner: root:root
    permissions: '0644'
    content: |
      PasswordAuthentication yes
      PubkeyAuthentication yes
      PermitRootLogin no
      KbdInteractiveAuthentication no
      UsePAM yes

runcmd:
  - systemctl enable --now qemu-guest-agent || true
  - systemctl enable --now ssh || systemctl enable --now sshd || true
  - ufw allow OpenSSH || ufw allow 22/tcp
  - yes | ufw enable || true
  - 'echo "Static IP configured for {iface} at {ip}/{prefix} (gw {gateway})"'
)tpl";

constexpr const char kNetworkConfigTpl[] = R"(version: 2
ethernets:
  {iface}:
    dhcp4: no
    addresses:
      - {ip}/{prefix}
    gateway4: {gateway}
    nameservers:
      addresses: [{dns_list}]
)";

constexpr const char kMetaDataTpl[] = R"(instance-id: {hostname}
local-hostname: {hostname}
)";

// Written verbatim; these keep cloud-init from rewriting netplan after first boot.
constexpr const char kDisableNetCfg[] = R"(# Prevent cloud-init from trying to (re)manage network after we set netplan
network: {config: disabled}
)";

constexpr const char kCloudCfgExtra[] = R"(cloud_final_modules:
 - [scripts-per-once, always]

network:
  config: disabled
)";

std::string joinDns(const std::vector<std::string>& dns) {
    std::string out;
    for (const auto& d : dns) {
        if (!out.empty()) out += ",";
        out += d;
    }
    return out;
}

} // namespace

CloudInitSeed::CloudInitSeed(std::string hostname, SeedNetwork network, SeedAccount account)
    : hostname(std::move(hostname)), network(std::move(network)), account(std::move(account)) {}

std::string CloudInitSeed::userData() const {
    return fmt::format(fmt::runtime(kUserDataTpl),
                       fmt::arg("hostname", hostname),
                       fmt::arg("user", account.user),
                       fmt::arg("password", account.password),
                       fmt::arg("iface", network.iface),
                       fmt::arg("ip", network.address.to_string()),
                       fmt::arg("prefix", network.prefixLength),
                       fmt::arg("gateway", network.gateway.to_string()));
}

std::string CloudInitSeed::networkConfig() const {
    return fmt::format(fmt::runtime(kNetworkConfigTpl),
                       fmt::arg("iface", network.iface),
                       fmt::arg("ip", network.address.to_string()),
                       fmt::arg("prefix", network.prefixLength),
                       fmt::arg("gateway", network.gateway.to_string()),
                       fmt::arg("dns_list", joinDns(network.dns)));
}

std::string CloudInitSeed::metaData() const {
    return fmt::format(fmt::runtime(kMetaDataTpl), fmt::arg("hostname", hostname));
}

std::map<std::string, std::string> CloudInitSeed::files() const {
    return {
        {"user-data", userData()},
        {"network-config", networkConfig()},
        {"meta-data", metaData()},
        {"99-disable-network-config.cfg", kDisableNetCfg},
        {"99-cloud-config.cfg", kCloudCfgExtra},
    };
}

void CloudInitSeed::writeTo(const std::filesystem::path& dir) const {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw SeedImageException("cannot create " + dir.string() + ": " + ec.message());

    for (const auto& [name, content] : files()) {
        std::ofstream out(dir / name, std::ios::trunc);
        if (!out) throw SeedImageException("cannot write " + (dir / name).string());
        out << content;
        if (!out) throw SeedImageException("short write to " + (dir / name).string());
    }
}

std::vector<std::string> splitDnsList(const std::string& csv) {
    std::vector<std::string> out;
    std::istringstream in(csv);
    std::string item;
    while (std::getline(in, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        const auto e = item.find_last_not_of(" \t");
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}
