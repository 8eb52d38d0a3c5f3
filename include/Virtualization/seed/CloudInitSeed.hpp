#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "Network/Ipv4.hpp"

struct SeedNetwork {
    std::string iface{"enp0s1"};   // guest-side NIC name used by netplan
    NETWORK::Ipv4Address address;
    unsigned short prefixLength{24};
    NETWORK::Ipv4Address gateway;
    std::vector<std::string> dns;
};

struct SeedAccount {
    std::string user{"gns3"};
    std::string password{"gns3"};
};

/**
 * @brief cloud-init NoCloud files for one guest
 *
 * The guest gets a static address through network-config and the same
 * address is echoed from runcmd so it shows up in the console log.
 */
class CloudInitSeed {
public:
    CloudInitSeed(std::string hostname, SeedNetwork network, SeedAccount account = {});

    [[nodiscard]] std::string userData() const;
    [[nodiscard]] std::string networkConfig() const;
    [[nodiscard]] std::string metaData() const;

    // file name -> content, for every file the seed volume carries
    [[nodiscard]] std::map<std::string, std::string> files() const;

    // Creates dir if needed and (over)writes every file; throws SeedImageException.
    void writeTo(const std::filesystem::path& dir) const;

private:
    std::string hostname;
    SeedNetwork network;
    SeedAccount account;
};

// "a, b,,c" -> {"a","b","c"}
[[nodiscard]] std::vector<std::string> splitDnsList(const std::string& csv);
