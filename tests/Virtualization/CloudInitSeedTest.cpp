#include <gtest/gtest.h>
#include "Virtualization/seed/CloudInitSeed.hpp"
#include "support/ScopedTempDir.hpp"

namespace {

SeedNetwork network() {
  SeedNetwork net;
  net.iface = "enp0s1";
  net.address = boost::asio::ip::make_address_v4("10.193.80.101");
  net.prefixLength = 24;
  net.gateway = boost::asio::ip::make_address_v4("10.193.80.64");
  net.dns = {"10.193.80.64", "8.8.8.8"};
  return net;
}

} // namespace

TEST(CloudInitSeedTest, NetworkConfigCarriesStaticAddress) {
  CloudInitSeed seed("overlay-1", network());
  EXPECT_EQ(
      "version: 2\n"
      "ethernets:\n"
      "  enp0s1:\n"
      "    dhcp4: no\n"
      "    addresses:\n"
      "      - 10.193.80.101/24\n"
      "    gateway4: 10.193.80.64\n"
      "    nameservers:\n"
      "      addresses: [10.193.80.64,8.8.8.8]\n",
      seed.networkConfig());
}

TEST(CloudInitSeedTest, UserDataNamesHostAndAccount) {
  CloudInitSeed seed("overlay-1", network(), SeedAccount{"lab", "secret"});
  const auto data = seed.userData();
  EXPECT_EQ(0u, data.find("#cloud-config\n"));
  EXPECT_NE(std::string::npos, data.find("hostname: overlay-1\n"));
  EXPECT_NE(std::string::npos, data.find("fqdn: overlay-1.local\n"));
  EXPECT_NE(std::string::npos, data.find("  - name: lab\n"));
  EXPECT_NE(std::string::npos, data.find("    lab:secret\n"));
  EXPECT_NE(std::string::npos,
            data.find("Static IP configured for enp0s1 at 10.193.80.101/24 (gw 10.193.80.64)"));
}

TEST(CloudInitSeedTest, MetaData) {
  CloudInitSeed seed("overlay-2", network());
  EXPECT_EQ("instance-id: overlay-2\nlocal-hostname: overlay-2\n", seed.metaData());
}

TEST(CloudInitSeedTest, WritesEveryFile) {
  ScopedTempDir tmp;
  CloudInitSeed seed("overlay-1", network());
  const auto dir = tmp.path() / "seed-init-1";
  seed.writeTo(dir);

  for (const char* name : {"user-data", "network-config", "meta-data",
                           "99-disable-network-config.cfg", "99-cloud-config.cfg"}) {
    EXPECT_TRUE(std::filesystem::is_regular_file(dir / name)) << name;
  }
  EXPECT_EQ(seed.networkConfig(), readFile(dir / "network-config"));
  EXPECT_NE(std::string::npos, readFile(dir / "99-disable-network-config.cfg").find("network: {config: disabled}"));
}

TEST(CloudInitSeedTest, SplitDnsListTrimsAndDropsEmpties) {
  EXPECT_EQ((std::vector<std::string>{"a", "b", "c"}), splitDnsList(" a, b,,c ,"));
  EXPECT_TRUE(splitDnsList("").empty());
}
