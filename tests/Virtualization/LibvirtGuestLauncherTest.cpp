#include <gtest/gtest.h>
#include <atomic>
#include <unistd.h>
#include "Utils/Exception.hpp"
#include "Virtualization/launcher/LibvirtGuestLauncher.hpp"
#include "Virtualization/vm/GuestDomain.hpp"

// libvirt's built-in test driver: an in-memory hypervisor, no daemon needed.
static constexpr const char* kTestUri = "test:///default";

namespace {

std::string uniqueName(const std::string& prefix) {
  static std::atomic<int> counter{0};
  return prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++);
}

std::string minimalXml(const std::string& name) {
  return "<domain type='test'>"
         "<name>" + name + "</name>"
         "<memory unit='MiB'>64</memory>"
         "<vcpu>1</vcpu>"
         "<os><type arch='x86_64'>hvm</type></os>"
         "</domain>";
}

GuestSpec testDriverSpec(const std::string& name) {
  GuestSpec spec;
  spec.name = name;
  spec.uuid = generateGuestUuid();
  spec.accel = "test";
  spec.arch = "x86_64";
  spec.machine.clear();
  spec.cpuModel.clear();
  spec.vcpus = 1;
  spec.memoryMiB = 128;
  spec.disks.push_back({"/var/lib/labspawn/" + name + ".qcow2", "qcow2", "virtio", "", "", false});
  return spec;
}

} // namespace

class LibvirtTest : public ::testing::Test {
protected:
  std::shared_ptr<HypervisorConnector> connector = std::make_shared<HypervisorConnector>(kTestUri);
};

TEST_F(LibvirtTest, ConnectsLazily) {
  EXPECT_FALSE(connector->isConnected());
  EXPECT_NE(nullptr, connector->ensureConnected());
  EXPECT_TRUE(connector->isConnected());
  EXPECT_EQ(kTestUri, connector->uri());

  connector->close();
  EXPECT_FALSE(connector->isConnected());
}

TEST(HypervisorConnectorTest, UnreachableUriThrows) {
  HypervisorConnector connector("test:///labspawn-missing/config.xml");
  EXPECT_FALSE(connector.connect());
  EXPECT_THROW(connector.connectOrThrow(), LibvirtException);
  EXPECT_FALSE(connector.isConnected());
}

TEST_F(LibvirtTest, DomainLifecycle) {
  const auto name = uniqueName("lifecycle");
  auto domain = GuestDomain::define(connector, minimalXml(name));
  EXPECT_EQ(name, domain->getName());
  EXPECT_FALSE(domain->getUuid().empty());
  EXPECT_FALSE(domain->isActive());
  EXPECT_EQ(GuestDomain::State::Shutdown, domain->getState());

  domain->start();
  EXPECT_TRUE(domain->isActive());
  EXPECT_EQ(GuestDomain::State::Running, domain->getState());
  EXPECT_STREQ("running", GuestDomain::toString(domain->getState()));

  auto same = GuestDomain::lookup(connector, name);
  EXPECT_EQ(domain->getUuid(), same->getUuid());

  domain->destroy();
  EXPECT_FALSE(domain->isActive());
  domain->undefine();
  EXPECT_THROW(GuestDomain::lookup(connector, name), LibvirtException);
}

TEST_F(LibvirtTest, StartingTwiceFails) {
  const auto name = uniqueName("twice");
  auto domain = GuestDomain::define(connector, minimalXml(name));
  domain->start();
  EXPECT_THROW(domain->start(), LibvirtException);
  domain->destroy();
  domain->undefine();
}

TEST_F(LibvirtTest, MalformedXmlIsRejected) {
  EXPECT_THROW(GuestDomain::define(connector, "<domain type='test'><name>"), LibvirtException);
}

TEST_F(LibvirtTest, LaunchDefinesAndStartsGuest) {
  LibvirtGuestLauncher launcher(connector);
  const auto spec = testDriverSpec(uniqueName("launch"));

  const auto launched = launcher.launch(spec);
  EXPECT_EQ(spec.name, launched.name);
  EXPECT_EQ("libvirt", launched.backend);
  EXPECT_FALSE(launched.pid);

  auto domain = GuestDomain::lookup(connector, spec.name);
  EXPECT_TRUE(domain->isActive());
  EXPECT_EQ(spec.uuid, domain->getUuid());

  domain->destroy();
  domain->undefine();
}

TEST_F(LibvirtTest, LaunchRejectsInvalidSpec) {
  LibvirtGuestLauncher launcher(connector);
  auto spec = testDriverSpec(uniqueName("invalid"));
  spec.disks.clear();
  EXPECT_THROW(launcher.launch(spec), SetupException);
  EXPECT_FALSE(connector->isConnected());
}

TEST(LibvirtGuestLauncherTest, LaunchReportsConnectionFailure) {
  LibvirtGuestLauncher launcher(std::make_shared<HypervisorConnector>("test:///labspawn-missing/config.xml"));
  EXPECT_THROW(launcher.launch(testDriverSpec("unreachable")), LaunchException);
}

TEST(LibvirtGuestLauncherTest, DescribeShowsVirshCommands) {
  LibvirtGuestLauncher launcher(std::make_shared<HypervisorConnector>(kTestUri));
  const auto text = launcher.describe(testDriverSpec("described"));
  EXPECT_NE(std::string::npos, text.find("virsh -c test:///default define"));
  EXPECT_NE(std::string::npos, text.find("<name>described</name>"));
  EXPECT_NE(std::string::npos, text.find("virsh -c test:///default start described"));
}
