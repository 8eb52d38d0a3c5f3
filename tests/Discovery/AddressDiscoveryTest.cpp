#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stop_token>
#include "Discovery/AddressDiscovery.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/MockDiscovery.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using namespace DISCOVERY;
using namespace std::chrono_literals;

namespace {

NETWORK::Ipv4Address ip(const char* text) {
  return boost::asio::ip::make_address_v4(text);
}

class AddressDiscoveryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    neighbors = std::make_shared<NiceMock<MockNeighborTable>>();
    resolver = std::make_shared<NiceMock<MockHostNetworkResolver>>();
    transport = std::make_shared<NiceMock<MockProbeTransport>>();
    clock = std::make_shared<FakeClock>();
    ON_CALL(*transport, probe(_, _)).WillByDefault(Return(true));
  }

  AddressDiscovery make(DiscoveryConfig config) {
    return AddressDiscovery(neighbors, resolver, transport, clock, config);
  }

  std::shared_ptr<NiceMock<MockNeighborTable>> neighbors;
  std::shared_ptr<NiceMock<MockHostNetworkResolver>> resolver;
  std::shared_ptr<NiceMock<MockProbeTransport>> transport;
  std::shared_ptr<FakeClock> clock;
  const DiscoveryTarget target = DiscoveryTarget::make("52:54:00:11:22:33", "en1");
};

} // namespace

TEST_F(AddressDiscoveryTest, FoundOnFirstLookup) {
  EXPECT_CALL(*resolver, query("en1")).WillOnce(Return(InterfaceAddress{"10.193.80.64", "255.255.255.0"}));
  EXPECT_CALL(*neighbors, lookup(*NETWORK::MacAddress::parse("52:54:00:11:22:33")))
      .WillOnce(Return(ip("10.193.80.105")));
  EXPECT_CALL(*transport, probe(_, _)).Times(0);

  DiscoveryConfig config;
  auto result = make(config).run(target);

  EXPECT_EQ(DiscoveryState::Found, result.state);
  EXPECT_TRUE(result.found());
  EXPECT_EQ(ip("10.193.80.105"), *result.address);
  EXPECT_LE(result.elapsed, config.pollInterval);
  EXPECT_EQ(0u, result.sweeps);
}

TEST_F(AddressDiscoveryTest, TimesOutAfterExactlyOneSweep) {
  EXPECT_CALL(*resolver, query(_)).WillOnce(Return(InterfaceAddress{"10.193.80.64", "255.255.255.0"}));
  EXPECT_CALL(*neighbors, lookup(_)).WillRepeatedly(Return(std::nullopt));
  EXPECT_CALL(*transport, probe(_, _)).Times(64).WillRepeatedly(Return(true));

  DiscoveryConfig config;
  config.timeout = 2s;
  config.pollInterval = 500ms;
  config.sweepInterval = 5s;
  auto result = make(config).run(target);

  EXPECT_EQ(DiscoveryState::TimedOut, result.state);
  EXPECT_FALSE(result.address);
  EXPECT_EQ(1u, result.sweeps);
  EXPECT_GE(result.elapsed, std::chrono::steady_clock::duration(2s));
  EXPECT_LT(result.elapsed, std::chrono::steady_clock::duration(2s + config.pollInterval));
}

TEST_F(AddressDiscoveryTest, WithoutHostAddressOnlyPollsTheTable) {
  EXPECT_CALL(*resolver, query(_)).WillOnce(Return(InterfaceAddress{}));
  EXPECT_CALL(*transport, probe(_, _)).Times(0);

  DiscoveryConfig config;
  config.timeout = 3s;
  config.pollInterval = 500ms;
  EXPECT_CALL(*neighbors, lookup(_)).Times(6).WillRepeatedly(Return(std::nullopt));

  auto result = make(config).run(target);
  EXPECT_EQ(DiscoveryState::TimedOut, result.state);
  EXPECT_EQ(0u, result.sweeps);
}

TEST_F(AddressDiscoveryTest, FoundAfterSweepPopulatesTable) {
  EXPECT_CALL(*resolver, query(_)).WillOnce(Return(InterfaceAddress{"10.193.80.64", "24"}));
  int lookups = 0;
  EXPECT_CALL(*neighbors, lookup(_)).WillRepeatedly(Invoke([&](const NETWORK::MacAddress&) {
    return ++lookups >= 3 ? std::optional<NETWORK::Ipv4Address>(ip("10.193.80.110")) : std::nullopt;
  }));

  auto result = make(DiscoveryConfig{}).run(target);
  EXPECT_TRUE(result.found());
  EXPECT_EQ(1u, result.sweeps);
  EXPECT_EQ(3, lookups);
}

TEST_F(AddressDiscoveryTest, SweepsRepeatAtTheConfiguredInterval) {
  EXPECT_CALL(*resolver, query(_)).WillOnce(Return(InterfaceAddress{"10.193.80.64", "24"}));
  EXPECT_CALL(*neighbors, lookup(_)).WillRepeatedly(Return(std::nullopt));

  DiscoveryConfig config;
  config.timeout = 12s;
  config.sweepInterval = 5s;
  config.sweepLimit = 4;
  auto result = make(config).run(target);
  EXPECT_EQ(DiscoveryState::TimedOut, result.state);
  EXPECT_EQ(3u, result.sweeps);
}

TEST_F(AddressDiscoveryTest, StopRequestCancels) {
  EXPECT_CALL(*resolver, query(_)).WillOnce(Return(InterfaceAddress{}));
  std::stop_source source;
  int lookups = 0;
  EXPECT_CALL(*neighbors, lookup(_)).WillRepeatedly(Invoke([&](const NETWORK::MacAddress&) {
    if (++lookups == 2) source.request_stop();
    return std::optional<NETWORK::Ipv4Address>{};
  }));

  auto result = make(DiscoveryConfig{}).run(target, source.get_token());
  EXPECT_EQ(DiscoveryState::Cancelled, result.state);
  EXPECT_EQ(2, lookups);
}

TEST_F(AddressDiscoveryTest, InvalidMacIsRejectedUpFront) {
  EXPECT_THROW(DiscoveryTarget::make("not-a-mac", "en1"), std::invalid_argument);
  EXPECT_EQ("52:54:00:aa:bb:cc", DiscoveryTarget::make("52:54:00:AA:BB:CC", "en1").macAddress);
}

TEST(DiscoveryStateTest, NamesAreStable) {
  EXPECT_STREQ("found", toString(DiscoveryState::Found));
  EXPECT_STREQ("timed_out", toString(DiscoveryState::TimedOut));
}
