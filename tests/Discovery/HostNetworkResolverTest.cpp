#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "Discovery/HostNetworkResolver.hpp"
#include "mocks/MockCommandRunner.hpp"
#include "mocks/MockDiscovery.hpp"

using ::testing::_;
using ::testing::Return;
using namespace DISCOVERY;

TEST(HostNetworkResolverTest, ParsesIprouteOneLineOutput) {
  auto parsed = parseIprouteAddress(
      "3: br0    inet 10.193.80.64/24 brd 10.193.80.255 scope global br0\\       valid_lft forever\n");
  ASSERT_TRUE(parsed);
  EXPECT_EQ("10.193.80.64", parsed->address);
  EXPECT_EQ("24", parsed->mask);
  EXPECT_FALSE(parseIprouteAddress(""));
}

TEST(HostNetworkResolverTest, UsesIprouteWhenAvailable) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists("ip")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, run("ip", std::vector<std::string>{"-o", "-4", "addr", "show", "dev", "br0"}, _))
      .WillOnce(Return(Output("3: br0    inet 10.193.80.64/24 brd 10.193.80.255 scope global br0\n")));

  SystemHostNetworkResolver resolver(runner);
  const auto ctx = resolver.resolve("br0");
  ASSERT_TRUE(ctx.canProbe());
  EXPECT_EQ("10.193.80.64", ctx.selfAddress->to_string());
  EXPECT_EQ("10.193.80.0/24", ctx.subnet->to_string());
}

TEST(HostNetworkResolverTest, FallsBackToIpconfig) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists("ip")).WillRepeatedly(Return(false));
  EXPECT_CALL(*runner, exists("ipconfig")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, run("ipconfig", std::vector<std::string>{"getifaddr", "en1"}, _))
      .WillOnce(Return(Output("192.168.1.20\n")));
  EXPECT_CALL(*runner, run("ipconfig", std::vector<std::string>{"getoption", "en1", "subnet_mask"}, _))
      .WillOnce(Return(Output("255.255.255.0\n")));

  SystemHostNetworkResolver resolver(runner);
  const auto ctx = resolver.resolve("en1");
  ASSERT_TRUE(ctx.canProbe());
  EXPECT_EQ("192.168.1.0/24", ctx.subnet->to_string());
}

TEST(HostNetworkResolverTest, MissingMaskGivesAddressOnly) {
  MockHostNetworkResolver resolver;
  EXPECT_CALL(resolver, query("en1")).WillOnce(Return(InterfaceAddress{"192.168.1.20", std::nullopt}));

  const auto ctx = resolver.resolve("en1");
  EXPECT_TRUE(ctx.selfAddress);
  EXPECT_FALSE(ctx.subnet);
  EXPECT_FALSE(ctx.canProbe());
}

TEST(HostNetworkResolverTest, NoAddressGivesEmptyContext) {
  MockHostNetworkResolver resolver;
  EXPECT_CALL(resolver, query(_)).WillOnce(Return(InterfaceAddress{}));
  const auto ctx = resolver.resolve("en9");
  EXPECT_FALSE(ctx.selfAddress);
  EXPECT_FALSE(ctx.canProbe());
}

TEST(HostNetworkResolverTest, BadMaskFallsBackToSlash24) {
  MockHostNetworkResolver resolver;
  EXPECT_CALL(resolver, query(_)).WillOnce(Return(InterfaceAddress{"10.9.8.7", "bogus"}));
  const auto ctx = resolver.resolve("en1");
  ASSERT_TRUE(ctx.subnet);
  EXPECT_EQ("10.9.8.0/24", ctx.subnet->to_string());
}

TEST(HostNetworkResolverTest, DefaultGatewayFromIpRoute) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, exists("ip")).WillRepeatedly(Return(true));
  EXPECT_CALL(runner, run("ip", std::vector<std::string>{"route", "show", "default"}, _))
      .WillOnce(Return(Output("default via 10.193.80.64 dev br0 proto static\n")));

  auto gw = queryDefaultGateway(runner);
  ASSERT_TRUE(gw);
  EXPECT_EQ("10.193.80.64", gw->to_string());
}

TEST(HostNetworkResolverTest, DefaultGatewayFromBsdRoute) {
  MockCommandRunner runner;
  EXPECT_CALL(runner, exists("ip")).WillRepeatedly(Return(false));
  EXPECT_CALL(runner, exists("route")).WillRepeatedly(Return(true));
  EXPECT_CALL(runner, run("route", _, _))
      .WillOnce(Return(Output("   route to: default\ndestination: default\n    gateway: 192.168.1.1\n  interface: en1\n")));

  auto gw = queryDefaultGateway(runner);
  ASSERT_TRUE(gw);
  EXPECT_EQ("192.168.1.1", gw->to_string());
}
