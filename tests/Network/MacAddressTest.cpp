#include <gtest/gtest.h>
#include "Network/MacAddress.hpp"

using NETWORK::MacAddress;
using NETWORK::MacAddressGenerator;

TEST(MacAddressTest, ParsesColonAndDashSeparatedInAnyCase) {
  auto a = MacAddress::parse("52:54:00:AB:cd:0F");
  auto b = MacAddress::parse("52-54-00-ab-CD-0f");
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(*a, *b);
  EXPECT_EQ("52:54:00:ab:cd:0f", a->toString());
}

TEST(MacAddressTest, AcceptsBsdShortOctets) {
  auto mac = MacAddress::parse("52:54:0:a:b:c");
  ASSERT_TRUE(mac);
  EXPECT_EQ("52:54:00:0a:0b:0c", mac->toString());
}

TEST(MacAddressTest, RejectsMalformedText) {
  EXPECT_FALSE(MacAddress::parse(""));
  EXPECT_FALSE(MacAddress::parse("52:54:00:ab:cd"));
  EXPECT_FALSE(MacAddress::parse("52:54:00:ab:cd:ef:01"));
  EXPECT_FALSE(MacAddress::parse("52:54:00:ab:cd:efg"));
  EXPECT_FALSE(MacAddress::parse("525:54:00:ab:cd:ef"));
  EXPECT_FALSE(MacAddress::parse("52::00:ab:cd:ef"));
  EXPECT_EQ("", NETWORK::normalizeMac("incomplete"));
  EXPECT_EQ("52:54:00:11:22:33", NETWORK::normalizeMac("52:54:00:11:22:33"));
}

TEST(MacAddressTest, GeneratedAddressesUseQemuPrefix) {
  MacAddressGenerator gen(1234);
  for (int i = 0; i < 100; ++i) {
    const auto mac = gen.next();
    EXPECT_EQ(0x52, mac.bytes()[0]);
    EXPECT_EQ(0x54, mac.bytes()[1]);
    EXPECT_EQ(0x00, mac.bytes()[2]);
    EXPECT_LE(mac.bytes()[3], 0x7f);
    EXPECT_TRUE(mac.isLocallyAdministered());
  }
}

TEST(MacAddressTest, SameNameGivesSameAddress) {
  const auto first = MacAddressGenerator::forName("sA").next();
  const auto second = MacAddressGenerator::forName("sA").next();
  EXPECT_EQ(first, second);
}

TEST(MacAddressTest, DifferentNamesGiveDifferentAddresses) {
  EXPECT_NE(MacAddressGenerator::seedFromName("sA"), MacAddressGenerator::seedFromName("sB"));
  EXPECT_NE(MacAddressGenerator::forName("overlay-1").next(),
            MacAddressGenerator::forName("overlay-2").next());
}

TEST(MacAddressTest, PinnedLastOctetKeepsTheRestOfTheSequence) {
  const auto free = MacAddressGenerator::forName("overlay-3").next();
  const auto pinned = MacAddressGenerator::forName("overlay-3").next(53);
  EXPECT_EQ(53, pinned.bytes()[5]);
  EXPECT_EQ(free.bytes()[3], pinned.bytes()[3]);
  EXPECT_EQ(free.bytes()[4], pinned.bytes()[4]);
}
