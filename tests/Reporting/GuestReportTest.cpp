#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "Reporting/GuestReport.hpp"

using namespace REPORTING;

namespace {

GuestReport report() {
  GuestReport r;
  r.name = "sA";
  r.overlay = "/labs/overlays/sA.qcow2";
  r.pidFile = "/labs/overlays/sA.pid";
  r.logFile = "/labs/logs/sA.log";
  r.pid = 4242;
  r.mac = "52:54:00:12:34:56";
  return r;
}

} // namespace

TEST(GuestReportTest, FoundGuest) {
  auto r = report();
  r.address = boost::asio::ip::make_address_v4("192.168.1.77");
  const auto j = toJson(r);

  EXPECT_EQ("sA", j["vm"]);
  EXPECT_EQ("4242", j["pid"]);
  EXPECT_EQ("192.168.1.77", j["ip"]);
  EXPECT_EQ("http://192.168.1.77:3080", j["api_url"]);
  EXPECT_EQ("gns3", j["auth"]["user"]);
  EXPECT_EQ("gns3", j["auth"]["password"]);
  EXPECT_THAT(j["notes"].get<std::string>(), ::testing::HasSubstr("5000-5999"));
}

TEST(GuestReportTest, UnknownValuesAreNull) {
  auto r = report();
  r.pid.reset();
  const auto j = toJson(r);
  EXPECT_TRUE(j["ip"].is_null());
  EXPECT_TRUE(j["api_url"].is_null());
  EXPECT_TRUE(j["pid"].is_null());
}

TEST(GuestReportTest, KeysKeepTheirOrder) {
  const auto j = toJson(report());
  std::vector<std::string> keys;
  for (const auto& item : j.items()) keys.push_back(item.key());
  EXPECT_EQ((std::vector<std::string>{"vm", "overlay", "pidfile", "logfile", "pid", "mac", "ip", "api_url",
                                      "auth", "notes"}),
            keys);
}

TEST(GuestReportTest, TimeoutHintsNameMacAndLog) {
  const auto hints = timeoutHints(report());
  EXPECT_THAT(hints, ::testing::HasSubstr("ssh gns3@<IP>"));
  EXPECT_THAT(hints, ::testing::HasSubstr("MAC: 52:54:00:12:34:56\n"));
  EXPECT_THAT(hints, ::testing::HasSubstr("Log: /labs/logs/sA.log\n"));
}
