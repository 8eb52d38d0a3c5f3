#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "Reporting/InstancesTable.hpp"
#include "Utils/Exception.hpp"
#include "support/ScopedTempDir.hpp"

using namespace REPORTING;

namespace {

InstanceRow row(const std::string& name, const std::string& ip, const std::string& pid = "") {
  InstanceRow r;
  r.name = name;
  r.ip = ip;
  r.mac = "52:54:00:aa:bb:33";
  r.disk = "/w/overlays/" + name + ".qcow2";
  r.seedIso = "/w/seeds/" + name + ".iso";
  r.pid = pid;
  return r;
}

} // namespace

TEST(InstancesTableTest, CsvHeaderAndRows) {
  EXPECT_EQ(
      "NAME,IP,MAC,DISK,SEED_ISO,PID\r\n"
      "overlay-1,10.193.80.101,52:54:00:aa:bb:33,/w/overlays/overlay-1.qcow2,/w/seeds/overlay-1.iso,812\r\n"
      "overlay-2,10.193.80.102,52:54:00:aa:bb:33,/w/overlays/overlay-2.qcow2,/w/seeds/overlay-2.iso,\r\n",
      formatInstancesCsv({row("overlay-1", "10.193.80.101", "812"), row("overlay-2", "10.193.80.102")}));
}

TEST(InstancesTableTest, Escaping) {
  EXPECT_EQ("plain", csvEscape("plain"));
  EXPECT_EQ("\"a,b\"", csvEscape("a,b"));
  EXPECT_EQ("\"say \"\"hi\"\"\"", csvEscape("say \"hi\""));
  EXPECT_EQ("\"two\nlines\"", csvEscape("two\nlines"));
}

TEST(InstancesTableTest, WriteCreatesFile) {
  ScopedTempDir tmp;
  const auto path = tmp.path() / "instances.csv";
  writeInstancesCsv(path, {row("overlay-1", "10.193.80.101")});
  EXPECT_EQ(formatInstancesCsv({row("overlay-1", "10.193.80.101")}), readFile(path));
  EXPECT_THROW(writeInstancesCsv(tmp.path() / "missing" / "instances.csv", {}), StorageException);
}

TEST(InstancesTableTest, SummaryWithoutDiscovery) {
  EXPECT_EQ(
      "Summary\n-------\n"
      "   overlay-1    10.193.80.101   pid=812\n"
      "   overlay-2    10.193.80.102   pid=-\n",
      formatSummaryTable({row("overlay-1", "10.193.80.101", "812"), row("overlay-2", "10.193.80.102")}));
}

TEST(InstancesTableTest, SummaryWithDiscovery) {
  auto ok = row("overlay-1", "10.193.80.101", "1");
  ok.discovered = "10.193.80.101";
  ok.discoveryState = "found";
  auto moved = row("overlay-2", "10.193.80.102", "2");
  moved.discovered = "10.193.80.150";
  moved.discoveryState = "found";
  auto lost = row("overlay-3", "10.193.80.103", "3");
  lost.discovered = "";
  lost.discoveryState = "timed_out";

  const auto table = formatSummaryTable({ok, moved, lost});
  EXPECT_THAT(table, ::testing::HasSubstr("pid=1   seen=10.193.80.101 (ok)\n"));
  EXPECT_THAT(table, ::testing::HasSubstr("pid=2   seen=10.193.80.150 (MISMATCH)\n"));
  EXPECT_THAT(table, ::testing::HasSubstr("pid=3   seen=- (timed_out)\n"));
}
