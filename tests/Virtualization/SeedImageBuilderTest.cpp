#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "Utils/Exception.hpp"
#include "Virtualization/seed/SeedImageBuilder.hpp"
#include "mocks/MockCommandRunner.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;

namespace fs = std::filesystem;

TEST(SeedImageBuilderTest, ArgumentsPerTool) {
  const fs::path dir = "/w/seeds/seed-init-1";
  const fs::path iso = "/w/seeds/seed-1.iso";

  EXPECT_EQ((std::vector<std::string>{"makehybrid", "-iso", "-joliet", "-default-volume-name", "cidata",
                                      "-o", "/w/seeds/seed-1", "/w/seeds/seed-init-1"}),
            SeedImageBuilder::arguments("hdiutil", dir, iso));
  EXPECT_EQ((std::vector<std::string>{"-o", "/w/seeds/seed-1.iso", "-V", "cidata", "-J", "-R",
                                      "/w/seeds/seed-init-1"}),
            SeedImageBuilder::arguments("xorrisofs", dir, iso));
  EXPECT_EQ((std::vector<std::string>{"-output", "/w/seeds/seed-1.iso", "-volid", "cidata", "-joliet",
                                      "-rock", "/w/seeds/seed-init-1"}),
            SeedImageBuilder::arguments("genisoimage", dir, iso));
}

TEST(SeedImageBuilderTest, NoToolInstalledIsASetupError) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists(_)).WillRepeatedly(Return(false));

  SeedImageBuilder builder(runner);
  EXPECT_TRUE(builder.availableTools().empty());
  EXPECT_THROW(builder.build("/tmp/seed", "/tmp/seed.iso"), SetupException);
}

TEST(SeedImageBuilderTest, FallsBackToNextToolInOrder) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists("hdiutil")).WillRepeatedly(Return(false));
  EXPECT_CALL(*runner, exists("genisoimage")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, exists("mkisofs")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, exists("xorrisofs")).WillRepeatedly(Return(true));
  {
    InSequence seq;
    EXPECT_CALL(*runner, run("genisoimage", _, _)).WillOnce(Return(Output("", 2, "boom")));
    EXPECT_CALL(*runner, run("mkisofs", _, _)).WillOnce(Return(Err("mkisofs: exec failed")));
    EXPECT_CALL(*runner, run("xorrisofs", _, _)).WillOnce(Return(Output("")));
  }

  SeedImageBuilder builder(runner);
  EXPECT_EQ("xorrisofs", builder.build("/tmp/seed", "/tmp/seed.iso"));
}

TEST(SeedImageBuilderTest, EveryToolFailingIsASeedError) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists(_)).WillRepeatedly(Return(false));
  EXPECT_CALL(*runner, exists("mkisofs")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, run("mkisofs", _, _)).WillOnce(Return(Output("", 1)));

  SeedImageBuilder builder(runner);
  EXPECT_THROW(builder.build("/tmp/seed", "/tmp/seed.iso"), SeedImageException);
}

TEST(SeedImageBuilderTest, HdiutilRunsWithForkSafetyDisabled) {
  auto runner = std::make_shared<MockCommandRunner>();
  EXPECT_CALL(*runner, exists(_)).WillRepeatedly(Return(false));
  EXPECT_CALL(*runner, exists("hdiutil")).WillRepeatedly(Return(true));
  EXPECT_CALL(*runner, exists("xorrisofs")).WillRepeatedly(Return(true));

  const std::map<std::string, std::string> env{{"OBJC_DISABLE_INITIALIZE_FORK_SAFETY", "YES"}};
  EXPECT_CALL(*runner, run("hdiutil", _, env)).WillOnce(Return(Output("", 1, "NSNumber crash")));
  EXPECT_CALL(*runner, run("xorrisofs", _, _)).WillOnce(Return(Output("")));

  SeedImageBuilder builder(runner);
  EXPECT_EQ("xorrisofs", builder.build("/tmp/labspawn-none/seed", "/tmp/labspawn-none/seed.iso"));
}
