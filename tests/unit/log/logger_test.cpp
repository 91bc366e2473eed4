/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/prepare_loggers.hpp"

using rollkit::log::Error;
using rollkit::log::Level;
using rollkit::log::str2lvl;

TEST(LoggerTest, StrToLevel) {
  EXPECT_EQ(str2lvl("trace").value(), Level::TRACE);
  EXPECT_EQ(str2lvl("debug").value(), Level::DEBUG);
  EXPECT_EQ(str2lvl("inf").value(), Level::INFO);
  EXPECT_EQ(str2lvl("warn").value(), Level::WARN);
  EXPECT_EQ(str2lvl("err").value(), Level::ERROR);
  EXPECT_EQ(str2lvl("crit").value(), Level::CRITICAL);
  EXPECT_EQ(str2lvl("off").value(), Level::OFF);

  auto res = str2lvl("loud");
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), make_error_code(Error::WRONG_LEVEL));
}

/**
 * @given prepared logging system
 * @when level overrides are applied
 * @then known groups and levels are accepted, others are reported
 */
TEST(LoggerTest, TuneLoggingSystem) {
  auto logging_system = testutil::prepareLoggers();

  EXPECT_TRUE(logging_system->tuneLoggingSystem({"debug", "sync=trace"})
                  .has_value());

  auto unknown_group = logging_system->tuneLoggingSystem({"nowhere=debug"});
  ASSERT_TRUE(unknown_group.has_error());
  EXPECT_EQ(unknown_group.error(), make_error_code(Error::WRONG_GROUP));

  auto unknown_level = logging_system->tuneLoggingSystem({"sync=loud"});
  ASSERT_TRUE(unknown_level.has_error());
  EXPECT_EQ(unknown_level.error(), make_error_code(Error::WRONG_LEVEL));

  auto garbage = logging_system->tuneLoggingSystem({"loud"});
  ASSERT_TRUE(garbage.has_error());
  EXPECT_EQ(garbage.error(), make_error_code(Error::WRONG_LEVEL));

  EXPECT_TRUE(logging_system->resetLevelOfGroup("sync"));
}
