#include <gtest/gtest.h>

#include "prometheus/step.hpp"

using sshprom::CalculateStep;
using sshprom::ParseInterval;
using sshprom::TimeRange;

TEST(ParseIntervalTest, AcceptsEveryUnit) {
  EXPECT_EQ(ParseInterval("15s"), 15);
  EXPECT_EQ(ParseInterval("5m"), 300);
  EXPECT_EQ(ParseInterval("2h"), 7200);
  EXPECT_EQ(ParseInterval("1d"), 86400);
}

TEST(ParseIntervalTest, RejectsOtherGrammar) {
  EXPECT_EQ(ParseInterval(""), 0);
  EXPECT_EQ(ParseInterval("s"), 0);
  EXPECT_EQ(ParseInterval("10"), 0);
  EXPECT_EQ(ParseInterval("1w"), 0);
  EXPECT_EQ(ParseInterval("1.5m"), 0);
  EXPECT_EQ(ParseInterval("-5s"), 0);
  EXPECT_EQ(ParseInterval("5 s"), 0);
  EXPECT_EQ(ParseInterval("$__interval"), 0);
}

TEST(ParseIntervalTest, OverflowingValueIsUnparseable) {
  EXPECT_EQ(ParseInterval("106751991167301d"), 0);
  EXPECT_EQ(ParseInterval("9223372036854775807m"), 0);
  EXPECT_EQ(ParseInterval("9223372036854775807s"), 9223372036854775807LL);
  EXPECT_EQ(ParseInterval("106751991167300d"), 106751991167300LL * 86400);

  TimeRange range{0, 3600 * 1000};
  EXPECT_EQ(CalculateStep(range, 100, "106751991167301d"), 36);
}

TEST(CalculateStepTest, ExplicitIntervalWins) {
  TimeRange range{0, 3600 * 1000};
  EXPECT_EQ(CalculateStep(range, 1000, "30s"), 30);
  EXPECT_EQ(CalculateStep(range, 1, "1m"), 60);
}

TEST(CalculateStepTest, DerivedFromRangeAndMaxPoints) {
  TimeRange range{0, 3600 * 1000};
  EXPECT_EQ(CalculateStep(range, 100, ""), 36);
  EXPECT_EQ(CalculateStep(range, 7, ""), 514);
}

TEST(CalculateStepTest, NeverBelowOneSecond) {
  TimeRange tiny{1000, 1500};
  EXPECT_EQ(CalculateStep(tiny, 1000, ""), 1);
  TimeRange empty{5000, 5000};
  EXPECT_EQ(CalculateStep(empty, 1000, ""), 1);
  TimeRange hour{0, 3600 * 1000};
  EXPECT_GE(CalculateStep(hour, 1000000, ""), 1);
}

TEST(CalculateStepTest, UnparseableIntervalFallsBack) {
  TimeRange range{0, 1000 * 1000};
  EXPECT_EQ(CalculateStep(range, 10, "fast"), 100);
  EXPECT_EQ(CalculateStep(range, 10, "0s"), 100);
}

TEST(CalculateStepTest, NonPositiveMaxPointsUsesDefault) {
  TimeRange range{0, 10000 * 1000};
  EXPECT_EQ(CalculateStep(range, 0, ""), 10);
  EXPECT_EQ(CalculateStep(range, -3, ""), 10);
}
