// =============================================================================
// data_quality_test.cpp
// =============================================================================
// Unit tests for optguard::DataQualityClassifier.
//
// Session defaults: open 09:30 (570), close 16:00 (960), 5-minute warm-up.
// =============================================================================

#include "optguard/data/data_quality.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <variant>

using optguard::domain::AvailableValue;
using optguard::domain::DataSeverity;
using optguard::domain::DegradedValue;
using optguard::domain::UnavailableValue;

class DataQualityTest : public ::testing::Test {
 protected:
  optguard::DataQualityClassifier quality{optguard::domain::DataQualityPolicy{}};

  static constexpr int kPreMarket = 8 * 60;
  static constexpr int kWarmup = 572;
  static constexpr int kMidSession = 12 * 60;
  static constexpr int kAfterClose = 17 * 60;

  static DataSeverity severityOf(const optguard::domain::MarketValue& v) {
    return std::get<UnavailableValue>(v).severity;
  }
};

TEST_F(DataQualityTest, SeverityForMissingFollowsTheSession) {
  EXPECT_EQ(quality.severityForMissing(kPreMarket), DataSeverity::Expected);
  EXPECT_EQ(quality.severityForMissing(570), DataSeverity::Warning);
  EXPECT_EQ(quality.severityForMissing(kWarmup), DataSeverity::Warning);
  EXPECT_EQ(quality.severityForMissing(575), DataSeverity::Critical);
  EXPECT_EQ(quality.severityForMissing(kMidSession), DataSeverity::Critical);
  EXPECT_EQ(quality.severityForMissing(960), DataSeverity::Expected);
  EXPECT_EQ(quality.severityForMissing(kAfterClose), DataSeverity::Expected);
}

TEST_F(DataQualityTest, VixReadings) {
  const auto ok = quality.classifyVix(18.4, kMidSession);
  ASSERT_TRUE(std::holds_alternative<AvailableValue>(ok));
  EXPECT_DOUBLE_EQ(std::get<AvailableValue>(ok).value, 18.4);

  EXPECT_EQ(severityOf(quality.classifyVix(std::nullopt, kMidSession)),
            DataSeverity::Critical);
  EXPECT_EQ(severityOf(quality.classifyVix(std::nullopt, kPreMarket)),
            DataSeverity::Expected);

  // Implausible readings are unavailable, not clamped.
  EXPECT_TRUE(std::holds_alternative<UnavailableValue>(
      quality.classifyVix(2.0, kMidSession)));
  EXPECT_TRUE(std::holds_alternative<UnavailableValue>(
      quality.classifyVix(400.0, kMidSession)));
}

TEST_F(DataQualityTest, StaleReadingIsDegraded) {
  const auto v = quality.classifyVix(22.0, kMidSession, 10 * 60 * 1000);
  ASSERT_TRUE(std::holds_alternative<DegradedValue>(v));
  EXPECT_DOUBLE_EQ(std::get<DegradedValue>(v).value, 22.0);
  EXPECT_FALSE(std::get<DegradedValue>(v).reason.empty());
  EXPECT_EQ(optguard::domain::usableValue(v), 22.0);
}

// -----------------------------------------------------------------------------
// A missing major underlying in session stops the whole core; a minor one
// only blocks that instrument.
// -----------------------------------------------------------------------------
TEST_F(DataQualityTest, MissingMajorUnderlyingIsFatal) {
  EXPECT_EQ(severityOf(quality.classifyUnderlying("SPY", std::nullopt,
                                                  kMidSession)),
            DataSeverity::Fatal);
  EXPECT_EQ(severityOf(quality.classifyUnderlying("GLD", std::nullopt,
                                                  kMidSession)),
            DataSeverity::Critical);
  EXPECT_EQ(severityOf(quality.classifyUnderlying("SPY", std::nullopt,
                                                  kAfterClose)),
            DataSeverity::Expected);
  EXPECT_TRUE(quality.isMajorUnderlying("ES"));
  EXPECT_FALSE(quality.isMajorUnderlying("CL"));
}

TEST_F(DataQualityTest, OptionMarks) {
  EXPECT_TRUE(std::holds_alternative<AvailableValue>(
      quality.classifyOptionMark(0.0, kMidSession)));
  EXPECT_TRUE(std::holds_alternative<AvailableValue>(
      quality.classifyOptionMark(1.35, kMidSession)));
  EXPECT_EQ(severityOf(quality.classifyOptionMark(std::nullopt, kMidSession)),
            DataSeverity::Critical);
  EXPECT_FALSE(optguard::domain::usableValue(
                   quality.classifyOptionMark(std::nullopt, kWarmup))
                   .has_value());
}
