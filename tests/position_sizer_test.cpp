// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Unit tests for optguard::PositionSizer (fractional Kelly with a hard cap).
//
// Validates:
//   - Quarter-Kelly arithmetic below the cap
//   - Clamp to the per-trade cap, never above
//   - Negative edge -> 0 and should_trade=false
//   - Degenerate inputs fail closed with a typed error
// =============================================================================

#include "optguard/sizing/position_sizer.hpp"

#include <gtest/gtest.h>

#include <limits>

using optguard::SizingError;

class PositionSizerTest : public ::testing::Test {
 protected:
  optguard::PositionSizer sizer{optguard::domain::SizingPolicy{}};

  static void expectNoTrade(const optguard::SizingResult& r, SizingError e) {
    EXPECT_FALSE(r.should_trade);
    EXPECT_DOUBLE_EQ(r.risk_fraction, 0.0);
    EXPECT_EQ(r.error, e);
    EXPECT_FALSE(r.reason.empty());
  }
};

// -----------------------------------------------------------------------------
// 1. p=0.55, b=1: Kelly 0.10, quarter-Kelly 0.025, under the 5 % cap.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, QuarterKellyBelowCap) {
  const auto r = sizer.size(0.55, 1.0, 1.0);
  EXPECT_TRUE(r.should_trade);
  EXPECT_EQ(r.error, SizingError::None);
  EXPECT_NEAR(r.raw_kelly, 0.10, 1e-12);
  EXPECT_NEAR(r.risk_fraction, 0.025, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. p=0.88, b=0.5: Kelly 0.64 -> 0.16 after the multiplier -> capped.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, ClampedToCap) {
  const auto r = sizer.size(0.88, 0.5, 1.0);
  EXPECT_TRUE(r.should_trade);
  EXPECT_NEAR(r.raw_kelly, 0.64, 1e-12);
  EXPECT_DOUBLE_EQ(r.risk_fraction, 0.05);

  // A tighter caller cap wins; a looser one does not lift the global cap.
  EXPECT_DOUBLE_EQ(sizer.size(0.88, 0.5, 1.0, 0.03).risk_fraction, 0.03);
  EXPECT_DOUBLE_EQ(sizer.size(0.88, 0.5, 1.0, 0.50).risk_fraction, 0.05);
}

TEST_F(PositionSizerTest, NegativeEdgeDoesNotTrade) {
  const auto r = sizer.size(0.40, 1.0, 1.0);
  expectNoTrade(r, SizingError::None);
  EXPECT_LT(r.raw_kelly, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Zero average loss must never yield a positive fraction.
// Why: Substituting a fallback fraction here is exactly the bug class the
//      sizer exists to prevent.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, ZeroAverageLossFailsClosed) {
  for (double p : {0.1, 0.5, 0.9, 0.99}) {
    for (double w : {0.1, 1.0, 10.0}) {
      expectNoTrade(sizer.size(p, w, 0.0), SizingError::ZeroAverageLoss);
    }
  }
}

TEST_F(PositionSizerTest, DegenerateInputsFailClosed) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  expectNoTrade(sizer.size(nan, 1.0, 1.0), SizingError::NonFiniteInput);
  expectNoTrade(sizer.size(0.6, inf, 1.0), SizingError::NonFiniteInput);
  expectNoTrade(sizer.size(0.6, 1.0, 1.0, nan), SizingError::NonFiniteInput);
  expectNoTrade(sizer.size(0.0, 1.0, 1.0), SizingError::WinRateOutOfRange);
  expectNoTrade(sizer.size(1.0, 1.0, 1.0), SizingError::WinRateOutOfRange);
  expectNoTrade(sizer.size(0.6, 0.0, 1.0), SizingError::NonPositiveAverageWin);
  expectNoTrade(sizer.size(0.6, 1.0, -1.0), SizingError::NegativeAverageLoss);
  expectNoTrade(sizer.size(0.6, 1.0, 1.0, 0.0), SizingError::InvalidCap);
}

TEST_F(PositionSizerTest, FractionAlwaysWithinBounds) {
  for (double p = 0.05; p < 1.0; p += 0.05) {
    for (double w : {0.2, 0.5, 1.0, 3.0}) {
      for (double l : {0.5, 1.0, 3.0}) {
        const auto r = sizer.size(p, w, l);
        EXPECT_GE(r.risk_fraction, 0.0);
        EXPECT_LE(r.risk_fraction, 0.05);
        EXPECT_EQ(r.should_trade, r.risk_fraction > 0.0);
      }
    }
  }
}

TEST_F(PositionSizerTest, ErrorNames) {
  EXPECT_STREQ(optguard::PositionSizer::toString(SizingError::ZeroAverageLoss),
               "ZERO_AVERAGE_LOSS");
  EXPECT_STREQ(optguard::PositionSizer::toString(SizingError::None), "NONE");
}
