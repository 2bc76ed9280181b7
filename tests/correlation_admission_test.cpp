// =============================================================================
// correlation_admission_test.cpp
// =============================================================================
// Unit tests for optguard::CorrelationAdmissionController.
//
// Validates:
//   - The (limit+1)th admission into a group is denied and names the group
//   - The A1+A2 aggregate cap layered on top of the per-group caps
//   - HIGH regime shrinks every limit by one slot, floored at 1
//   - Unmapped symbols: admitted as a logged policy gap, or rejected
//   - Counter bookkeeping (register / unregister / totals)
//   - Concurrent tryAdmit never over-fills a group
//   - One tier rule for every query before market context arrives
//   - Risk score, crisis VaR, summary, stress test
//   - Snapshot/restore reproduces identical admission outcomes
// =============================================================================

#include "optguard/config/risk_parameters_loader.hpp"
#include "optguard/correlation/correlation_admission_controller.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using optguard::domain::AdmissionReason;
using optguard::domain::Regime;

class CorrelationAdmissionTest : public ::testing::Test {
 protected:
  std::shared_ptr<const optguard::domain::RiskParameters> params =
      optguard::RiskParametersLoader::defaults();
  optguard::CorrelationAdmissionController controller{params};

  void SetUp() override {
    controller.updateMarketContext(100000.0, Regime::Normal);  // LARGE tier
  }

  // Registers n positions on one symbol, ids "<symbol>-<i>".
  void fill(const std::string& symbol, int n) {
    for (int i = 0; i < n; ++i) {
      controller.registerPosition(symbol + "-" + std::to_string(i), symbol);
    }
  }
};

// -----------------------------------------------------------------------------
// 1. Group limit: A1 allows 2 in the LARGE tier; the third is denied.
// Why: The denial reason is what an operator reads; it must name the exact
//      group and the current/limit pair.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, LimitPlusOneIsDenied) {
  auto d = controller.tryAdmit("p1", "ES", 4);
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::Allowed);
  EXPECT_EQ(d.group, "A1");

  EXPECT_TRUE(controller.tryAdmit("p2", "NQ", 4).allowed);

  d = controller.tryAdmit("p3", "MES", 4);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::GroupAtLimit);
  EXPECT_EQ(d.group, "A1");
  EXPECT_EQ(d.current_count, 2);
  EXPECT_EQ(d.limit, 2);
  EXPECT_NE(d.reason.find("A1"), std::string::npos);
  EXPECT_NE(d.reason.find("2/2"), std::string::npos);

  EXPECT_EQ(controller.activeCount("A1"), 2);
  EXPECT_EQ(controller.totalPositions(), 2);
}

TEST_F(CorrelationAdmissionTest, EveryNonEquityGroupDeniesAtItsLimit) {
  for (const auto& g : params->correlation.groups) {
    if (g.id == "A1" || g.id == "A2") {
      continue;
    }
    const std::string symbol = g.symbols.front();
    const int limit = controller.limitFor(g.id);
    for (int i = 0; i < limit; ++i) {
      ASSERT_TRUE(controller.canAdmit(symbol, 4).allowed) << g.id;
      controller.registerPosition(g.id + "-" + std::to_string(i), symbol);
    }
    const auto d = controller.canAdmit(symbol, 4);
    EXPECT_FALSE(d.allowed) << g.id;
    EXPECT_EQ(d.code, AdmissionReason::GroupAtLimit) << g.id;
    EXPECT_EQ(d.current_count, limit) << g.id;
  }
}

// -----------------------------------------------------------------------------
// 2. A1+A2 share a cap of 3 even when each group is under its own limit.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, EquityAggregateCapIsAStricterSecondGate) {
  fill("ES", 1);   // A1 1/2
  fill("SPY", 2);  // A2 2/3

  const auto d = controller.canAdmit("QQQ", 4);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::EquityAggregateAtLimit);
  EXPECT_EQ(d.group, "A1+A2");
  EXPECT_EQ(d.current_count, 3);
  EXPECT_EQ(d.limit, 3);

  EXPECT_FALSE(controller.canAdmit("MNQ", 4).allowed);
  // Non-equity groups are unaffected.
  EXPECT_TRUE(controller.canAdmit("GC", 4).allowed);
}

TEST_F(CorrelationAdmissionTest, HighRegimeShrinksLimitsFlooredAtOne) {
  EXPECT_EQ(controller.limitFor("A2"), 3);
  EXPECT_EQ(controller.limitFor("C2"), 1);

  controller.updateMarketContext(100000.0, Regime::High);
  EXPECT_EQ(controller.limitFor("A2"), 2);
  EXPECT_EQ(controller.limitFor("A1"), 1);
  EXPECT_EQ(controller.limitFor("C2"), 1);

  fill("ES", 1);
  EXPECT_EQ(controller.canAdmit("NQ", 4).code, AdmissionReason::GroupAtLimit);
}

TEST_F(CorrelationAdmissionTest, SmallAccountTier) {
  controller.updateMarketContext(25000.0, Regime::Low);
  EXPECT_EQ(controller.limitFor("A1"), 1);
  EXPECT_EQ(controller.limitFor("A2"), 2);
  EXPECT_EQ(controller.limitFor("D1"), 1);
}

// -----------------------------------------------------------------------------
// 3. Unmapped symbols are a policy gap: admitted, recorded, and reported.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, UnmappedSymbolAdmittedAsPolicyGap) {
  const auto d = controller.tryAdmit("x1", "TSLA", 4);
  EXPECT_TRUE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::AllowedUnmapped);
  EXPECT_TRUE(d.group.empty());

  EXPECT_EQ(controller.totalPositions(), 1);
  ASSERT_EQ(controller.unmappedSymbols().size(), 1u);
  EXPECT_EQ(controller.unmappedSymbols().front(), "TSLA");

  const auto summary = controller.summary();
  bool reported = false;
  for (const auto& w : summary.warnings) {
    reported = reported || w.find("POLICY GAP: TSLA") != std::string::npos;
  }
  EXPECT_TRUE(reported);
}

TEST_F(CorrelationAdmissionTest, UnmappedSymbolRejectedWhenConfigured) {
  auto strict = std::make_shared<optguard::domain::RiskParameters>(*params);
  strict->correlation.reject_unmapped_symbols = true;
  optguard::CorrelationAdmissionController c(strict);

  const auto d = c.tryAdmit("x1", "TSLA", 4);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::UnmappedRejected);
  EXPECT_EQ(c.totalPositions(), 0);
}

// -----------------------------------------------------------------------------
// 4. Group counters always sum to the number of known positions.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, CountersStayConsistent) {
  fill("ES", 2);
  fill("GC", 1);
  fill("TSLA", 1);
  EXPECT_FALSE(controller.registerPosition("ES-0", "ES"));

  int grouped = 0;
  for (const auto& status : controller.groupStatuses()) {
    grouped += status.active;
  }
  // One unmapped position is counted outside the groups.
  EXPECT_EQ(grouped + 1, controller.totalPositions());

  EXPECT_TRUE(controller.unregisterPosition("ES-1"));
  EXPECT_FALSE(controller.unregisterPosition("ES-1"));
  EXPECT_EQ(controller.activeCount("A1"), 1);
  EXPECT_EQ(controller.totalPositions(), 3);
}

// -----------------------------------------------------------------------------
// Eight threads race for the last A1 slot and both C1 slots: exactly three
// admissions win and the group sets still add up to the total.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, ConcurrentTryAdmitTakesEachSlotOnce) {
  constexpr int kThreads = 8;
  constexpr int kAttempts = 50;
  fill("ES", 1);  // A1 1/2

  std::atomic<int> admitted{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([this, t, &admitted] {
      for (int i = 0; i < kAttempts; ++i) {
        const std::string id = std::to_string(t) + ":" + std::to_string(i);
        const char* symbol = i % 2 == 0 ? "NQ" : "CL";
        if (controller.tryAdmit(id, symbol, 4).allowed) {
          ++admitted;
        }
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }

  EXPECT_EQ(admitted.load(), 3);
  EXPECT_EQ(controller.activeCount("A1"), controller.limitFor("A1"));
  EXPECT_EQ(controller.activeCount("C1"), controller.limitFor("C1"));

  int grouped = 0;
  for (const auto& status : controller.groupStatuses()) {
    grouped += status.active;
  }
  EXPECT_EQ(grouped, controller.totalPositions());
  EXPECT_EQ(controller.totalPositions(), 4);
}

// -----------------------------------------------------------------------------
// Without market context every query tiers on the last requested phase,
// starting from phase 1 (30k, MEDIUM).
// -----------------------------------------------------------------------------
TEST(CorrelationAdmissionNoContextTest, AllQueriesShareOneTier) {
  optguard::CorrelationAdmissionController fresh{
      optguard::RiskParametersLoader::defaults()};

  EXPECT_EQ(fresh.limitFor("D1"), 2);
  fresh.registerPosition("zc-1", "ZC");
  fresh.registerPosition("zc-2", "ZS");

  const auto d = fresh.canAdmit("ZW", 1);
  EXPECT_EQ(d.code, AdmissionReason::GroupAtLimit);
  EXPECT_EQ(d.limit, 2);
  for (const auto& status : fresh.groupStatuses()) {
    if (status.group == "D1") {
      EXPECT_EQ(status.limit, 2);
    }
  }

  EXPECT_EQ(fresh.snapshot().at("context_phase"), 1);
}

TEST_F(CorrelationAdmissionTest, DuplicateIdIsRejectedByTryAdmit) {
  EXPECT_TRUE(controller.tryAdmit("p1", "GC", 4).allowed);
  const auto d = controller.tryAdmit("p1", "CL", 4);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.code, AdmissionReason::DuplicatePosition);
  EXPECT_EQ(controller.activeCount("C1"), 0);
}

// -----------------------------------------------------------------------------
// 5. Registration during hydration is unconditional (existing exposure is a
//    fact), but later admissions still see the overage.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, HydratedOverLimitStillBlocksNewEntries) {
  fill("NG", 3);  // C2 limit is 1
  EXPECT_EQ(controller.activeCount("C2"), 3);
  const auto d = controller.canAdmit("NG", 4);
  EXPECT_FALSE(d.allowed);
  EXPECT_EQ(d.current_count, 3);
}

// -----------------------------------------------------------------------------
// 6. Six equity-like positions: risk score above the 70 warning line.
//    3 A1 + 3 A2 -> 0.5*0.95*50 + 0.5*0.90*50 + 30 = 76.25
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, ConcentratedEquityPortfolioScoresAbove70) {
  fill("ES", 3);
  fill("SPY", 3);

  EXPECT_NEAR(controller.riskScore(), 76.25, 1e-9);
  EXPECT_GT(controller.riskScore(), 70.0);

  const auto s = controller.summary();
  EXPECT_EQ(s.total_positions, 6);
  EXPECT_EQ(s.groups_used.size(), 2u);
  EXPECT_FALSE(s.warnings.empty());
  // 0.05 * (3*0.95 + 3*0.90) * (1 - 0.10)
  EXPECT_NEAR(s.crisis_var, 0.24975, 1e-9);
  EXPECT_NEAR(controller.crisisVaR(), s.crisis_var, 1e-12);
}

TEST_F(CorrelationAdmissionTest, DiversifiedPortfolioScoresLow) {
  fill("GC", 1);
  fill("CL", 1);
  fill("ZC", 1);
  fill("6E", 1);

  const double score = controller.riskScore();
  EXPECT_LT(score, 30.0);
  EXPECT_GE(score, 0.0);

  const auto s = controller.summary();
  EXPECT_EQ(s.groups_used.size(), 4u);
  EXPECT_FALSE(s.opportunities.empty());
}

TEST_F(CorrelationAdmissionTest, EmptyPortfolio) {
  EXPECT_DOUBLE_EQ(controller.riskScore(), 0.0);
  EXPECT_DOUBLE_EQ(controller.crisisVaR(), 0.0);
}

// -----------------------------------------------------------------------------
// 7. Stress scenario: six equity-like positions through a VIX spike to 65.7.
// Why: This is the concentration that admission control exists to stop; the
//      replay must rate it EXTREME and bound the loss well under the
//      unprotected figure.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, StressTestEquityConcentrationIsExtreme) {
  std::vector<optguard::StressPosition> scenario{
      {"ES", 10000.0},  {"NQ", 10000.0},  {"MES", 10000.0},
      {"SPY", 10000.0}, {"QQQ", 10000.0}, {"IWM", 10000.0}};

  const auto r = controller.stressTest(scenario, 65.7);
  EXPECT_EQ(r.risk_level, optguard::StressRiskLevel::Extreme);
  EXPECT_GE(r.violation_count, 3);
  EXPECT_DOUBLE_EQ(r.total_value, 60000.0);
  EXPECT_DOUBLE_EQ(r.unprotected_loss, 60000.0);
  EXPECT_GT(r.estimated_loss, 0.0);
  EXPECT_LE(r.loss_rate, 0.5);
  EXPECT_LT(r.estimated_loss, r.unprotected_loss * 0.6);
  EXPECT_GT(r.risk_score, 70.0);
  EXPECT_FALSE(r.recommendations.empty());
  EXPECT_STREQ(optguard::toString(r.risk_level), "EXTREME");
}

TEST_F(CorrelationAdmissionTest, StressTestCompliantPortfolioIsNormal) {
  std::vector<optguard::StressPosition> scenario{
      {"ES", 5000.0}, {"GC", 5000.0}, {"ZC", 5000.0}};

  const auto r = controller.stressTest(scenario, 20.0);
  EXPECT_EQ(r.violation_count, 0);
  EXPECT_EQ(r.risk_level, optguard::StressRiskLevel::Normal);
  EXPECT_NEAR(r.loss_rate, 0.20, 1e-12);
}

// -----------------------------------------------------------------------------
// 8. Restoring a snapshot reproduces the same admission outcomes.
// -----------------------------------------------------------------------------
TEST_F(CorrelationAdmissionTest, SnapshotRestoreReproducesDecisions) {
  fill("ES", 2);
  fill("SPY", 1);
  fill("NG", 1);
  fill("TSLA", 1);

  const auto snap = controller.snapshot();
  optguard::CorrelationAdmissionController restored(params);
  restored.restore(snap);

  for (const auto* symbol :
       {"ES", "SPY", "QQQ", "NG", "GC", "CL", "ZC", "LE", "6E", "TSLA"}) {
    const auto a = controller.canAdmit(symbol, 4);
    const auto b = restored.canAdmit(symbol, 4);
    EXPECT_EQ(a.allowed, b.allowed) << symbol;
    EXPECT_EQ(a.code, b.code) << symbol;
    EXPECT_EQ(a.current_count, b.current_count) << symbol;
    EXPECT_EQ(a.limit, b.limit) << symbol;
  }
  EXPECT_EQ(restored.totalPositions(), controller.totalPositions());
}

TEST_F(CorrelationAdmissionTest, MalformedSnapshotThrows) {
  EXPECT_THROW(controller.restore(nlohmann::json::object()),
               std::invalid_argument);
  auto snap = controller.snapshot();
  snap["regime"] = 9;
  EXPECT_THROW(controller.restore(snap), std::invalid_argument);
}
