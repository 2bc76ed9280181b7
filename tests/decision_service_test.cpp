// =============================================================================
// decision_service_test.cpp
// =============================================================================
// Command-protocol tests for optguard::DecisionService in in-process mode
// (empty endpoints, no sockets are opened).
//
// Validates:
//   - Plain-text PING / STATUS / HALT
//   - JSON ADMIT (dry run and registering), SIZE, SWEEP, FILL, STRESS
//   - Error replies: unknown command, malformed request, missing data
//   - Hydration through an IPositionSource on start()
// =============================================================================

#include "optguard/engine/decision_service.hpp"
#include "optguard/time/simulation_time_provider.hpp"
#include "optguard/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr std::int64_t kNow = 1760000000000;

class FixedPositionSource : public optguard::IPositionSource {
 public:
  explicit FixedPositionSource(std::vector<optguard::domain::Position> positions)
      : positions_(std::move(positions)) {}

  std::vector<optguard::domain::Position> loadOpenPositions() override {
    return positions_;
  }

 private:
  std::vector<optguard::domain::Position> positions_;
};

nlohmann::json admitRequest(const std::string& id, const std::string& symbol,
                            bool dry_run = false) {
  return {{"cmd", "ADMIT"},
          {"dry_run", dry_run},
          {"candidate",
           {{"position_id", id},
            {"symbol", symbol},
            {"strategy", "LONG_TERM_112"},
            {"expiry_ms", kNow + 120 * optguard::kMillisPerDay},
            {"quantity", -1},
            {"entry_cost_basis", 10.0}}},
          {"account", {{"account_id", "acct-1"}, {"equity", 50000.0},
                       {"buying_power_used", 0.1}}},
          {"market", {{"now_ms", kNow}, {"session_minute", 720}, {"vix", 18.0}}}};
}

}  // namespace

class DecisionServiceTest : public ::testing::Test {
 protected:
  nlohmann::json send(const std::string& cmd) {
    return nlohmann::json::parse(service.executeCommand(cmd));
  }
  nlohmann::json send(const nlohmann::json& request) {
    return send(request.dump());
  }

  optguard::SimulationTimeProvider clock{kNow};
  optguard::DecisionService service{
      std::make_shared<const optguard::domain::RiskParameters>(), clock, "", ""};
};

TEST_F(DecisionServiceTest, PlainTextCommands) {
  service.start();

  const auto ping = send("PING");
  EXPECT_EQ(ping.at("status"), "ok");
  EXPECT_EQ(ping.at("response"), "PONG");

  const auto status = send("STATUS");
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("halted"), false);
  EXPECT_EQ(status.at("parameters_version"), "builtin-1");
  EXPECT_EQ(status.at("protocol"), "NORMAL");
  EXPECT_TRUE(status.at("positions").empty());

  EXPECT_EQ(send("HALT").at("response"), "Admissions halted");
  EXPECT_TRUE(service.core().isHalted());
  EXPECT_EQ(send("STATUS").at("halted"), true);
}

TEST_F(DecisionServiceTest, UnknownAndMalformedRequests) {
  const auto unknown = send("FLY_TO_MOON");
  EXPECT_EQ(unknown.at("status"), "error");
  EXPECT_EQ(unknown.at("response"), "Unknown command: FLY_TO_MOON");

  EXPECT_EQ(send(nlohmann::json{{"cmd", "DANCE"}}).at("response"),
            "Unknown command: DANCE");
  EXPECT_EQ(send(nlohmann::json{{"no_cmd", 1}}).at("status"), "error");

  // ADMIT without an account.
  auto request = admitRequest("es-1", "ES");
  request.erase("account");
  const auto malformed = send(request);
  EXPECT_EQ(malformed.at("status"), "error");
  EXPECT_NE(malformed.at("response").get<std::string>().find("malformed request"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// Dry run leaves the book untouched; the real ADMIT registers the position.
// -----------------------------------------------------------------------------
TEST_F(DecisionServiceTest, AdmitOverJson) {
  const auto dry = send(admitRequest("es-1", "ES", true));
  EXPECT_EQ(dry.at("decision").at("allowed"), true);
  EXPECT_TRUE(service.core().positions().empty());

  const auto admitted = send(admitRequest("es-1", "ES"));
  EXPECT_EQ(admitted.at("status"), "ok");
  EXPECT_EQ(admitted.at("decision").at("code"), "ALLOWED");
  EXPECT_EQ(service.core().positions().size(), 1u);

  send(admitRequest("mes-1", "MES"));
  const auto denied = send(admitRequest("nq-1", "NQ"));
  EXPECT_EQ(denied.at("status"), "ok");
  EXPECT_EQ(denied.at("decision").at("allowed"), false);
  EXPECT_EQ(denied.at("decision").at("code"), "GROUP_AT_LIMIT");
  EXPECT_EQ(denied.at("decision").at("group"), "A1");
}

// -----------------------------------------------------------------------------
// A VIX gap mid-session is CRITICAL and surfaces as DATA_UNAVAILABLE.
// -----------------------------------------------------------------------------
TEST_F(DecisionServiceTest, MissingVixReportsDataUnavailable) {
  auto request = admitRequest("es-1", "ES");
  request["market"]["vix"] = nullptr;

  const auto reply = send(request);
  EXPECT_EQ(reply.at("status"), "error");
  EXPECT_EQ(reply.at("error"), "DATA_UNAVAILABLE");
  EXPECT_EQ(reply.at("instrument"), "VIX");
  EXPECT_EQ(reply.at("severity"), "CRITICAL");
  EXPECT_FALSE(service.core().isHalted());
}

TEST_F(DecisionServiceTest, SizeSweepAndStress) {
  send(admitRequest("es-1", "ES"));

  const auto sized =
      send(nlohmann::json{{"cmd", "SIZE"}, {"strategy", "LONG_TERM_112"}});
  EXPECT_EQ(sized.at("sizing").at("should_trade"), true);
  EXPECT_DOUBLE_EQ(sized.at("sizing").at("risk_fraction").get<double>(), 0.04);

  const auto sweep = send(nlohmann::json{
      {"cmd", "SWEEP"},
      {"market", {{"now_ms", kNow}, {"session_minute", 720}, {"vix", 18.0}}}});
  EXPECT_EQ(sweep.at("sweep").at("directive").at("level"), "NORMAL");
  EXPECT_TRUE(sweep.at("sweep").at("instructions").empty());

  const auto stress = send(nlohmann::json{
      {"cmd", "STRESS"},
      {"vix", 50.0},
      {"positions", {{{"symbol", "ES"}, {"value", 10000.0}},
                     {{"symbol", "MES"}, {"value", 5000.0}}}}});
  EXPECT_EQ(stress.at("status"), "ok");
  EXPECT_DOUBLE_EQ(stress.at("stress").at("total_value").get<double>(), 15000.0);
}

TEST_F(DecisionServiceTest, FillAndLogicErrors) {
  send(admitRequest("es-1", "ES"));

  const auto closed = send(nlohmann::json{
      {"cmd", "FILL"},
      {"position_id", "es-1"},
      {"fill", {{"kind", "CLOSE"}, {"price", 3.2}}}});
  EXPECT_EQ(closed.at("status"), "ok");
  EXPECT_TRUE(service.core().positions().empty());

  // Unknown position ids come back as errors, not crashes.
  const auto unknown = send(nlohmann::json{
      {"cmd", "FILL"},
      {"position_id", "es-1"},
      {"fill", {{"kind", "CLOSE"}, {"price", 3.2}}}});
  EXPECT_EQ(unknown.at("status"), "error");

  send(admitRequest("es-2", "ES"));
  const auto defend = send(nlohmann::json{
      {"cmd", "DEFEND"}, {"position_id", "es-2"}, {"chain", nlohmann::json::array()}});
  EXPECT_EQ(defend.at("status"), "error");
}

TEST_F(DecisionServiceTest, StartHydratesFromSource) {
  optguard::domain::Position p;
  p.id = "cl-1";
  p.symbol = "CL";
  p.strategy = "FUTURES_STRANGLES";
  p.expiry_ms = kNow + 40 * optguard::kMillisPerDay;
  p.entry_cost_basis = 2.0;
  p.current_mark = 2.0;
  p.quantity = -1;

  FixedPositionSource source({p});
  service.start(&source);
  service.start(&source);

  const auto snapshot = send(nlohmann::json{{"cmd", "SNAPSHOT"}});
  ASSERT_EQ(snapshot.at("positions").size(), 1u);
  EXPECT_EQ(snapshot.at("positions")[0].at("correlation_group"), "C1");
  EXPECT_TRUE(snapshot.contains("counters"));

  service.stop();
  service.stop();
}
