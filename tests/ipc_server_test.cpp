// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Telemetry framing for optguard::IpcServer. No sockets are opened: the
// server is never started.
//
// Validates:
//   - Each decision event maps to its topic frame and JSON payload
//   - pushTelemetry() on a stopped server only buffers, bounded
// =============================================================================

#include "optguard/network/ipc_server.hpp"
#include "optguard/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

TEST(IpcServerTelemetryTest, TopicMatchesPayloadType) {
  optguard::LifecycleActionEvent e;
  e.position_id = "lt-1";
  e.symbol = "SPY";
  e.action = optguard::domain::LifecycleAction::Defend;
  e.from_state = optguard::domain::LifecycleState::Open;
  e.to_state = optguard::domain::LifecycleState::Challenged;
  e.reason = "21 DTE <= 21 DTE defensive threshold";
  e.timestamp = optguard::ms_to_timestamp(1000);

  const auto [topic, payload] = optguard::IpcServer::formatTelemetry(e);
  EXPECT_EQ(topic, "lifecycle_action");

  const auto j = nlohmann::json::parse(payload);
  EXPECT_EQ(j.at("type"), topic);
  EXPECT_EQ(j.at("position_id"), "lt-1");
  EXPECT_EQ(j.at("action"), "DEFEND");
  EXPECT_EQ(j.at("to_state"), "CHALLENGED");
}

TEST(IpcServerTelemetryTest, EveryEventHasATopic) {
  const std::vector<optguard::Event> events{
      optguard::PhaseTransitionEvent{1, 2, 40000.0, {}},
      optguard::RegimeChangeEvent{},
      optguard::AdmissionDecisionEvent{},
      optguard::ProtocolChangeEvent{},
      optguard::CoreHaltEvent{"operator", {}}};
  const std::vector<std::string> topics{"phase_transition", "regime_change",
                                        "admission_decision", "protocol_change",
                                        "core_halt"};
  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(optguard::IpcServer::formatTelemetry(events[i]).first, topics[i]);
  }
}

TEST(IpcServerTelemetryTest, StoppedServerBuffersWithinCapacity) {
  optguard::IpcServer server([](const std::string&) { return std::string(); });
  for (std::size_t i = 0; i < optguard::IpcServer::kTelemetryCapacity + 5; ++i) {
    server.pushTelemetry(optguard::CoreHaltEvent{"x", {}});
  }
  EXPECT_EQ(server.droppedTelemetry(), 5u);
}
