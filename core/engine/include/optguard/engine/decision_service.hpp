#pragma once

#include "optguard/domain/risk_parameters.hpp"
#include "optguard/engine/decision_core.hpp"
#include "optguard/eventbus/event_bus.hpp"
#include "optguard/network/ipc_server.hpp"
#include "optguard/source/i_position_source.hpp"
#include "optguard/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace optguard {

// -----------------------------------------------------------------------------
// DecisionService — process-level wrapper that exposes DecisionCore over IPC
// -----------------------------------------------------------------------------
//
// @brief  Owns the EventBus, the DecisionCore and (optionally) the IpcServer,
//         and translates command strings into core calls.
//
// @details
// Start-up order:
//   1. Hydrate already-open positions from the IPositionSource (if any).
//   2. Start the IpcServer when both endpoints are non-empty, and forward
//      every bus event to its telemetry queue.
//
// Commands (REP socket, one reply per request):
//
//   Plain text:  PING | STATUS | HALT
//   JSON object: {"cmd": "ADMIT",     "candidate", "account", "market",
//                                     "dry_run"?}
//                {"cmd": "SIZE",      "strategy", "win_rate"?, "avg_win"?,
//                                     "avg_loss"?}
//                {"cmd": "LIFECYCLE", "position_id", "market"}
//                {"cmd": "DEFEND",    "position_id", "chain", "now_ms"?}
//                {"cmd": "SWEEP",     "market"}
//                {"cmd": "PROTOCOL",  "market"}
//                {"cmd": "FILL",      "position_id", "fill"}
//                {"cmd": "SNAPSHOT"}
//                {"cmd": "STRESS",    "positions", "vix"}
//
// Every reply is a JSON object with "status" = "ok" | "error".
//
// Thread-safety:
//   executeCommand() runs on the IPC thread; DecisionCore serializes it
//   against any in-process caller.
//
// Ownership:
//   Owns the bus, the core and the IPC server. The time provider is
//   borrowed and must outlive the service.
// -----------------------------------------------------------------------------
class DecisionService {
 public:
  DecisionService(std::shared_ptr<const domain::RiskParameters> params,
                  const ITimeProvider& clock,
                  std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                  std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~DecisionService();

  DecisionService(const DecisionService&) = delete;
  DecisionService& operator=(const DecisionService&) = delete;

  // Idempotent. source may be null.
  void start(IPositionSource* source = nullptr);

  // Stops the IPC server. Idempotent.
  void stop();

  std::string executeCommand(const std::string& cmd);

  DecisionCore& core() { return core_; }
  EventBus& eventBus() { return bus_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);
  nlohmann::json status() const;

  const ITimeProvider& clock_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  // The bus must be constructed before the core that publishes on it.
  EventBus bus_;
  DecisionCore core_;

  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_subscription_{0};
  bool running_{false};
};

}  // namespace optguard
