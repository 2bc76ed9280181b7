// -----------------------------------------------------------------------------
// optguard_service — decision core as a standalone process.
//
//   optguard_service [config.json] [cmd_endpoint] [pub_endpoint] [positions.json]
//
//   1) Load and validate the RiskParameters table. Invalid configuration
//      is fatal: the process exits non-zero before anything binds.
//   2) Build the DecisionService on the wall clock and attach console
//      loggers to the decision events.
//   3) Hydrate previously open positions (optional file) and open the
//      ZeroMQ command/telemetry sockets.
//   4) Idle until SIGINT, then stop cleanly.
//
// Thread layout:
//   main thread   -> waits for SIGINT
//   IPC thread    -> IpcServer (commands + telemetry), calls into the core
// -----------------------------------------------------------------------------

#include "optguard/codec/json_codec.hpp"
#include "optguard/config/risk_parameters_loader.hpp"
#include "optguard/engine/decision_service.hpp"
#include "optguard/errors/errors.hpp"
#include "optguard/events/event.hpp"
#include "optguard/source/i_position_source.hpp"
#include "optguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// The only global: set from the SIGINT handler, polled by main().
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

int main(int argc, char** argv) {
  const std::string config_path =
      argc > 1 ? argv[1] : "config/risk_parameters.json";
  const std::string cmd_endpoint = argc > 2 ? argv[2] : "tcp://127.0.0.1:5556";
  const std::string pub_endpoint = argc > 3 ? argv[3] : "tcp://127.0.0.1:5557";
  const std::string positions_path = argc > 4 ? argv[4] : "";

  // -------------------------------------------------------------------------
  // 1) Policy table.
  // -------------------------------------------------------------------------
  std::shared_ptr<const optguard::domain::RiskParameters> params;
  try {
    params = optguard::RiskParametersLoader::fromFile(config_path);
  } catch (const optguard::ConfigError& e) {
    std::cerr << "[main] refusing to start: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Service and console loggers.
  // -------------------------------------------------------------------------
  optguard::LiveTimeProvider clock;
  optguard::DecisionService service(params, clock, cmd_endpoint, pub_endpoint);

  service.eventBus().subscribe<optguard::ProtocolChangeEvent>(
      [](const optguard::ProtocolChangeEvent& e) {
        std::cout << "[Telemetry] protocol "
                  << optguard::domain::toString(e.from) << " -> "
                  << optguard::domain::toString(e.to) << " (VIX "
                  << e.directive.vix << ")\n";
      });

  service.eventBus().subscribe<optguard::CoreHaltEvent>(
      [](const optguard::CoreHaltEvent& e) {
        std::cerr << "[Telemetry] CORE HALTED: " << e.reason << "\n";
      });

  service.eventBus().subscribe<optguard::LifecycleActionEvent>(
      [](const optguard::LifecycleActionEvent& e) {
        std::cout << "[Telemetry] " << optguard::codec::eventToJson(e).dump()
                  << "\n";
      });

  // -------------------------------------------------------------------------
  // 3) Hydrate and go live.
  // -------------------------------------------------------------------------
  try {
    if (positions_path.empty()) {
      service.start();
    } else {
      optguard::JsonFilePositionSource source(positions_path);
      service.start(&source);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] start-up failed: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] decision core ready. Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C.
  // -------------------------------------------------------------------------
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  service.stop();
  return 0;
}
