#include "optguard/engine/decision_service.hpp"

#include "optguard/codec/json_codec.hpp"
#include "optguard/data/data_quality.hpp"
#include "optguard/errors/errors.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace optguard {

namespace {

nlohmann::json sweepToJson(const SweepReport& report) {
  nlohmann::json instructions = nlohmann::json::array();
  for (const auto& i : report.instructions) {
    instructions.push_back({{"position_id", i.position_id},
                            {"symbol", i.symbol},
                            {"action", domain::toString(i.action)},
                            {"reason", i.reason}});
  }
  nlohmann::json errors = nlohmann::json::array();
  for (const auto& e : report.errors) {
    errors.push_back({{"instrument", e.instrument},
                      {"severity", domain::toString(e.severity)},
                      {"reason", e.reason}});
  }
  return {{"directive", report.directive},
          {"instructions", std::move(instructions)},
          {"errors", std::move(errors)}};
}

nlohmann::json ok(nlohmann::json body) {
  body["status"] = "ok";
  return body;
}

nlohmann::json error(const std::string& message) {
  return {{"status", "error"}, {"response", message}};
}

}  // namespace

DecisionService::DecisionService(
    std::shared_ptr<const domain::RiskParameters> params,
    const ITimeProvider& clock, std::string cmd_endpoint,
    std::string pub_endpoint)
    : clock_(clock),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      core_(std::move(params), bus_, clock) {}

DecisionService::~DecisionService() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void DecisionService::start(IPositionSource* source) {
  if (running_) {
    return;
  }

  // ---  1) Hydrate open positions ------------------------------------------
  if (source != nullptr) {
    auto positions = source->loadOpenPositions();
    core_.hydrate(positions);
    std::cout << "[DecisionService] Hydration complete: " << positions.size()
              << " position(s) supplied.\n";
  }

  // ---  2) IPC (skipped when endpoints are empty, e.g. unit tests) ---------
  if (!cmd_endpoint_.empty() && !pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cmd_endpoint_, pub_endpoint_);
    ipc_server_->start();

    telemetry_subscription_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  running_ = true;
  std::cout << "[DecisionService] started (parameters '"
            << core_.parameters()->version << "', "
            << (ipc_server_ ? "IPC enabled" : "in-process only") << ").\n";
}

void DecisionService::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    bus_.unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }

  running_ = false;
  std::cout << "[DecisionService] stopped.\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): plain-text commands first, then JSON requests
// -----------------------------------------------------------------------------
std::string DecisionService::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
    return response.dump();
  }
  if (cmd == "STATUS") {
    return ok(status()).dump();
  }
  if (cmd == "HALT") {
    core_.halt("operator HALT command");
    response["status"] = "ok";
    response["response"] = "Admissions halted";
    return response.dump();
  }

  try {
    const auto request = nlohmann::json::parse(cmd);
    if (!request.is_object() || !request.contains("cmd")) {
      return error("Unknown command: " + cmd).dump();
    }
    response = dispatch(request);
  } catch (const nlohmann::json::parse_error&) {
    response = error("Unknown command: " + cmd);
  } catch (const nlohmann::json::exception& e) {
    response = error(std::string("malformed request: ") + e.what());
  } catch (const DataUnavailableError& e) {
    response = error(e.what());
    response["error"] = "DATA_UNAVAILABLE";
    response["instrument"] = e.instrument();
    response["severity"] = domain::toString(e.severity());
  } catch (const std::logic_error& e) {
    response = error(e.what());
  } catch (const std::runtime_error& e) {
    response = error(e.what());
  }

  return response.dump();
}

nlohmann::json DecisionService::dispatch(const nlohmann::json& request) {
  const auto name = request.at("cmd").get<std::string>();
  const DataQualityClassifier quality(core_.parameters()->data_quality);

  if (name == "ADMIT") {
    const auto candidate =
        request.at("candidate").get<domain::AdmissionCandidate>();
    const auto account = request.at("account").get<domain::AccountSnapshot>();
    const auto market =
        codec::marketFromJson(request.at("market"), quality, clock_.now_ms());
    const auto decision = request.value("dry_run", false)
                              ? core_.evaluateAdmission(candidate, account, market)
                              : core_.admit(candidate, account, market);
    return ok({{"decision", decision}});
  }

  if (name == "SIZE") {
    const auto strategy = request.at("strategy").get<std::string>();
    SizingResult result;
    if (request.contains("win_rate")) {
      result = core_.sizePosition(strategy, request.at("win_rate").get<double>(),
                                  request.at("avg_win").get<double>(),
                                  request.at("avg_loss").get<double>());
    } else {
      result = core_.sizePosition(strategy);
    }
    return ok({{"sizing", result}});
  }

  if (name == "LIFECYCLE") {
    const auto id = request.at("position_id").get<std::string>();
    const auto market =
        codec::marketFromJson(request.at("market"), quality, clock_.now_ms());
    return ok({{"decision", core_.evaluatePositionLifecycle(id, market)}});
  }

  if (name == "DEFEND") {
    const auto id = request.at("position_id").get<std::string>();
    const auto chain =
        request.at("chain").get<std::vector<domain::OptionContract>>();
    const auto now_ms = request.value("now_ms", clock_.now_ms());
    return ok({{"plan", core_.planDefense(id, chain, now_ms)}});
  }

  if (name == "SWEEP") {
    const auto market =
        codec::marketFromJson(request.at("market"), quality, clock_.now_ms());
    return ok({{"sweep", sweepToJson(core_.sweep(market))}});
  }

  if (name == "PROTOCOL") {
    const auto market =
        codec::marketFromJson(request.at("market"), quality, clock_.now_ms());
    return ok({{"directive", core_.currentProtocol(market)}});
  }

  if (name == "FILL") {
    const auto id = request.at("position_id").get<std::string>();
    core_.registerFill(id, request.at("fill").get<domain::FillDetails>());
    return ok({{"response", "fill registered for " + id}});
  }

  if (name == "SNAPSHOT") {
    auto body = status();
    body["counters"] = core_.snapshotCounters();
    return ok(std::move(body));
  }

  if (name == "STRESS") {
    std::vector<StressPosition> scenario;
    for (const auto& p : request.at("positions")) {
      scenario.push_back(
          {p.at("symbol").get<std::string>(), p.at("value").get<double>()});
    }
    return ok(
        {{"stress", core_.stressTest(scenario, request.at("vix").get<double>())}});
  }

  return error("Unknown command: " + name);
}

nlohmann::json DecisionService::status() const {
  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : core_.positions()) {
    positions.push_back(p);
  }
  return {{"halted", core_.isHalted()},
          {"parameters_version", core_.parameters()->version},
          {"protocol", domain::toString(core_.protocolLevel())},
          {"account", core_.account()},
          {"phase", core_.phaseMetrics()},
          {"correlation", core_.correlationSummary()},
          {"positions", std::move(positions)}};
}

}  // namespace optguard
