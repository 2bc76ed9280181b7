#pragma once

#include "optguard/correlation/correlation_admission_controller.hpp"
#include "optguard/data/data_quality.hpp"
#include "optguard/domain/account.hpp"
#include "optguard/domain/admission.hpp"
#include "optguard/domain/lifecycle.hpp"
#include "optguard/domain/market_data.hpp"
#include "optguard/domain/position.hpp"
#include "optguard/domain/protocol.hpp"
#include "optguard/domain/regime.hpp"
#include "optguard/events/event.hpp"
#include "optguard/phase/phase_manager.hpp"
#include "optguard/sizing/position_sizer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

// -----------------------------------------------------------------------------
// JSON codec for the wire and persistence formats
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks (to_json / from_json) for the domain
//         types that cross the command socket, the telemetry socket or the
//         position file.
//
// @details
// Enums travel as their upper-case names ("PUT", "CHALLENGED", ...). Parsing
// an unknown name throws std::invalid_argument; a missing required key
// surfaces as nlohmann::json::exception. Both are caught at the command
// boundary in DecisionService and turned into an error reply.
// -----------------------------------------------------------------------------

namespace optguard {
namespace domain {

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const OptionContract& c);
void from_json(const nlohmann::json& j, OptionContract& c);

void from_json(const nlohmann::json& j, AdmissionCandidate& c);
void from_json(const nlohmann::json& j, AccountSnapshot& a);
void from_json(const nlohmann::json& j, FillDetails& f);

void to_json(nlohmann::json& j, const Account& a);
void to_json(nlohmann::json& j, const AdmissionDecision& d);
void to_json(nlohmann::json& j, const LifecycleDecision& d);
void to_json(nlohmann::json& j, const DefensePlan& p);
void to_json(nlohmann::json& j, const ProtocolDirective& d);
void to_json(nlohmann::json& j, const RegimeReading& r);

}  // namespace domain

void to_json(nlohmann::json& j, const SizingResult& r);
void to_json(nlohmann::json& j, const PhaseMetrics& m);
void to_json(nlohmann::json& j, const CorrelationSummary& s);
void to_json(nlohmann::json& j, const StressTestResult& r);

namespace codec {

domain::Regime parseRegime(const std::string& s);
domain::LifecycleState parseLifecycleState(const std::string& s);
domain::OptionRight parseOptionRight(const std::string& s);
domain::FillKind parseFillKind(const std::string& s);
domain::DataSeverity parseDataSeverity(const std::string& s);

// -----------------------------------------------------------------------------
// marketFromJson()
// -----------------------------------------------------------------------------
//
// @brief  Builds a MarketSnapshot from raw readings, letting the
//         data-quality classifier assign the MarketValue alternatives.
//
// @details
//   {
//     "now_ms": 1723000000000,       // optional, default_now_ms if absent
//     "session_minute": 600,         // exchange-local minutes after midnight
//     "vix": 18.2,                   // number or null
//     "vix_age_ms": 0,               // optional
//     "underlyings": {"SPY": 545.1, "QQQ": null},
//     "option_marks": {"pos-1": 1.25}
//   }
// -----------------------------------------------------------------------------
domain::MarketSnapshot marketFromJson(const nlohmann::json& j,
                                      const DataQualityClassifier& quality,
                                      std::int64_t default_now_ms);

nlohmann::json marketValueToJson(const domain::MarketValue& v);

// Telemetry representation of a decision event ("type" + payload).
nlohmann::json eventToJson(const Event& event);

}  // namespace codec
}  // namespace optguard
