#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "authgate/AlertAggregator.h"
#include "authgate/AlertStore.h"
#include "authgate/AuditStore.h"
#include "authgate/Common.h"
#include "authgate/Enrichment.h"
#include "authgate/Gateway.h"
#include "authgate/TrustScorer.h"
#include "authgate/Validator.h"

namespace authgate::json {

using nlohmann::json;

struct ParseStatus {
  bool ok{false};
  std::string error;
};

// Accepts {"session_id"?, "label"?, "signals": {<type>: {...}}} and the flat
// form with signal objects at the top level. Signal names may use the legacy
// spellings. Scalar fields are carried as text; nested values are dropped.
// A missing session_id is generated.
ParseStatus parse_bundle(const json& in, SignalBundle& out);
ParseStatus parse_bundle(std::string_view text, SignalBundle& out);

json to_json(const SignalRecord& rec);
json to_json(const EnrichmentResult& e);

// {validated: {vector, weights, reasons}, quality, cross, enrichment}
json validator_response(const ValidatedVector& vec, const EnrichmentResult& enrichment);
// {vector, weights, reasons, siem: {high, medium}}
json trust_request(const ValidatedVector& vec, const AlertWindowCount& alerts);
// {risk, decision, stride_categories, confidence, ...}
json trust_response(const RiskAssessment& a);
// {session_id, enforcement, risk, persistence, step_up?}
json gateway_response(const GatewayResult& r);

json to_json(const EnforcementRecord& rec);
json to_json(const AlertRecord& rec);
ParseStatus parse_alert(const json& in, AlertRecord& out);

// Search-index document: "@timestamp" plus upper-cased reason tokens.
json telemetry_document(const EnforcementRecord& rec);

} // namespace authgate::json
