#include "authgate/json/Codec.h"
#include "authgate/Util.h"
#include <cmath>

namespace authgate::json {

namespace {

std::optional<std::string> scalar_text(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_boolean()) return std::string(v.get<bool>() ? "true" : "false");
  if (v.is_number_unsigned()) return std::to_string(v.get<uint64_t>());
  if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
  if (v.is_number_float()) {
    double d = v.get<double>();
    if (!std::isfinite(d)) return std::nullopt;
    return v.dump();
  }
  return std::nullopt;
}

SignalRecord record_from(const json& obj) {
  SignalRecord rec;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (auto s = scalar_text(it.value())) rec[it.key()] = *s;
  }
  return rec;
}

void add_signals(const json& obj, SignalBundle& out, bool strict_shape) {
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    auto type = parse_signal_type(it.key());
    if (!type) continue;
    if (!it.value().is_object()) {
      // Flat form: a top-level key that looks like a signal but is not an
      // object is someone else's field.
      if (strict_shape) out.signals[*type] = SignalRecord{};
      continue;
    }
    out.signals[*type] = record_from(it.value());
  }
}

json weights_json(const ValidatedVector& vec) {
  json w = json::object();
  for (const auto& [type, value] : vec.weights) w[std::string(to_string(type))] = value;
  return w;
}

json reasons_json(const std::set<AnomalyReason>& reasons) {
  json r = json::array();
  for (AnomalyReason reason : reasons) r.push_back(std::string(to_string(reason)));
  return r;
}

json vector_json(const SignalBundle& b) {
  json v = json::object();
  for (const auto& [type, rec] : b.signals) v[std::string(to_string(type))] = to_json(rec);
  return v;
}

json point_json(const GeoPoint& p) { return json{{"lat", p.lat}, {"lon", p.lon}}; }

} // namespace

ParseStatus parse_bundle(const json& in, SignalBundle& out) {
  if (!in.is_object()) return {false, "request must be a JSON object"};
  SignalBundle b{};

  auto sid = in.find("session_id");
  if (sid != in.end() && !sid->is_null()) {
    if (!sid->is_string()) return {false, "session_id must be a string"};
    b.session_id = trim(sid->get<std::string>());
  }
  auto label = in.find("label");
  if (label != in.end() && !label->is_null()) {
    if (!label->is_string()) return {false, "label must be a string"};
    std::string l = trim(label->get<std::string>());
    if (!l.empty()) b.label = l;
  }

  auto sig = in.find("signals");
  if (sig != in.end()) {
    if (!sig->is_object()) return {false, "signals must be an object"};
    add_signals(*sig, b, true);
  } else {
    add_signals(in, b, false);
  }

  if (b.session_id.empty()) b.session_id = generate_session_id();
  out = std::move(b);
  return {true, {}};
}

ParseStatus parse_bundle(std::string_view text, SignalBundle& out) {
  json in = json::parse(text.begin(), text.end(), nullptr, false);
  if (in.is_discarded()) return {false, "malformed JSON"};
  return parse_bundle(in, out);
}

json to_json(const SignalRecord& rec) {
  json o = json::object();
  for (const auto& [k, v] : rec) o[k] = v;
  return o;
}

json to_json(const EnrichmentResult& e) {
  json o = json::object();
  if (e.geo) {
    o["ip_origin"] = json{{"country", e.geo->country},
                          {"city", e.geo->city},
                          {"location", point_json(e.geo->location)},
                          {"anonymous", e.geo->anonymous}};
  }
  if (e.wifi) {
    o["wifi_ap"] = json{{"ssid", e.wifi->ssid}, {"location", point_json(e.wifi->location)}};
  }
  if (e.tls) o["tls_fingerprint"] = json{{"tag", e.tls->tag}};
  if (e.device) {
    json d{{"os", e.device->os}, {"edr", e.device->edr}};
    d["patched"] = e.device->patched ? json(*e.device->patched) : json(nullptr);
    if (e.device->last_update_day) d["last_update_day"] = *e.device->last_update_day;
    o["device_posture"] = d;
  }
  json checks = json::array();
  for (const auto& c : e.checks) {
    checks.push_back(json{{"metric_name", c.metric_name},
                          {"value", c.value},
                          {"threshold", c.threshold},
                          {"subject", std::string(to_string(c.subject))},
                          {"reference", std::string(to_string(c.reference))}});
  }
  o["checks"] = checks;
  return o;
}

json validator_response(const ValidatedVector& vec, const EnrichmentResult& enrichment) {
  json quality = json::object();
  for (const auto& [type, q] : vec.quality) {
    quality[std::string(to_string(type))] = std::string(to_string(q));
  }
  json cross = json::array();
  for (const auto& c : vec.cross) {
    cross.push_back(json{{"metric_name", c.check.metric_name},
                         {"value", c.check.value},
                         {"threshold", c.check.threshold},
                         {"applied", c.applied},
                         {"violated", c.violated}});
  }
  return json{{"validated",
               {{"vector", vector_json(vec.signals)},
                {"weights", weights_json(vec)},
                {"reasons", reasons_json(vec.reasons)}}},
              {"quality", quality},
              {"cross", cross},
              {"enrichment", to_json(enrichment)}};
}

json trust_request(const ValidatedVector& vec, const AlertWindowCount& alerts) {
  return json{{"vector", vector_json(vec.signals)},
              {"weights", weights_json(vec)},
              {"reasons", reasons_json(vec.reasons)},
              {"siem", {{"high", alerts.high}, {"medium", alerts.medium}}}};
}

json trust_response(const RiskAssessment& a) {
  json strides = json::array();
  for (StrideCategory c : a.stride_categories) strides.push_back(std::string(to_string(c)));
  json o{{"risk", a.risk},
         {"decision", std::string(to_string(a.decision))},
         {"stride_categories", strides},
         {"confidence", a.confidence},
         {"components",
          {{"base", a.components.base},
           {"reasons", a.components.reasons},
           {"alerts", a.components.alerts},
           {"adjustment_factor", a.components.adjustment_factor}}}};
  if (a.dominant_stride) o["dominant_stride"] = std::string(to_string(*a.dominant_stride));
  return o;
}

json gateway_response(const GatewayResult& r) {
  if (r.status == GatewayStatus::Cancelled) {
    return json{{"session_id", r.record.session_id}, {"status", "cancelled"}};
  }
  json persistence{{"ok", r.persistence.ok}};
  if (!r.persistence.ok) persistence["error"] = r.persistence.error;
  json o{{"session_id", r.record.session_id},
         {"enforcement", std::string(to_string(r.record.enforcement))},
         {"risk", r.record.risk},
         {"decision", std::string(to_string(r.record.decision))},
         {"reasons", r.record.reasons},
         {"persistence", persistence}};
  if (r.assessment) {
    json strides = json::array();
    for (StrideCategory c : r.assessment->stride_categories) {
      strides.push_back(std::string(to_string(c)));
    }
    o["stride_categories"] = strides;
  }
  if (r.step_up) o["step_up"] = json{{"token", r.step_up->token}, {"code", r.step_up->code}};
  return o;
}

json to_json(const EnforcementRecord& rec) {
  return json{{"session_id", rec.session_id},
              {"timestamp_ms", rec.timestamp_ms},
              {"risk", rec.risk},
              {"decision", std::string(to_string(rec.decision))},
              {"enforcement", std::string(to_string(rec.enforcement))},
              {"reasons", rec.reasons}};
}

json to_json(const AlertRecord& rec) {
  return json{{"session_id", rec.session_id},
              {"timestamp_ms", rec.timestamp_ms},
              {"stride", std::string(to_string(rec.stride))},
              {"severity", std::string(to_string(rec.severity))},
              {"source", rec.source}};
}

ParseStatus parse_alert(const json& in, AlertRecord& out) {
  if (!in.is_object()) return {false, "alert must be an object"};
  AlertRecord a{};
  auto sid = in.find("session_id");
  if (sid == in.end() || !sid->is_string() || sid->get<std::string>().empty()) {
    return {false, "alert without session_id"};
  }
  a.session_id = sid->get<std::string>();

  auto ts = in.find("timestamp_ms");
  if (ts == in.end() || !ts->is_number_integer() || ts->get<int64_t>() < 0) {
    return {false, "alert without timestamp_ms"};
  }
  a.timestamp_ms = ts->get<TimeMs>();

  auto sev = in.find("severity");
  if (sev == in.end() || !sev->is_string()) return {false, "alert without severity"};
  auto severity = parse_severity(sev->get<std::string>());
  if (!severity) return {false, "unknown severity"};
  a.severity = *severity;

  auto stride = in.find("stride");
  if (stride != in.end() && stride->is_string()) {
    a.stride = parse_stride(stride->get<std::string>()).value_or(StrideCategory::InformationDisclosure);
  }
  auto src = in.find("source");
  if (src != in.end() && src->is_string()) a.source = src->get<std::string>();

  out = std::move(a);
  return {true, {}};
}

json telemetry_document(const EnforcementRecord& rec) {
  json reasons = json::array();
  for (const auto& r : rec.reasons) reasons.push_back(normalize_token(r));
  return json{{"@timestamp", format_iso8601_ms(rec.timestamp_ms)},
              {"session_id", rec.session_id},
              {"risk", rec.risk},
              {"decision", std::string(to_string(rec.decision))},
              {"enforcement", std::string(to_string(rec.enforcement))},
              {"reasons", reasons}};
}

} // namespace authgate::json
