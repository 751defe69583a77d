#include "authgate/Gateway.h"
#include "authgate/json/Codec.h"
#include "authgate/json/JsonlStores.h"
#include "../support/Fixtures.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

using namespace authgate;
using namespace authgate::testing;
namespace aj = authgate::json;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
  fs::path dir = fs::temp_directory_path() / ("authgate_json_test_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::vector<aj::json> read_lines(const fs::path& p) {
  std::vector<aj::json> out;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(aj::json::parse(line));
  }
  return out;
}

void test_parse_bundle() {
  SignalBundle b{};
  auto st = aj::parse_bundle(std::string_view(R"({
    "session_id": "s-1",
    "label": "PortScan",
    "signals": {
      "ip_origin": {"ip": "203.0.113.10", "ts": 1715342400000},
      "gps": {"lat": 52.52, "lon": 13.405},
      "wifi_ap": {"bssid": "aa:bb:cc:dd:ee:01", "meta": {"nested": true}},
      "device_posture": {"device_id": "dev-1", "patched": true},
      "retina_scan": {"score": 1}
    }
  })"), b);
  assert(st.ok);
  assert(b.session_id == "s-1");
  assert(b.label && *b.label == "PortScan");
  assert(b.signals.size() == 4);
  assert(b.signals[SignalType::IpOrigin]["ts"] == "1715342400000");
  assert(b.signals[SignalType::DevicePosture]["patched"] == "true");
  assert(b.signals[SignalType::WifiAp].count("meta") == 0);
  auto gps = gps_point(b.signals[SignalType::Gps]);
  assert(gps && near(gps->lat, 52.52) && near(gps->lon, 13.405));

  // Flat legacy form without a session id.
  SignalBundle flat{};
  st = aj::parse_bundle(std::string_view(R"({"ip_geo": {"ip": "10.0.0.1"}, "tls_fp": {"ja3": "abc"},
                            "wifi_bssid": {"bssid": "00:11:22:33:44:55"}, "note": "x"})"),
                        flat);
  assert(st.ok);
  assert(flat.session_id.rfind("sess-", 0) == 0);
  assert(flat.signals.count(SignalType::IpOrigin) == 1);
  assert(flat.signals.count(SignalType::TlsFingerprint) == 1);
  assert(flat.signals.count(SignalType::WifiAp) == 1);
  assert(!flat.label);

  SignalBundle bad{};
  assert(!aj::parse_bundle(std::string_view("{not json"), bad).ok);
  assert(!aj::parse_bundle(std::string_view("[1,2]"), bad).ok);
  assert(!aj::parse_bundle(std::string_view(R"({"signals": 5})"), bad).ok);
  assert(!aj::parse_bundle(std::string_view(R"({"session_id": 42})"), bad).ok);
}

void test_contracts() {
  ReferenceStore refs(sample_snapshot());
  InMemoryAlertStore alerts;
  InMemoryAuditStore audit;
  GatewayDeps d{};
  d.refs = &refs;
  d.alerts = &alerts;
  d.audit = &audit;
  StepUpKeyring keys{};
  keys.current = StepUpKey{std::vector<uint8_t>(16, 0x11), 1};
  d.step_up = &keys;
  auto gw = Gateway::create(GatewayConfig{}, d);
  assert(gw);

  RequestContext ctx{};
  ctx.now_ms = fixed_now_ms();
  auto r = gw->decide(travel_mismatch_bundle(), ctx);

  aj::json out = aj::gateway_response(r);
  assert(out["session_id"] == "sess-travel");
  assert(out["enforcement"] == "MFA_STEP_UP");
  assert(near(out["risk"].get<double>(), 0.207));
  assert(out["persistence"]["ok"] == true);
  assert(!out["persistence"].contains("error"));
  assert(out["step_up"]["code"].get<std::string>().size() == 6);
  assert(out["reasons"][0] == "LOCATION_MISMATCH");

  aj::json tr = aj::trust_response(*r.assessment);
  assert(tr["decision"] == "step_up");
  assert(tr["dominant_stride"] == "Spoofing");

  aj::json req = aj::trust_request(*r.validated, AlertWindowCount{"sess-travel", 1, 2});
  assert(req["siem"]["high"] == 1 && req["siem"]["medium"] == 2);
  assert(near(req["weights"]["gps"].get<double>(), 0.2));
  assert(req["vector"]["wifi_ap"]["bssid"] == "AA-BB-CC-DD-EE-01");

  EnrichmentResolver resolver(EnrichmentConfig{}, refs);
  EnrichmentResult e = resolver.enrich(travel_mismatch_bundle());
  aj::json vr = aj::validator_response(*r.validated, e);
  assert(vr["validated"]["reasons"][0] == "LOCATION_MISMATCH");
  assert(vr["quality"]["gps"] == "ok");
  assert(vr["cross"][0]["violated"] == true);
  assert(vr["enrichment"]["wifi_ap"]["ssid"] == "office");
  assert(vr["enrichment"]["checks"][0]["metric_name"] == "ip_wifi_distance_km");

  GatewayResult cancelled{};
  cancelled.status = GatewayStatus::Cancelled;
  cancelled.record.session_id = "c";
  assert(aj::gateway_response(cancelled)["status"] == "cancelled");

  EnforcementRecord fs_rec{"s", 1.0, Decision::Deny, Enforcement::Deny, {"FAIL_SAFE:trust_timeout"}, 0};
  aj::json doc = aj::telemetry_document(fs_rec);
  assert(doc["@timestamp"] == "1970-01-01T00:00:00.000Z");
  assert(doc["reasons"][0] == "FAIL_SAFE_TRUST_TIMEOUT");

  AlertRecord parsed{};
  assert(aj::parse_alert(aj::json{{"session_id", "s"}, {"timestamp_ms", 5}, {"severity", "critical"},
                                  {"stride", "denial_of_service"}},
                         parsed).ok);
  assert(parsed.severity == Severity::High);
  assert(parsed.stride == StrideCategory::DenialOfService);
  assert(!aj::parse_alert(aj::json{{"session_id", "s"}, {"timestamp_ms", 5}, {"severity", "meh"}},
                          parsed).ok);
}

void test_jsonl_stores() {
  fs::path dir = scratch_dir();
  const TimeMs now = fixed_now_ms();

  std::string err;
  auto audit = aj::JsonlAuditStore::open((dir / "audit.jsonl").string(), &err);
  assert(audit);
  assert(audit->append(EnforcementRecord{"a", 0.2, Decision::StepUp, Enforcement::MfaStepUp,
                                         {"LOCATION_MISMATCH"}, now})
             .ok);
  auto rows = read_lines(dir / "audit.jsonl");
  assert(rows.size() == 1);
  assert(rows[0]["enforcement"] == "MFA_STEP_UP");
  assert(rows[0]["timestamp_ms"] == now);

  assert(!aj::JsonlAuditStore::open((dir / "missing" / "audit.jsonl").string(), &err));
  assert(!err.empty());

  fs::path alert_path = dir / "alerts.jsonl";
  {
    auto store = aj::JsonlAlertStore::open(alert_path.string(), &err);
    assert(store);
    assert(store->append(AlertRecord{"s", now - 1000, StrideCategory::Spoofing, Severity::High, "gateway"}).ok);
    assert(store->append(AlertRecord{"s", now - 2000, StrideCategory::Tampering, Severity::Medium, "gateway"}).ok);
  }
  {
    std::ofstream junk(alert_path, std::ios::app);
    junk << "this is not json\n";
  }
  size_t skipped = 0;
  auto reopened = aj::JsonlAlertStore::open(alert_path.string(), &err, &skipped);
  assert(reopened);
  assert(skipped == 1);
  assert(reopened->size() == 2);
  AlertAggregator agg(*reopened);
  auto c = agg.count_recent("s", 15, now);
  assert(c.ok && c.count.high == 1 && c.count.medium == 1);

  aj::JsonlTelemetrySink telemetry((dir / "telemetry.jsonl").string());
  telemetry.on_decision(EnforcementRecord{"t", 0.05, Decision::Allow, Enforcement::Allow, {}, now});
  auto events = read_lines(dir / "telemetry.jsonl");
  assert(events.size() == 1);
  assert(events[0].contains("@timestamp"));
  assert(events[0]["session_id"] == "t");

  // Unwritable telemetry target: dropped without complaint.
  aj::JsonlTelemetrySink nowhere((dir / "missing" / "t.jsonl").string());
  nowhere.on_decision(EnforcementRecord{});

  fs::remove_all(dir);
}

} // namespace

int main() {
  test_parse_bundle();
  test_contracts();
  test_jsonl_stores();
  std::cout << "authgate_json_tests ok\n";
  return 0;
}
