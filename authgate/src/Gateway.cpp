#include "authgate/Gateway.h"
#include "authgate/Config.h"
#include "authgate/Util.h"
#include <chrono>
#include <cmath>
#include <exception>
#include <system_error>

namespace authgate {

namespace {
constexpr const char* kComponent = "gateway";

TimeMs steady_now_ms() {
  return static_cast<TimeMs>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now().time_since_epoch())
                                 .count());
}

std::vector<std::string> reason_tokens(const std::set<AnomalyReason>& reasons) {
  std::vector<std::string> out;
  out.reserve(reasons.size());
  for (AnomalyReason r : reasons) out.emplace_back(to_string(r));
  return out;
}
} // namespace

std::unique_ptr<Gateway> Gateway::create(const GatewayConfig& cfg, const GatewayDeps& deps,
                                         ConfigStatus* status) {
  GatewayConfig checked = cfg;
  ConfigStatus st = validate_config(checked);
  if (!deps.refs) st.fail("gateway: reference store is required");
  if (!deps.alerts) st.fail("gateway: alert store is required");
  if (!deps.audit) st.fail("gateway: audit store is required");
  std::unique_ptr<Gateway> gw;
  if (st.ok) {
    try {
      gw.reset(new Gateway(checked, deps));
    } catch (const std::system_error& e) {
      st.fail(std::string("gateway: cannot start dependency workers: ") + e.what());
    }
  }
  if (status) {
    for (const auto& e : st.errors) status->fail(e);
  }
  return gw;
}

Gateway::Gateway(const GatewayConfig& cfg, const GatewayDeps& deps)
    : cfg_(cfg),
      deps_(deps),
      resolver_(cfg.enrichment, *deps.refs),
      validator_(cfg.validator),
      aggregator_(*deps.alerts),
      scorer_(cfg.trust),
      local_trust_(scorer_),
      calls_(cfg.dependency_calls) {
  if (!deps_.trust) deps_.trust = &local_trust_;
  if (!deps_.telemetry) deps_.telemetry = &noop_telemetry_;
  if (!deps_.metrics) deps_.metrics = &noop_metrics_;
  if (!deps_.log) deps_.log = &noop_log_;
  if (!deps_.monotonic_ms) deps_.monotonic_ms = steady_now_ms;
}

bool Gateway::overran(TimeMs started) const {
  TimeMs now = deps_.monotonic_ms();
  return now > started && now - started > cfg_.dependency_timeout_ms;
}

template <typename R>
CallStatus Gateway::call(const char* dependency, std::function<R()> fn, R& out,
                         std::string& error) {
  TimeMs started = deps_.monotonic_ms();
  CallStatus st = calls_.run(std::move(fn), cfg_.dependency_timeout_ms, out, error);
  if (st == CallStatus::Ok && overran(started)) st = CallStatus::Timeout;
  if (st == CallStatus::Timeout) {
    error = "no answer within " + std::to_string(cfg_.dependency_timeout_ms) + " ms";
  } else if (st == CallStatus::WouldBlock) {
    error = "too many dependency calls in flight";
  }
  deps_.metrics->inc_counter(kMetricDependencyCallTotal, 1,
                             {{"dependency", dependency}, {"status", std::string(to_string(st))}});
  deps_.metrics->set_gauge(kMetricDependencyInflight, static_cast<double>(calls_.inflight()));
  return st;
}

GatewayResult Gateway::cancelled(const std::string& session_id) {
  deps_.metrics->inc_counter(kMetricCancelledTotal, 1);
  deps_.log->log(LogLevel::Info, kComponent, "request cancelled session=" + session_id);
  GatewayResult res{};
  res.status = GatewayStatus::Cancelled;
  res.record.session_id = session_id;
  res.persistence = PersistStatus{false, "cancelled"};
  return res;
}

GatewayResult Gateway::fail_safe(const std::string& session_id, const std::string& cause,
                                 const RequestContext& ctx) {
  deps_.metrics->inc_counter(kMetricFailSafeTotal, 1, {{"cause", cause}});
  deps_.log->log(LogLevel::Warn, kComponent,
                 "fail-safe deny session=" + session_id + " cause=" + cause);
  GatewayResult res{};
  res.fail_safe = true;
  res.record.session_id = session_id;
  res.record.risk = 1.0;
  res.record.decision = Decision::Deny;
  res.record.enforcement = Enforcement::Deny;
  res.record.reasons = {"FAIL_SAFE:" + cause};
  res.record.timestamp_ms = ctx.now_ms;
  return commit(std::move(res), ctx);
}

GatewayResult Gateway::dependency_failed(const std::string& session_id, const char* stage,
                                         CallStatus status, const std::string& error,
                                         const RequestContext& ctx) {
  deps_.log->log(LogLevel::Error, kComponent,
                 std::string(stage) + " " + std::string(to_string(status)) + ": " + error);
  return fail_safe(session_id, std::string(stage) + "_" + std::string(to_string(status)), ctx);
}

GatewayResult Gateway::decide(const SignalBundle& in, const RequestContext& ctx) {
  const std::string session_id = in.session_id.empty() ? generate_session_id() : in.session_id;
  if (ctx.cancelled()) return cancelled(session_id);

  const SignalBundle* bundle = &in;
  SignalBundle named;
  if (in.session_id.empty()) {
    named = in;
    named.session_id = session_id;
    bundle = &named;
  }

  // Validation against one reference snapshot for the whole request.
  auto snap = deps_.refs->snapshot();
  if (!snap) return fail_safe(session_id, "reference_data_unavailable", ctx);

  ValidatedVector vec;
  TimeMs started = deps_.monotonic_ms();
  try {
    EnrichmentResult enrichment = resolver_.enrich(*bundle, *snap);
    vec = validator_.validate(*bundle, enrichment, ctx.now_ms);
  } catch (const std::exception& e) {
    deps_.log->log(LogLevel::Error, kComponent, std::string("validator error: ") + e.what());
    return fail_safe(session_id, "validator_error", ctx);
  } catch (...) {
    deps_.log->log(LogLevel::Error, kComponent, "validator error: non-standard exception");
    return fail_safe(session_id, "validator_error", ctx);
  }
  if (overran(started)) return fail_safe(session_id, "validator_timeout", ctx);
  if (ctx.cancelled()) return cancelled(session_id);

  // Calls below may outlive this frame when they time out: they capture
  // copies, never references into it.
  const TimeMs budget = cfg_.dependency_timeout_ms;
  const uint32_t window = cfg_.alert_window_min;
  const TimeMs now_ms = ctx.now_ms;
  const AlertAggregator* aggregator = &aggregator_;

  AlertCountResult alerts{};
  std::string error;
  CallStatus cs = call<AlertCountResult>(
      "alerts",
      [aggregator, session_id, window, now_ms, budget] {
        return aggregator->count_recent(session_id, window, now_ms, budget);
      },
      alerts, error);
  if (cs != CallStatus::Ok) return dependency_failed(session_id, "alerts", cs, error, ctx);
  if (!alerts.ok) {
    deps_.log->log(LogLevel::Error, kComponent, "alert store unavailable: " + alerts.error);
    return fail_safe(session_id, "alerts_unavailable", ctx);
  }
  if (ctx.cancelled()) return cancelled(session_id);

  TrustResult trust{};
  ITrustService* service = deps_.trust;
  AlertWindowCount counts = alerts.count;
  cs = call<TrustResult>(
      "trust",
      [service, vec, counts, budget] { return service->score(vec, counts, budget); },
      trust, error);
  if (cs != CallStatus::Ok) return dependency_failed(session_id, "trust", cs, error, ctx);
  if (!trust.ok) {
    deps_.log->log(LogLevel::Error, kComponent, "trust unavailable: " + trust.error);
    return fail_safe(session_id, "trust_unavailable", ctx);
  }
  if (!std::isfinite(trust.assessment.risk) || trust.assessment.risk < 0.0 ||
      trust.assessment.risk > 1.0) {
    return fail_safe(session_id, "trust_invalid_response", ctx);
  }
  if (ctx.cancelled()) return cancelled(session_id);

  GatewayResult res{};
  res.record.session_id = session_id;
  res.record.risk = trust.assessment.risk;
  res.record.decision = trust.assessment.decision;
  res.record.enforcement = enforcement_for(trust.assessment.decision);
  res.record.reasons = reason_tokens(vec.reasons);
  res.record.timestamp_ms = ctx.now_ms;
  res.assessment = std::move(trust.assessment);
  res.validated = std::move(vec);
  return commit(std::move(res), ctx);
}

GatewayResult Gateway::commit(GatewayResult res, const RequestContext& ctx) {
  if (ctx.cancelled()) return cancelled(res.record.session_id);

  const EnforcementRecord rec = res.record;
  deps_.metrics->inc_counter(kMetricDecisionTotal, 1,
                             {{"enforcement", std::string(to_string(rec.enforcement))}});
  deps_.metrics->observe_histogram(kMetricRiskScore, rec.risk);

  StoreStatus audit{};
  std::string error;
  IAuditStore* audit_store = deps_.audit;
  CallStatus cs = call<StoreStatus>(
      "audit", [audit_store, rec] { return audit_store->append(rec); }, audit, error);
  if (cs != CallStatus::Ok) audit = StoreStatus::Fail(error);
  if (!audit.ok) {
    deps_.metrics->inc_counter(kMetricPersistFailTotal, 1, {{"store", "audit"}});
    deps_.log->log(LogLevel::Error, kComponent,
                   "audit append failed session=" + rec.session_id + ": " + audit.error);
    res.persistence = PersistStatus{false, "audit: " + audit.error};
  }

  // Fail-safe denials report an outage, not an assessed threat; they do not
  // feed the alert window.
  if (!res.fail_safe && rec.risk >= cfg_.alert_risk_threshold) {
    AlertRecord alert{};
    alert.session_id = rec.session_id;
    alert.timestamp_ms = rec.timestamp_ms;
    alert.severity = rec.risk >= cfg_.alert_high_threshold ? Severity::High : Severity::Medium;
    alert.stride = res.assessment && res.assessment->dominant_stride
                       ? *res.assessment->dominant_stride
                       : StrideCategory::InformationDisclosure;
    alert.source = "gateway";
    StoreStatus st{};
    IAlertStore* alert_store = deps_.alerts;
    cs = call<StoreStatus>(
        "alert_append", [alert_store, alert] { return alert_store->append(alert); }, st, error);
    if (cs != CallStatus::Ok) st = StoreStatus::Fail(error);
    if (st.ok) {
      deps_.metrics->inc_counter(kMetricAlertEmittedTotal, 1,
                                 {{"severity", std::string(to_string(alert.severity))}});
    } else {
      deps_.metrics->inc_counter(kMetricPersistFailTotal, 1, {{"store", "alerts"}});
      deps_.log->log(LogLevel::Error, kComponent,
                     "alert append failed session=" + rec.session_id + ": " + st.error);
      std::string msg = "alerts: " + st.error;
      res.persistence.error = res.persistence.ok ? msg : res.persistence.error + "; " + msg;
      res.persistence.ok = false;
    }
  }

  if (rec.enforcement == Enforcement::MfaStepUp && deps_.step_up) {
    res.step_up = step_up_issue(rec.session_id, ctx.now_ms, *deps_.step_up);
    if (!res.step_up) {
      deps_.log->log(LogLevel::Error, kComponent,
                     "step-up challenge could not be minted session=" + rec.session_id);
    }
  }

  bool delivered = false;
  ITelemetrySink* telemetry = deps_.telemetry;
  cs = call<bool>(
      "telemetry",
      [telemetry, rec] {
        telemetry->on_decision(rec);
        return true;
      },
      delivered, error);
  if (cs != CallStatus::Ok) {
    deps_.log->log(LogLevel::Debug, kComponent, "telemetry dropped: " + error);
  }

  deps_.log->log(LogLevel::Info, kComponent,
                 "session=" + rec.session_id + " enforcement=" +
                     std::string(to_string(rec.enforcement)) + " risk=" +
                     std::to_string(rec.risk));
  return res;
}

} // namespace authgate
