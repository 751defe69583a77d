#include "authgate/Config.h"
#include "authgate/Gateway.h"
#include "../support/Fixtures.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

using namespace authgate;
using namespace authgate::testing;

namespace {

class CountingMetrics final : public IMetricSink {
 public:
  void inc_counter(std::string_view name, uint64_t value, const std::vector<MetricLabel>& labels) override {
    std::lock_guard<std::mutex> lock(mu_);
    std::string key(name);
    for (const auto& l : labels) key += "|" + l.key + "=" + l.value;
    counters_[key] += value;
  }
  void set_gauge(std::string_view, double, const std::vector<MetricLabel>&) override {}
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}

  uint64_t get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }

 private:
  std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
};

class ThrowingTrustService final : public ITrustService {
 public:
  TrustResult score(const ValidatedVector&, const AlertWindowCount&, TimeMs) override {
    throw std::runtime_error("socket reset");
  }
};

class SlowTrustService final : public ITrustService {
 public:
  SlowTrustService(TimeMs& clock, const TrustScorer& scorer) : clock_(clock), scorer_(scorer) {}
  TrustResult score(const ValidatedVector& v, const AlertWindowCount& a, TimeMs) override {
    clock_ += 5000;
    return TrustResult{true, scorer_.score(v, a), {}};
  }

 private:
  TimeMs& clock_;
  const TrustScorer& scorer_;
};

class CancellingTrustService final : public ITrustService {
 public:
  CancellingTrustService(std::atomic<bool>& flag, const TrustScorer& scorer)
      : flag_(flag), scorer_(scorer) {}
  TrustResult score(const ValidatedVector& v, const AlertWindowCount& a, TimeMs) override {
    flag_.store(true);
    return TrustResult{true, scorer_.score(v, a), {}};
  }

 private:
  std::atomic<bool>& flag_;
  const TrustScorer& scorer_;
};

class IntThrowingTrust final : public ITrustService {
 public:
  TrustResult score(const ValidatedVector&, const AlertWindowCount&, TimeMs) override { throw 42; }
};

// Blocks every call until release(); entered counts the calls that started.
class Gate {
 public:
  void wait() {
    std::unique_lock<std::mutex> lock(mu_);
    ++entered_;
    cv_.notify_all();
    cv_.wait(lock, [this] { return open_; });
  }
  void wait_entered(int n) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this, n] { return entered_ >= n; });
  }
  void release() {
    std::lock_guard<std::mutex> lock(mu_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  int entered_{0};
  bool open_{false};
};

class HangingTrustService final : public ITrustService {
 public:
  explicit HangingTrustService(Gate& gate) : gate_(gate) {}
  TrustResult score(const ValidatedVector&, const AlertWindowCount&, TimeMs) override {
    gate_.wait();
    return TrustResult{true, RiskAssessment{}, {}};
  }

 private:
  Gate& gate_;
};

class StringThrowingAuditStore final : public IAuditStore {
 public:
  StoreStatus append(const EnforcementRecord&) override { throw std::string("journal torn"); }
};

class IntThrowingTelemetry final : public ITelemetrySink {
 public:
  void on_decision(const EnforcementRecord&) override { throw 7; }
};

class ThrowingTelemetry final : public ITelemetrySink {
 public:
  void on_decision(const EnforcementRecord&) override { throw std::runtime_error("index down"); }
};

class RecordingTelemetry final : public ITelemetrySink {
 public:
  void on_decision(const EnforcementRecord& rec) override {
    std::lock_guard<std::mutex> lock(mu_);
    seen.push_back(rec);
  }
  std::vector<EnforcementRecord> seen;

 private:
  std::mutex mu_;
};

struct Harness {
  ReferenceStore refs{sample_snapshot()};
  InMemoryAlertStore alerts;
  InMemoryAuditStore audit;
  CountingMetrics metrics;
  RecordingTelemetry telemetry;
  TimeMs clock{0};

  GatewayDeps deps() {
    GatewayDeps d{};
    d.refs = &refs;
    d.alerts = &alerts;
    d.audit = &audit;
    d.metrics = &metrics;
    d.telemetry = &telemetry;
    d.monotonic_ms = [this] { return clock; };
    return d;
  }

  std::unique_ptr<Gateway> make(const GatewayDeps& d, const GatewayConfig& cfg = GatewayConfig{}) {
    ConfigStatus st{};
    auto gw = Gateway::create(cfg, d, &st);
    assert(gw && st.ok);
    return gw;
  }
};

RequestContext at_now() {
  RequestContext ctx{};
  ctx.now_ms = fixed_now_ms();
  return ctx;
}

void check_fail_safe(const GatewayResult& r, const std::string& cause) {
  assert(r.status == GatewayStatus::Decided);
  assert(r.fail_safe);
  assert(r.record.enforcement == Enforcement::Deny);
  assert(r.record.decision == Decision::Deny);
  assert(r.record.risk == 1.0);
  assert(r.record.reasons.size() == 1 && r.record.reasons[0] == "FAIL_SAFE:" + cause);
  assert(!r.assessment);
}

TimeMs wall_ms_since(std::chrono::steady_clock::time_point t0) {
  return static_cast<TimeMs>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - t0)
                                 .count());
}

static_assert(!std::is_copy_constructible<Gateway>::value, "gateway owns worker threads");
static_assert(!std::is_move_constructible<Gateway>::value, "gateway owns worker threads");

} // namespace

void test_gateway() {
  // Clean login from the office.
  {
    Harness h;
    auto gw = h.make(h.deps());
    auto r = gw->decide(clean_bundle(), at_now());
    assert(r.status == GatewayStatus::Decided && !r.fail_safe);
    assert(r.record.enforcement == Enforcement::Allow);
    assert(near(r.record.risk, 0.045));
    assert(r.record.reasons.empty());
    assert(r.record.timestamp_ms == fixed_now_ms());
    assert(r.persistence.ok);
    assert(!r.step_up);
    assert(h.audit.records().size() == 1);
    assert(h.alerts.size() == 0);
    assert(h.telemetry.seen.size() == 1);
    assert(h.metrics.get("authgate_decision_total|enforcement=ALLOW") == 1);
  }

  // Impossible travel: step-up with a challenge, below the alerting threshold.
  {
    Harness h;
    StepUpKeyring keys{};
    keys.current = StepUpKey{std::vector<uint8_t>(32, 0x42), 1};
    GatewayDeps d = h.deps();
    d.step_up = &keys;
    auto gw = h.make(d);
    auto r = gw->decide(travel_mismatch_bundle(), at_now());
    assert(r.record.decision == Decision::StepUp);
    assert(r.record.enforcement == Enforcement::MfaStepUp);
    assert(near(r.record.risk, 0.207));
    assert(r.record.reasons == std::vector<std::string>{"LOCATION_MISMATCH"});
    assert(r.validated && r.validated->weight(SignalType::Gps) <= 0.2);
    assert(r.step_up);
    assert(step_up_check(r.step_up->token, r.step_up->code, "sess-travel", keys,
                         time_bucket(fixed_now_ms(), keys.bucket_ms)));
    assert(h.alerts.size() == 0);
  }

  // Volumetric attack label with two recent high alerts.
  {
    Harness h;
    const TimeMs now = fixed_now_ms();
    h.alerts.append(AlertRecord{"sess-dos", now - 60000, StrideCategory::DenialOfService, Severity::High, "siem"});
    h.alerts.append(AlertRecord{"sess-dos", now - 120000, StrideCategory::DenialOfService, Severity::High, "siem"});
    auto gw = h.make(h.deps());
    SignalBundle b = clean_bundle("sess-dos");
    b.label = "DDoS";
    auto r = gw->decide(b, at_now());
    assert(r.record.enforcement == Enforcement::Deny);
    assert(r.record.risk >= 0.80);
    assert(r.assessment && r.assessment->stride_categories.count(StrideCategory::DenialOfService));
    assert(h.alerts.size() == 3);
    std::vector<AlertRecord> mine;
    h.alerts.query("sess-dos", now, mine, 0);
    assert(mine.size() == 1);
    assert(mine[0].severity == Severity::High);
    assert(mine[0].stride == StrideCategory::DenialOfService);
    assert(mine[0].source == "gateway");
    assert(h.metrics.get("authgate_alert_emitted_total|severity=high") == 1);
  }

  // Same label without alert history: medium alert.
  {
    Harness h;
    auto gw = h.make(h.deps());
    SignalBundle b = clean_bundle("sess-dos2");
    b.label = "DDoS";
    auto r = gw->decide(b, at_now());
    assert(near(r.record.risk, 0.45));
    assert(r.record.enforcement == Enforcement::MfaStepUp);
    std::vector<AlertRecord> mine;
    h.alerts.query("sess-dos2", 0, mine, 0);
    assert(mine.size() == 1 && mine[0].severity == Severity::Medium);
  }

  // Trust service down, throwing, or too slow.
  {
    Harness h;
    UnavailableTrustService down;
    GatewayDeps d = h.deps();
    d.trust = &down;
    auto gw = h.make(d);
    auto r = gw->decide(clean_bundle(), at_now());
    check_fail_safe(r, "trust_unavailable");
    assert(h.audit.records().size() == 1);
    assert(h.audit.records()[0].risk == 1.0);
    assert(h.alerts.size() == 0);
    assert(h.metrics.get("authgate_failsafe_total|cause=trust_unavailable") == 1);
  }
  {
    Harness h;
    ThrowingTrustService boom;
    GatewayDeps d = h.deps();
    d.trust = &boom;
    auto gw = h.make(d);
    check_fail_safe(gw->decide(clean_bundle(), at_now()), "trust_error");
  }
  {
    Harness h;
    TrustScorer scorer{TrustConfig{}};
    SlowTrustService slow(h.clock, scorer);
    GatewayDeps d = h.deps();
    d.trust = &slow;
    auto gw = h.make(d);
    check_fail_safe(gw->decide(clean_bundle(), at_now()), "trust_timeout");
  }

  {
    Harness h;
    IntThrowingTrust boom;
    GatewayDeps d = h.deps();
    d.trust = &boom;
    auto gw = h.make(d);
    check_fail_safe(gw->decide(clean_bundle(), at_now()), "trust_error");
    assert(h.audit.records().size() == 1);
  }

  // A trust service that never answers: the caller gets its denial after the
  // timeout, on the real clock, while the call is still stuck.
  {
    Harness h;
    Gate gate;
    HangingTrustService hung(gate);
    GatewayDeps d = h.deps();
    d.trust = &hung;
    d.monotonic_ms = nullptr;
    GatewayConfig cfg{};
    cfg.dependency_timeout_ms = 100;
    auto gw = h.make(d, cfg);
    auto t0 = std::chrono::steady_clock::now();
    auto r = gw->decide(clean_bundle(), at_now());
    TimeMs waited = wall_ms_since(t0);
    check_fail_safe(r, "trust_timeout");
    assert(waited >= 100 && waited < 2000);
    assert(h.audit.records().size() == 1);
    assert(h.metrics.get("authgate_dependency_call_total|dependency=trust|status=timeout") == 1);
    gate.release();
    gw.reset();
  }

  // Hung calls hold their workers; once the in-flight cap is reached further
  // calls are refused at once instead of queueing.
  {
    Harness h;
    Gate gate;
    HangingTrustService hung(gate);
    GatewayDeps d = h.deps();
    d.trust = &hung;
    d.monotonic_ms = nullptr;
    GatewayConfig cfg{};
    cfg.dependency_timeout_ms = 50;
    cfg.dependency_calls.workers = 1;
    cfg.dependency_calls.max_inflight = 1;
    auto gw = h.make(d, cfg);
    auto first = gw->decide(clean_bundle("sess-a"), at_now());
    check_fail_safe(first, "trust_timeout");
    assert(!first.persistence.ok);
    assert(first.persistence.error.find("in flight") != std::string::npos);
    gate.wait_entered(1);

    auto t0 = std::chrono::steady_clock::now();
    auto second = gw->decide(clean_bundle("sess-b"), at_now());
    assert(wall_ms_since(t0) < 50);
    check_fail_safe(second, "alerts_backpressure");
    assert(!second.persistence.ok);
    assert(h.audit.records().empty());
    assert(h.metrics.get("authgate_failsafe_total|cause=alerts_backpressure") == 1);
    gate.release();
    gw.reset();
  }

  // Reference data never loaded.
  {
    Harness h;
    ReferenceStore unloaded;
    GatewayDeps d = h.deps();
    d.refs = &unloaded;
    auto gw = h.make(d);
    check_fail_safe(gw->decide(clean_bundle(), at_now()), "reference_data_unavailable");
  }

  // Alert store unreachable.
  {
    Harness h;
    FailingAlertStore down;
    GatewayDeps d = h.deps();
    d.alerts = &down;
    auto gw = h.make(d);
    check_fail_safe(gw->decide(clean_bundle(), at_now()), "alerts_unavailable");
    assert(h.audit.records().size() == 1);
  }

  // Cancellation before start and in the middle: nothing persisted.
  {
    Harness h;
    auto gw = h.make(h.deps());
    std::atomic<bool> cancel{true};
    RequestContext ctx = at_now();
    ctx.cancel = &cancel;
    auto r = gw->decide(clean_bundle(), ctx);
    assert(r.status == GatewayStatus::Cancelled);
    assert(h.audit.records().empty());
    assert(h.metrics.get("authgate_cancelled_total") == 1);
  }
  {
    Harness h;
    std::atomic<bool> cancel{false};
    TrustScorer scorer{TrustConfig{}};
    CancellingTrustService cancelling(cancel, scorer);
    GatewayDeps d = h.deps();
    d.trust = &cancelling;
    auto gw = h.make(d);
    RequestContext ctx = at_now();
    ctx.cancel = &cancel;
    SignalBundle b = clean_bundle();
    b.label = "DDoS";
    auto r = gw->decide(b, ctx);
    assert(r.status == GatewayStatus::Cancelled);
    assert(h.audit.records().empty());
    assert(h.alerts.size() == 0);
    assert(h.telemetry.seen.empty());
  }

  // Audit store failure is reported, the decision stands.
  {
    Harness h;
    FailingAuditStore full;
    GatewayDeps d = h.deps();
    d.audit = &full;
    auto gw = h.make(d);
    auto r = gw->decide(clean_bundle(), at_now());
    assert(r.record.enforcement == Enforcement::Allow);
    assert(!r.persistence.ok);
    assert(r.persistence.error.find("disk full") != std::string::npos);
    assert(h.metrics.get("authgate_persist_fail_total|store=audit") == 1);
  }

  {
    Harness h;
    StringThrowingAuditStore torn;
    GatewayDeps d = h.deps();
    d.audit = &torn;
    auto gw = h.make(d);
    auto r = gw->decide(clean_bundle(), at_now());
    assert(r.record.enforcement == Enforcement::Allow);
    assert(!r.fail_safe);
    assert(!r.persistence.ok);
    assert(r.persistence.error.find("audit: ") == 0);
    assert(h.metrics.get("authgate_persist_fail_total|store=audit") == 1);
  }

  // Telemetry failures are swallowed.
  {
    Harness h;
    ThrowingTelemetry broken;
    GatewayDeps d = h.deps();
    d.telemetry = &broken;
    auto gw = h.make(d);
    auto r = gw->decide(clean_bundle(), at_now());
    assert(r.record.enforcement == Enforcement::Allow);
    assert(r.persistence.ok);
  }
  {
    Harness h;
    IntThrowingTelemetry broken;
    GatewayDeps d = h.deps();
    d.telemetry = &broken;
    auto gw = h.make(d);
    auto r = gw->decide(clean_bundle(), at_now());
    assert(r.record.enforcement == Enforcement::Allow);
    assert(r.persistence.ok);
    assert(h.audit.records().size() == 1);
    assert(h.metrics.get("authgate_dependency_call_total|dependency=telemetry|status=error") == 1);
  }

  // Generated session id when the caller sends none.
  {
    Harness h;
    auto gw = h.make(h.deps());
    SignalBundle b = clean_bundle("");
    auto r = gw->decide(b, at_now());
    assert(r.record.session_id.rfind("sess-", 0) == 0);
    assert(r.record.session_id.size() == 13);
  }

  // Invalid configuration or missing collaborators: no gateway.
  {
    Harness h;
    GatewayConfig cfg{};
    cfg.trust.allow_threshold = 0.9;
    cfg.trust.deny_threshold = 0.2;
    ConfigStatus st{};
    assert(!Gateway::create(cfg, h.deps(), &st));
    assert(!st.ok && !st.errors.empty());

    GatewayDeps d = h.deps();
    d.alerts = nullptr;
    ConfigStatus st2{};
    assert(!Gateway::create(GatewayConfig{}, d, &st2));
    assert(!st2.ok);
  }

  // Concurrent requests share nothing but the stores.
  {
    Harness h;
    auto gw = h.make(h.deps());
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
      workers.emplace_back([&gw, t] {
        for (int i = 0; i < 50; ++i) {
          auto r = gw->decide(clean_bundle("sess-" + std::to_string(t)), at_now());
          assert(r.record.enforcement == Enforcement::Allow);
        }
      });
    }
    for (auto& w : workers) w.join();
    assert(h.audit.records().size() == 200);
    assert(h.audit.records_for("sess-2").size() == 50);
  }
}
