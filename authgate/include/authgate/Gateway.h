#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "AlertAggregator.h"
#include "AlertStore.h"
#include "AuditStore.h"
#include "CallPool.h"
#include "Common.h"
#include "Enforcement.h"
#include "Enrichment.h"
#include "Log.h"
#include "Metrics.h"
#include "ReferenceData.h"
#include "StepUpToken.h"
#include "TrustScorer.h"
#include "Validator.h"

namespace authgate {

struct ConfigStatus;

struct GatewayConfig {
  EnrichmentConfig enrichment{};
  ValidatorConfig validator{};
  TrustConfig trust{};
  uint32_t alert_window_min{15};
  double alert_risk_threshold{0.25};
  double alert_high_threshold{0.70};
  // Bound on every alert store, trust service, audit and telemetry call.
  TimeMs dependency_timeout_ms{3000};
  CallPoolConfig dependency_calls{};
  uint32_t step_up_bucket_ms{30000};
  uint32_t step_up_max_skew{1};
};

struct RequestContext {
  TimeMs now_ms{0};
  const std::atomic<bool>* cancel{nullptr};

  bool cancelled() const { return cancel && cancel->load(std::memory_order_relaxed); }
};

struct PersistStatus {
  bool ok{true};
  std::string error;
};

enum class GatewayStatus : uint8_t {
  Decided = 0,
  Cancelled = 1,
};

struct GatewayResult {
  GatewayStatus status{GatewayStatus::Decided};
  EnforcementRecord record{};
  // Absent on fail-safe and cancelled results.
  std::optional<RiskAssessment> assessment{};
  std::optional<ValidatedVector> validated{};
  PersistStatus persistence{};
  std::optional<StepUpChallenge> step_up{};
  bool fail_safe{false};
};

// Collaborators. refs, alerts and audit are required; the rest fall back to
// no-op / local implementations.
struct GatewayDeps {
  const ReferenceStore* refs{nullptr};
  IAlertStore* alerts{nullptr};
  IAuditStore* audit{nullptr};
  ITrustService* trust{nullptr};
  ITelemetrySink* telemetry{nullptr};
  IMetricSink* metrics{nullptr};
  ILogSink* log{nullptr};
  std::function<TimeMs()> monotonic_ms{};
  const StepUpKeyring* step_up{nullptr};
};

class Gateway {
 public:
  // Null when the configuration or the dependency set is invalid; the
  // reasons are appended to status when given.
  static std::unique_ptr<Gateway> create(const GatewayConfig& cfg, const GatewayDeps& deps,
                                         ConfigStatus* status = nullptr);

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;
  Gateway(Gateway&&) = delete;
  Gateway& operator=(Gateway&&) = delete;

  // Never throws and never returns a decision weaker than DENY when a
  // dependency fails, hangs or throws. Returns within roughly one
  // dependency timeout per stage. Safe to call concurrently.
  GatewayResult decide(const SignalBundle& bundle, const RequestContext& ctx);

  const GatewayConfig& config() const { return cfg_; }

 private:
  Gateway(const GatewayConfig& cfg, const GatewayDeps& deps);

  GatewayResult fail_safe(const std::string& session_id, const std::string& cause,
                          const RequestContext& ctx);
  GatewayResult cancelled(const std::string& session_id);
  GatewayResult commit(GatewayResult result, const RequestContext& ctx);
  GatewayResult dependency_failed(const std::string& session_id, const char* stage,
                                  CallStatus status, const std::string& error,
                                  const RequestContext& ctx);
  bool overran(TimeMs started) const;

  template <typename R>
  CallStatus call(const char* dependency, std::function<R()> fn, R& out, std::string& error);

  GatewayConfig cfg_{};
  GatewayDeps deps_{};
  NoopMetricSink noop_metrics_{};
  NoopLogSink noop_log_{};
  NoopTelemetrySink noop_telemetry_{};
  EnrichmentResolver resolver_;
  SignalValidator validator_;
  AlertAggregator aggregator_;
  TrustScorer scorer_;
  LocalTrustService local_trust_;
  // Last member: joined first on destruction, while the stages it calls
  // into are still alive.
  CallPool calls_;
};

} // namespace authgate
