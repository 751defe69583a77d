#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace authgate {

struct MetricLabel {
  std::string key;
  std::string value;
};

// Names emitted by the gateway and the reference loader; labels in braces.
constexpr std::string_view kMetricDecisionTotal = "authgate_decision_total";        // {enforcement}
constexpr std::string_view kMetricRiskScore = "authgate_risk_score_histogram";
constexpr std::string_view kMetricFailSafeTotal = "authgate_failsafe_total";        // {cause}
constexpr std::string_view kMetricPersistFailTotal = "authgate_persist_fail_total"; // {store}
constexpr std::string_view kMetricAlertEmittedTotal = "authgate_alert_emitted_total"; // {severity}
constexpr std::string_view kMetricCancelledTotal = "authgate_cancelled_total";
// {dependency=alerts|trust|audit|alert_append|telemetry, status}
constexpr std::string_view kMetricDependencyCallTotal = "authgate_dependency_call_total";
constexpr std::string_view kMetricDependencyInflight = "authgate_dependency_inflight";
constexpr std::string_view kMetricReferenceEntries = "authgate_reference_entries"; // {dataset}

// Counters, gauges and histograms for the decision pipeline. Implementations
// must be safe to call from concurrent decide() invocations.
class IMetricSink {
 public:
  virtual ~IMetricSink() = default;
  virtual void inc_counter(std::string_view name, uint64_t value = 1,
                           const std::vector<MetricLabel>& labels = {}) = 0;
  virtual void set_gauge(std::string_view name, double value,
                         const std::vector<MetricLabel>& labels = {}) = 0;
  virtual void observe_histogram(std::string_view name, double value,
                                 const std::vector<MetricLabel>& labels = {}) = 0;
};

class NoopMetricSink final : public IMetricSink {
 public:
  void inc_counter(std::string_view, uint64_t, const std::vector<MetricLabel>&) override {}
  void set_gauge(std::string_view, double, const std::vector<MetricLabel>&) override {}
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}
};

} // namespace authgate
