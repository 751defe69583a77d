#pragma once
#include "AuditStore.h"
#include "Common.h"

namespace authgate {

// Fire-and-forget decision events (search / analytics index). Failures are
// the sink's problem; the gateway never lets them reach the caller.
class ITelemetrySink {
 public:
  virtual ~ITelemetrySink() = default;
  virtual void on_decision(const EnforcementRecord& rec) = 0;
};

class NoopTelemetrySink : public ITelemetrySink {
 public:
  void on_decision(const EnforcementRecord&) override {}
};

} // namespace authgate
