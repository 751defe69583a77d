#pragma once
#include <cstdint>
#include <string>
#include "AlertStore.h"
#include "Common.h"

namespace authgate {

// Rolling counts over the trailing window, recomputed on every query.
struct AlertWindowCount {
  std::string session_id;
  uint32_t high{0};
  uint32_t medium{0};
};

struct AlertCountResult {
  bool ok{false};
  AlertWindowCount count{};
  std::string error;
};

class AlertAggregator {
 public:
  explicit AlertAggregator(const IAlertStore& store);

  // Counts high/medium alerts for session_id in [now_ms - window, now_ms].
  // A store failure yields ok=false, never a zero count. timeout_ms is handed
  // to the store's query (0: unbounded).
  AlertCountResult count_recent(const std::string& session_id, uint32_t window_minutes,
                                TimeMs now_ms, TimeMs timeout_ms = 0) const;

 private:
  const IAlertStore& store_;
};

} // namespace authgate
