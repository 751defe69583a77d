#include "authgate/AlertAggregator.h"
#include <vector>

namespace authgate {

AlertAggregator::AlertAggregator(const IAlertStore& store) : store_(store) {}

AlertCountResult AlertAggregator::count_recent(const std::string& session_id,
                                               uint32_t window_minutes, TimeMs now_ms,
                                               TimeMs timeout_ms) const {
  AlertCountResult res{};
  res.count.session_id = session_id;

  TimeMs window_ms = static_cast<TimeMs>(window_minutes) * 60000ull;
  TimeMs since = now_ms > window_ms ? now_ms - window_ms : 0;

  std::vector<AlertRecord> hits;
  StoreStatus st = store_.query(session_id, since, hits, timeout_ms);
  if (!st.ok) {
    res.error = st.error.empty() ? "alert store query failed" : st.error;
    return res;
  }
  for (const auto& a : hits) {
    if (a.timestamp_ms > now_ms) continue; // written after this query's instant
    if (a.severity == Severity::High) ++res.count.high;
    else if (a.severity == Severity::Medium) ++res.count.medium;
  }
  res.ok = true;
  return res;
}

} // namespace authgate
