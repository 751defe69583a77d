#include "authgate/AuditStore.h"

namespace authgate {

StoreStatus InMemoryAuditStore::append(const EnforcementRecord& rec) {
  std::lock_guard<std::mutex> lock(mu_);
  records_.push_back(rec);
  return StoreStatus::Ok();
}

std::vector<EnforcementRecord> InMemoryAuditStore::records() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_;
}

std::vector<EnforcementRecord> InMemoryAuditStore::records_for(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<EnforcementRecord> out;
  for (const auto& r : records_) {
    if (r.session_id == session_id) out.push_back(r);
  }
  return out;
}

} // namespace authgate
