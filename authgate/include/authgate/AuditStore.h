#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "AlertStore.h"
#include "Common.h"

namespace authgate {

// Durable audit row for one decision. Never updated once written.
struct EnforcementRecord {
  std::string session_id;
  double risk{1.0};
  Decision decision{Decision::Deny};
  Enforcement enforcement{Enforcement::Deny};
  std::vector<std::string> reasons;
  TimeMs timestamp_ms{0};
};

class IAuditStore {
 public:
  virtual ~IAuditStore() = default;
  virtual StoreStatus append(const EnforcementRecord& rec) = 0;
};

class InMemoryAuditStore final : public IAuditStore {
 public:
  StoreStatus append(const EnforcementRecord& rec) override;

  std::vector<EnforcementRecord> records() const;
  std::vector<EnforcementRecord> records_for(const std::string& session_id) const;

 private:
  mutable std::mutex mu_;
  std::vector<EnforcementRecord> records_;
};

} // namespace authgate
