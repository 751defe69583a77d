#pragma once
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include "authgate/AlertStore.h"
#include "authgate/AuditStore.h"
#include "authgate/Enforcement.h"
#include "authgate/Log.h"

namespace authgate::json {

// One JSON object per line, appended and flushed per record.
class JsonlAuditStore final : public IAuditStore {
 public:
  static std::unique_ptr<JsonlAuditStore> open(const std::string& path, std::string* error);

  StoreStatus append(const EnforcementRecord& rec) override;

 private:
  explicit JsonlAuditStore(std::string path);

  std::string path_;
  std::ofstream out_;
  std::mutex mu_;
};

// Durable alert log. Existing lines are replayed into the in-memory index on
// open; unreadable lines are skipped and counted.
class JsonlAlertStore final : public InMemoryAlertStore {
 public:
  static std::unique_ptr<JsonlAlertStore> open(const std::string& path, std::string* error,
                                               size_t* skipped = nullptr);

  StoreStatus append(const AlertRecord& rec) override;

 private:
  explicit JsonlAlertStore(std::string path);

  std::string path_;
  std::ofstream out_;
  std::mutex file_mu_;
};

// Best effort: write failures are logged at debug and otherwise ignored.
class JsonlTelemetrySink final : public ITelemetrySink {
 public:
  JsonlTelemetrySink(const std::string& path, ILogSink* log = nullptr);

  void on_decision(const EnforcementRecord& rec) override;

 private:
  std::ofstream out_;
  NoopLogSink noop_log_{};
  ILogSink* log_{nullptr};
  std::mutex mu_;
};

} // namespace authgate::json
