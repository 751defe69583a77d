#pragma once
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Common.h"

namespace authgate {

struct AlertRecord {
  std::string session_id;
  TimeMs timestamp_ms{0};
  StrideCategory stride{StrideCategory::InformationDisclosure};
  Severity severity{Severity::Low};
  std::string source;
};

struct StoreStatus {
  bool ok{true};
  std::string error;

  static StoreStatus Ok() { return {}; }
  static StoreStatus Fail(std::string e) { return {false, std::move(e)}; }
};

// Append-only alert log keyed by session and time. query() may run
// concurrently with append() and sees a snapshot taken when it starts.
class IAlertStore {
 public:
  virtual ~IAlertStore() = default;
  virtual StoreStatus append(const AlertRecord& rec) = 0;
  // Records of session_id with timestamp_ms >= since_ms. timeout_ms is how
  // long the caller will wait (0: unbounded); a remote store bounds its I/O
  // by it and reports a failure instead of blocking past it.
  virtual StoreStatus query(const std::string& session_id, TimeMs since_ms,
                            std::vector<AlertRecord>& out, TimeMs timeout_ms) const = 0;
};

// Copy-on-write per session: the log is split into shards by session id,
// each shard publishes an immutable map of per-session buckets. Readers load
// the shard map and the session's bucket without locking; an append copies
// one session's bucket (and its shard map when the session is new).
class InMemoryAlertStore : public IAlertStore {
 public:
  InMemoryAlertStore();

  StoreStatus append(const AlertRecord& rec) override;
  StoreStatus query(const std::string& session_id, TimeMs since_ms,
                    std::vector<AlertRecord>& out, TimeMs timeout_ms) const override;

  size_t size() const;
  size_t session_count() const;

 protected:
  // Publishes records without re-persisting them (used when restoring state).
  void publish_all(std::vector<AlertRecord> records);

 private:
  using Bucket = std::vector<AlertRecord>;
  struct Session {
    std::shared_ptr<const Bucket> records;
  };
  using SessionMap = std::unordered_map<std::string, std::shared_ptr<Session>>;
  struct Shard {
    std::shared_ptr<const SessionMap> sessions;
    std::mutex write_mu;
  };
  static constexpr size_t kShards = 32;

  Shard& shard_for(const std::string& session_id);
  const Shard& shard_for(const std::string& session_id) const;
  void add_locked(Shard& shard, const std::string& session_id, const AlertRecord* recs, size_t n);

  std::array<Shard, kShards> shards_;
  std::atomic<size_t> count_{0};
};

} // namespace authgate
