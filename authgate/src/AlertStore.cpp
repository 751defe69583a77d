#include "authgate/AlertStore.h"
#include <functional>

namespace authgate {

InMemoryAlertStore::InMemoryAlertStore() {
  for (auto& shard : shards_) shard.sessions = std::make_shared<const SessionMap>();
}

InMemoryAlertStore::Shard& InMemoryAlertStore::shard_for(const std::string& session_id) {
  return shards_[std::hash<std::string>{}(session_id) % kShards];
}

const InMemoryAlertStore::Shard& InMemoryAlertStore::shard_for(
    const std::string& session_id) const {
  return shards_[std::hash<std::string>{}(session_id) % kShards];
}

void InMemoryAlertStore::add_locked(Shard& shard, const std::string& session_id,
                                    const AlertRecord* recs, size_t n) {
  auto sessions = std::atomic_load(&shard.sessions);
  std::shared_ptr<Session> session;
  auto it = sessions->find(session_id);
  if (it != sessions->end()) {
    session = it->second;
  } else {
    session = std::make_shared<Session>();
    session->records = std::make_shared<const Bucket>();
    auto next = std::make_shared<SessionMap>(*sessions);
    next->emplace(session_id, session);
    std::atomic_store(&shard.sessions, std::shared_ptr<const SessionMap>(std::move(next)));
  }

  auto current = std::atomic_load(&session->records);
  auto next = std::make_shared<Bucket>();
  next->reserve(current->size() + n);
  next->assign(current->begin(), current->end());
  next->insert(next->end(), recs, recs + n);
  std::atomic_store(&session->records, std::shared_ptr<const Bucket>(std::move(next)));
  count_.fetch_add(n, std::memory_order_relaxed);
}

StoreStatus InMemoryAlertStore::append(const AlertRecord& rec) {
  Shard& shard = shard_for(rec.session_id);
  std::lock_guard<std::mutex> lock(shard.write_mu);
  add_locked(shard, rec.session_id, &rec, 1);
  return StoreStatus::Ok();
}

StoreStatus InMemoryAlertStore::query(const std::string& session_id, TimeMs since_ms,
                                      std::vector<AlertRecord>& out, TimeMs) const {
  auto sessions = std::atomic_load(&shard_for(session_id).sessions);
  auto it = sessions->find(session_id);
  if (it == sessions->end()) return StoreStatus::Ok();
  auto records = std::atomic_load(&it->second->records);
  for (const auto& rec : *records) {
    if (rec.timestamp_ms >= since_ms) out.push_back(rec);
  }
  return StoreStatus::Ok();
}

size_t InMemoryAlertStore::size() const { return count_.load(std::memory_order_relaxed); }

size_t InMemoryAlertStore::session_count() const {
  size_t n = 0;
  for (const auto& shard : shards_) n += std::atomic_load(&shard.sessions)->size();
  return n;
}

void InMemoryAlertStore::publish_all(std::vector<AlertRecord> records) {
  std::unordered_map<std::string, Bucket> by_session;
  for (auto& rec : records) {
    std::string key = rec.session_id;
    by_session[key].push_back(std::move(rec));
  }
  for (const auto& [session_id, bucket] : by_session) {
    Shard& shard = shard_for(session_id);
    std::lock_guard<std::mutex> lock(shard.write_mu);
    add_locked(shard, session_id, bucket.data(), bucket.size());
  }
}

} // namespace authgate
