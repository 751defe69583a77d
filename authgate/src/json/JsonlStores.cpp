#include "authgate/json/JsonlStores.h"
#include "authgate/Util.h"
#include "authgate/json/Codec.h"
#include <vector>

namespace authgate::json {

namespace {
bool write_line(std::ofstream& out, const json& doc) {
  out << doc.dump() << '\n';
  out.flush();
  return static_cast<bool>(out);
}
} // namespace

JsonlAuditStore::JsonlAuditStore(std::string path) : path_(std::move(path)) {}

std::unique_ptr<JsonlAuditStore> JsonlAuditStore::open(const std::string& path,
                                                       std::string* error) {
  std::unique_ptr<JsonlAuditStore> store(new JsonlAuditStore(path));
  store->out_.open(path, std::ios::out | std::ios::app);
  if (!store->out_) {
    if (error) *error = "cannot open audit log " + path;
    return nullptr;
  }
  return store;
}

StoreStatus JsonlAuditStore::append(const EnforcementRecord& rec) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!write_line(out_, to_json(rec))) {
    out_.clear();
    return StoreStatus::Fail("write failed: " + path_);
  }
  return StoreStatus::Ok();
}

JsonlAlertStore::JsonlAlertStore(std::string path) : path_(std::move(path)) {}

std::unique_ptr<JsonlAlertStore> JsonlAlertStore::open(const std::string& path,
                                                       std::string* error, size_t* skipped) {
  std::unique_ptr<JsonlAlertStore> store(new JsonlAlertStore(path));

  std::vector<AlertRecord> existing;
  size_t bad = 0;
  std::ifstream in(path);
  std::string line;
  while (in && std::getline(in, line)) {
    if (trim(line).empty()) continue;
    json doc = json::parse(line, nullptr, false);
    AlertRecord rec{};
    if (doc.is_discarded() || !parse_alert(doc, rec).ok) {
      ++bad;
      continue;
    }
    existing.push_back(std::move(rec));
  }
  if (skipped) *skipped = bad;
  store->publish_all(std::move(existing));

  store->out_.open(path, std::ios::out | std::ios::app);
  if (!store->out_) {
    if (error) *error = "cannot open alert log " + path;
    return nullptr;
  }
  return store;
}

StoreStatus JsonlAlertStore::append(const AlertRecord& rec) {
  {
    std::lock_guard<std::mutex> lock(file_mu_);
    if (!write_line(out_, to_json(rec))) {
      out_.clear();
      return StoreStatus::Fail("write failed: " + path_);
    }
  }
  return InMemoryAlertStore::append(rec);
}

JsonlTelemetrySink::JsonlTelemetrySink(const std::string& path, ILogSink* log)
    : out_(path, std::ios::out | std::ios::app), log_(log ? log : &noop_log_) {
  if (!out_) log_->log(LogLevel::Warn, "telemetry", "cannot open " + path);
}

void JsonlTelemetrySink::on_decision(const EnforcementRecord& rec) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!out_ || !write_line(out_, telemetry_document(rec))) {
    log_->log(LogLevel::Debug, "telemetry", "dropped event session=" + rec.session_id);
    out_.clear();
  }
}

} // namespace authgate::json
