#include "authgate/ReferenceData.h"
#include "authgate/Util.h"
#include <arpa/inet.h>
#include <atomic>
#include <fstream>
#include <vector>

namespace authgate {

namespace {

std::optional<uint32_t> parse_ipv4(std::string_view s) {
  std::string t(s);
  in_addr addr{};
  if (inet_pton(AF_INET, t.c_str(), &addr) != 1) return std::nullopt;
  return ntohl(addr.s_addr);
}

std::optional<std::string> canonical_ipv6(std::string_view s) {
  std::string t(s);
  in6_addr addr{};
  if (inet_pton(AF_INET6, t.c_str(), &addr) != 1) return std::nullopt;
  char buf[INET6_ADDRSTRLEN] = {};
  if (!inet_ntop(AF_INET6, &addr, buf, sizeof(buf))) return std::nullopt;
  return std::string(buf);
}

uint32_t prefix_mask(unsigned len) {
  return len == 0 ? 0u : (0xFFFFFFFFu << (32 - len));
}

// Minimal RFC 4180 field splitter: quoted fields may contain commas and "".
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(trim(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  out.push_back(trim(cur));
  return out;
}

struct CsvRow {
  const std::vector<std::string>* header{nullptr};
  std::vector<std::string> fields;

  std::string get(std::string_view name) const {
    for (size_t i = 0; i < header->size() && i < fields.size(); ++i) {
      if ((*header)[i] == name) return fields[i];
    }
    return {};
  }
};

bool load_row(Dataset kind, const CsvRow& row, ReferenceSnapshot& snap) {
  switch (kind) {
    case Dataset::Geo: {
      auto lat = parse_double(row.get("lat"));
      auto lon = parse_double(row.get("lon"));
      if (!lat || !lon || !valid_coordinates(*lat, *lon)) return false;
      GeoRecord rec{};
      rec.country = row.get("country");
      rec.city = row.get("city");
      rec.location = GeoPoint{*lat, *lon};
      rec.anonymous = parse_bool(row.get("anonymous")).value_or(false);
      return snap.add_geo_network(row.get("network"), rec);
    }
    case Dataset::Wifi: {
      std::string bssid = row.get("bssid");
      auto lat = parse_double(row.get("lat"));
      auto lon = parse_double(row.get("lon"));
      if (bssid.empty() || !lat || !lon || !valid_coordinates(*lat, *lon)) return false;
      snap.add_wifi(bssid, WifiRecord{row.get("ssid"), GeoPoint{*lat, *lon}});
      return true;
    }
    case Dataset::Tls: {
      std::string ja3 = row.get("ja3");
      if (ja3.empty()) return false;
      snap.add_tls(ja3, row.get("tag"));
      return true;
    }
    case Dataset::Device: {
      std::string id = row.get("device_id");
      if (id.empty()) return false;
      DeviceRecord rec{};
      rec.os = row.get("os");
      rec.patched = parse_bool(row.get("patched"));
      rec.edr = row.get("edr");
      rec.last_update_day = parse_iso_date_days(row.get("last_update"));
      snap.add_device(id, rec);
      return true;
    }
  }
  return false;
}

void load_file(Dataset kind, const std::string& path, ReferenceSnapshot& snap,
               DatasetStatus& status, ILogSink* log, IMetricSink* metrics) {
  if (path.empty()) {
    status.error = "no path configured";
    return;
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    status.error = "cannot open " + path;
    if (log) log->log(LogLevel::Warn, "reference", std::string(to_string(kind)) + ": " + status.error);
    return;
  }
  status = load_dataset_csv(kind, in, snap);
  if (log) {
    log->log(status.loaded ? LogLevel::Info : LogLevel::Warn, "reference",
             std::string(to_string(kind)) + ": rows=" + std::to_string(status.rows) +
             " skipped=" + std::to_string(status.skipped) +
             (status.error.empty() ? "" : " error=" + status.error));
  }
  if (metrics) {
    metrics->set_gauge(kMetricReferenceEntries, static_cast<double>(status.rows),
                       { {"dataset", std::string(to_string(kind))} });
  }
}

} // namespace

std::string normalize_bssid(std::string_view bssid) {
  std::string out = to_lower(trim(bssid));
  for (auto& c : out) {
    if (c == '-') c = ':';
  }
  return out;
}

bool ReferenceSnapshot::add_geo_network(std::string_view cidr, const GeoRecord& rec) {
  std::string text = trim(cidr);
  std::string addr = text;
  std::optional<uint64_t> len;
  auto slash = text.find('/');
  if (slash != std::string::npos) {
    addr = text.substr(0, slash);
    len = parse_u64(text.substr(slash + 1));
    if (!len) return false;
  }
  if (auto v4 = parse_ipv4(addr)) {
    if (len && *len > 32) return false;
    unsigned prefix = static_cast<unsigned>(len.value_or(32));
    v4_by_prefix_[prefix][*v4 & prefix_mask(prefix)] = rec;
    ++geo_count_;
    return true;
  }
  if (auto v6 = canonical_ipv6(addr)) {
    // IPv6 entries are host records only.
    if (len && *len != 128) return false;
    v6_exact_[*v6] = rec;
    ++geo_count_;
    return true;
  }
  return false;
}

void ReferenceSnapshot::add_wifi(std::string_view bssid, const WifiRecord& rec) {
  wifi_[normalize_bssid(bssid)] = rec;
}

void ReferenceSnapshot::add_tls(std::string_view ja3, std::string_view tag) {
  tls_[to_lower(trim(ja3))] = to_lower(trim(tag));
}

void ReferenceSnapshot::add_device(std::string_view device_id, const DeviceRecord& rec) {
  devices_[trim(device_id)] = rec;
}

const GeoRecord* ReferenceSnapshot::lookup_ip(std::string_view ip) const {
  std::string text = trim(ip);
  if (auto v4 = parse_ipv4(text)) {
    for (int prefix = 32; prefix >= 0; --prefix) {
      const auto& table = v4_by_prefix_[static_cast<size_t>(prefix)];
      if (table.empty()) continue;
      auto it = table.find(*v4 & prefix_mask(static_cast<unsigned>(prefix)));
      if (it != table.end()) return &it->second;
    }
    return nullptr;
  }
  if (auto v6 = canonical_ipv6(text)) {
    auto it = v6_exact_.find(*v6);
    return it == v6_exact_.end() ? nullptr : &it->second;
  }
  return nullptr;
}

const WifiRecord* ReferenceSnapshot::lookup_wifi(std::string_view bssid) const {
  auto it = wifi_.find(normalize_bssid(bssid));
  return it == wifi_.end() ? nullptr : &it->second;
}

const std::string* ReferenceSnapshot::lookup_tls(std::string_view ja3) const {
  auto it = tls_.find(to_lower(trim(ja3)));
  if (it == tls_.end() || it->second.empty()) return nullptr;
  return &it->second;
}

const DeviceRecord* ReferenceSnapshot::lookup_device(std::string_view device_id) const {
  auto it = devices_.find(trim(device_id));
  return it == devices_.end() ? nullptr : &it->second;
}

ReferenceStore::ReferenceStore(std::shared_ptr<const ReferenceSnapshot> initial)
    : current_(std::move(initial)) {}

std::shared_ptr<const ReferenceSnapshot> ReferenceStore::snapshot() const {
  return std::atomic_load(&current_);
}

void ReferenceStore::publish(std::shared_ptr<const ReferenceSnapshot> next) {
  std::atomic_store(&current_, std::move(next));
}

std::string_view to_string(Dataset d) {
  switch (d) {
    case Dataset::Geo: return "geoip";
    case Dataset::Wifi: return "wifi";
    case Dataset::Tls: return "tls";
    case Dataset::Device: return "device";
  }
  return "unknown";
}

DatasetStatus load_dataset_csv(Dataset kind, std::istream& in, ReferenceSnapshot& snap) {
  DatasetStatus status{};
  std::string line;
  if (!std::getline(in, line)) {
    status.error = "empty file";
    return status;
  }
  std::vector<std::string> header = split_csv_line(line);
  for (auto& h : header) h = to_lower(h);

  while (std::getline(in, line)) {
    if (trim(line).empty()) continue;
    CsvRow row{&header, split_csv_line(line)};
    if (load_row(kind, row, snap)) {
      ++status.rows;
    } else {
      ++status.skipped;
    }
  }
  status.loaded = status.rows > 0;
  if (!status.loaded && status.error.empty()) status.error = "no usable rows";
  return status;
}

std::shared_ptr<const ReferenceSnapshot> load_reference_snapshot(
    const ReferencePaths& paths, ReferenceLoadReport& report,
    ILogSink* log, IMetricSink* metrics) {
  auto snap = std::make_shared<ReferenceSnapshot>();
  load_file(Dataset::Geo, paths.geo, *snap, report.geo, log, metrics);
  load_file(Dataset::Wifi, paths.wifi, *snap, report.wifi, log, metrics);
  load_file(Dataset::Tls, paths.tls, *snap, report.tls, log, metrics);
  load_file(Dataset::Device, paths.device, *snap, report.device, log, metrics);
  return snap;
}

} // namespace authgate
