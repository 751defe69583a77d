#include "authgate/Config.h"
#include "authgate/Gateway.h"
#include "authgate/ReferenceData.h"
#include "authgate/Util.h"
#include "authgate/json/Codec.h"
#include "authgate/json/JsonlStores.h"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace authgate;

namespace {

std::string env_or(const char* key, const std::string& fallback = {}) {
  const char* v = std::getenv(key);
  return v ? std::string(v) : fallback;
}

TimeMs wall_now_ms() {
  using namespace std::chrono;
  return static_cast<TimeMs>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

int config_error(const ConfigStatus& st) {
  for (const auto& e : st.errors) std::cerr << "config error: " << e << '\n';
  return 2;
}

} // namespace

// Reads one JSON signal bundle per line (stdin or argv[1]) and writes one
// JSON decision per line to stdout. Exit status 2 on configuration errors.
int main(int argc, char** argv) {
  LogLevel level = LogLevel::Info;
  ConfigStatus status{};
  if (auto l = parse_log_level(env_or("LOG_LEVEL", "info"))) {
    level = *l;
  } else {
    status.fail("LOG_LEVEL: unknown level");
  }
  StreamLogSink log(std::cerr, level);

  GatewayConfig cfg = load_config_from_env(status);

  std::optional<StepUpKeyring> keyring;
  std::string secret_hex = env_or("STEP_UP_SECRET");
  if (!secret_hex.empty()) {
    auto secret = hex_decode(trim(secret_hex));
    if (!secret || secret->size() < kStepUpSecretMin) {
      status.fail("STEP_UP_SECRET must be hex encoding at least 16 bytes");
    } else {
      StepUpKeyring keys{};
      keys.current = StepUpKey{*secret, 1};
      keys.bucket_ms = cfg.step_up_bucket_ms;
      keys.max_skew_buckets = cfg.step_up_max_skew;
      keyring = std::move(keys);
    }
  }
  if (!status.ok) return config_error(status);

  ReferencePaths paths{env_or("PATH_GEOIP"), env_or("PATH_WIFI"), env_or("PATH_TLS"),
                       env_or("PATH_DEV")};
  ReferenceLoadReport report{};
  ReferenceStore refs(load_reference_snapshot(paths, report, &log));

  std::unique_ptr<IAuditStore> audit;
  InMemoryAuditStore memory_audit;
  std::string audit_path = env_or("AUTHGATE_AUDIT_LOG");
  if (!audit_path.empty()) {
    std::string err;
    audit = json::JsonlAuditStore::open(audit_path, &err);
    if (!audit) {
      log.log(LogLevel::Error, "main", err);
      return 1;
    }
  }

  std::unique_ptr<IAlertStore> alerts;
  std::string alert_path = env_or("AUTHGATE_ALERT_LOG");
  if (!alert_path.empty()) {
    std::string err;
    size_t skipped = 0;
    alerts = json::JsonlAlertStore::open(alert_path, &err, &skipped);
    if (!alerts) {
      log.log(LogLevel::Error, "main", err);
      return 1;
    }
    if (skipped > 0) {
      log.log(LogLevel::Warn, "main", "skipped " + std::to_string(skipped) + " unreadable alert lines");
    }
  } else {
    alerts = std::make_unique<InMemoryAlertStore>();
  }

  std::unique_ptr<ITelemetrySink> telemetry;
  std::string telemetry_path = env_or("AUTHGATE_TELEMETRY_LOG");
  if (!telemetry_path.empty()) {
    telemetry = std::make_unique<json::JsonlTelemetrySink>(telemetry_path, &log);
  }

  GatewayDeps deps{};
  deps.refs = &refs;
  deps.alerts = alerts.get();
  deps.audit = audit ? audit.get() : &memory_audit;
  deps.telemetry = telemetry.get();
  deps.log = &log;
  deps.step_up = keyring ? &*keyring : nullptr;

  auto gateway = Gateway::create(cfg, deps, &status);
  if (!gateway) return config_error(status);

  std::ifstream file;
  if (argc > 1) {
    file.open(argv[1]);
    if (!file) {
      log.log(LogLevel::Error, "main", std::string("cannot open ") + argv[1]);
      return 1;
    }
  }
  std::istream& in = argc > 1 ? static_cast<std::istream&>(file) : std::cin;

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) continue;
    SignalBundle bundle{};
    auto parsed = json::parse_bundle(std::string_view(line), bundle);
    if (!parsed.ok) {
      log.log(LogLevel::Warn, "main",
              "line " + std::to_string(line_no) + ": " + parsed.error);
      json::json err{{"error", parsed.error}, {"line", line_no}, {"enforcement", "DENY"},
                     {"risk", 1.0}};
      std::cout << err.dump() << '\n';
      continue;
    }
    RequestContext ctx{};
    ctx.now_ms = wall_now_ms();
    GatewayResult res = gateway->decide(bundle, ctx);
    std::cout << json::gateway_response(res).dump() << '\n';
    std::cout.flush();
  }
  return 0;
}
