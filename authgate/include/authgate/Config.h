#pragma once
#include <map>
#include <string>
#include <vector>
#include "Gateway.h"

namespace authgate {

struct ConfigStatus {
  bool ok{true};
  std::vector<std::string> errors;

  void fail(std::string e) {
    ok = false;
    errors.push_back(std::move(e));
  }
};

// Environment-style keys understood by load_config.
const std::vector<std::string>& config_keys();

// Starts from the defaults and applies every known key present in values.
// Unparseable values and failed validation are reported in status; the
// returned config must not be used when status.ok is false.
GatewayConfig load_config(const std::map<std::string, std::string>& values,
                          ConfigStatus& status);
GatewayConfig load_config_from_env(ConfigStatus& status);

// Threshold ordering, ranges, and a complete weight table. Also derives
// trust.expected_weight_mass from the validator base weights.
ConfigStatus validate_config(GatewayConfig& cfg);

} // namespace authgate
