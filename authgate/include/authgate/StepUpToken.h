#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"

namespace authgate {

struct StepUpFields {
  uint8_t key_id{0};
  uint32_t time_bucket{0};
  std::array<uint8_t, 8> session_hash{};
};

struct StepUpKey {
  std::vector<uint8_t> secret;
  uint8_t key_id{0};
};

struct StepUpKeyring {
  StepUpKey current{};
  std::optional<StepUpKey> previous{};
  uint32_t bucket_ms{30000};
  uint32_t max_skew_buckets{1};
};

struct StepUpChallenge {
  std::string token; // hex
  std::string code;  // 6 decimal digits
};

struct StepUpVerifyResult {
  bool ok{false};
  StepUpFields fields{};
};

constexpr size_t kStepUpSecretMin = 16;
constexpr size_t kStepUpTokenSize = 1 + 1 + 4 + 8 + 16;

// First 8 bytes of SHA-256(session_id).
std::array<uint8_t, 8> session_hash(std::string_view session_id);
uint32_t time_bucket(TimeMs now_ms, uint32_t bucket_ms);

// Challenge bound to a session and a time bucket:
// version | key_id | bucket(be32) | session_hash | HMAC-SHA256(body)[0..16).
// Empty on crypto failure.
std::vector<uint8_t> step_up_mint(const StepUpFields& fields, const StepUpKey& key);

// One-time code for a minted token: RFC 4226 dynamic truncation of the full
// HMAC over the token body.
std::optional<std::string> step_up_code(const StepUpFields& fields, const StepUpKey& key);

std::optional<StepUpChallenge> step_up_issue(std::string_view session_id, TimeMs now_ms,
                                             const StepUpKeyring& keys);

StepUpVerifyResult step_up_verify(const uint8_t* data, size_t len, const StepUpKeyring& keys,
                                  uint32_t now_bucket);
StepUpVerifyResult step_up_verify(std::string_view token_hex, const StepUpKeyring& keys,
                                  uint32_t now_bucket);

// Token must verify, belong to session_id, and carry the matching code.
bool step_up_check(std::string_view token_hex, std::string_view code,
                   std::string_view session_id, const StepUpKeyring& keys, uint32_t now_bucket);

} // namespace authgate
