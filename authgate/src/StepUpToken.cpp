#include "authgate/StepUpToken.h"
#include "authgate/Util.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <cstring>

namespace authgate {

namespace {
constexpr uint8_t kTokenVersion = 1;
constexpr size_t kMacSize = 16;
constexpr size_t kBodySize = kStepUpTokenSize - kMacSize;
constexpr uint32_t kCodeModulus = 1000000;

static void write_u32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}
static uint32_t read_u32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) |
         static_cast<uint32_t>(p[3]);
}

static bool hmac_sha256(const std::vector<uint8_t>& key, const uint8_t* msg, size_t msg_len,
                        std::array<uint8_t, 32>& out) {
  unsigned int out_len = 0;
  unsigned char* r = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), msg, msg_len,
                          out.data(), &out_len);
  return r != nullptr && out_len == out.size();
}

static std::vector<uint8_t> serialize_fields(const StepUpFields& f) {
  std::vector<uint8_t> out;
  out.reserve(kStepUpTokenSize);
  out.push_back(kTokenVersion);
  out.push_back(f.key_id);
  write_u32(out, f.time_bucket);
  out.insert(out.end(), f.session_hash.begin(), f.session_hash.end());
  return out;
}

static std::string truncate_code(const std::array<uint8_t, 32>& mac) {
  size_t offset = mac[mac.size() - 1] & 0x0F;
  uint32_t bin = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                 (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                 (static_cast<uint32_t>(mac[offset + 2]) << 8) |
                 static_cast<uint32_t>(mac[offset + 3]);
  std::string digits = std::to_string(bin % kCodeModulus);
  return std::string(6 - digits.size(), '0') + digits;
}

static const StepUpKey* key_for(uint8_t key_id, const StepUpKeyring& keys) {
  if (key_id == keys.current.key_id) return &keys.current;
  if (keys.previous && key_id == keys.previous->key_id) return &*keys.previous;
  return nullptr;
}

} // namespace

std::array<uint8_t, 8> session_hash(std::string_view session_id) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char*>(session_id.data()), session_id.size(),
         digest.data());
  std::array<uint8_t, 8> out{};
  std::memcpy(out.data(), digest.data(), out.size());
  return out;
}

uint32_t time_bucket(TimeMs now_ms, uint32_t bucket_ms) {
  if (bucket_ms == 0) return 0;
  return static_cast<uint32_t>(now_ms / bucket_ms);
}

std::vector<uint8_t> step_up_mint(const StepUpFields& fields, const StepUpKey& key) {
  StepUpFields f = fields;
  f.key_id = key.key_id;
  std::vector<uint8_t> body = serialize_fields(f);
  std::array<uint8_t, 32> mac{};
  if (!hmac_sha256(key.secret, body.data(), body.size(), mac)) return {};
  body.insert(body.end(), mac.begin(), mac.begin() + kMacSize);
  return body;
}

std::optional<std::string> step_up_code(const StepUpFields& fields, const StepUpKey& key) {
  StepUpFields f = fields;
  f.key_id = key.key_id;
  std::vector<uint8_t> body = serialize_fields(f);
  std::array<uint8_t, 32> mac{};
  if (!hmac_sha256(key.secret, body.data(), body.size(), mac)) return std::nullopt;
  return truncate_code(mac);
}

std::optional<StepUpChallenge> step_up_issue(std::string_view session_id, TimeMs now_ms,
                                             const StepUpKeyring& keys) {
  StepUpFields f{};
  f.key_id = keys.current.key_id;
  f.time_bucket = time_bucket(now_ms, keys.bucket_ms);
  f.session_hash = session_hash(session_id);

  auto token = step_up_mint(f, keys.current);
  if (token.empty()) return std::nullopt;
  auto code = step_up_code(f, keys.current);
  if (!code) return std::nullopt;
  return StepUpChallenge{hex_encode(token.data(), token.size()), *code};
}

StepUpVerifyResult step_up_verify(const uint8_t* data, size_t len, const StepUpKeyring& keys,
                                  uint32_t now_bucket) {
  StepUpVerifyResult res{};
  if (data == nullptr || len != kStepUpTokenSize) return res;
  if (data[0] != kTokenVersion) return res;
  StepUpFields f{};
  f.key_id = data[1];
  f.time_bucket = read_u32(data + 2);
  std::memcpy(f.session_hash.data(), data + 6, f.session_hash.size());

  const StepUpKey* key = key_for(f.key_id, keys);
  if (!key) return res;

  std::array<uint8_t, 32> calc{};
  if (!hmac_sha256(key->secret, data, kBodySize, calc)) return res;
  if (CRYPTO_memcmp(data + kBodySize, calc.data(), kMacSize) != 0) return res;

  uint32_t max_skew = keys.max_skew_buckets;
  if (static_cast<uint64_t>(f.time_bucket) + max_skew < now_bucket ||
      static_cast<uint64_t>(now_bucket) + max_skew < f.time_bucket) {
    return res;
  }

  res.ok = true;
  res.fields = f;
  return res;
}

StepUpVerifyResult step_up_verify(std::string_view token_hex, const StepUpKeyring& keys,
                                  uint32_t now_bucket) {
  auto raw = hex_decode(token_hex);
  if (!raw) return StepUpVerifyResult{};
  return step_up_verify(raw->data(), raw->size(), keys, now_bucket);
}

bool step_up_check(std::string_view token_hex, std::string_view code,
                   std::string_view session_id, const StepUpKeyring& keys, uint32_t now_bucket) {
  auto res = step_up_verify(token_hex, keys, now_bucket);
  if (!res.ok) return false;
  auto expected_hash = session_hash(session_id);
  if (CRYPTO_memcmp(res.fields.session_hash.data(), expected_hash.data(),
                    expected_hash.size()) != 0) {
    return false;
  }
  const StepUpKey* key = key_for(res.fields.key_id, keys);
  if (!key) return false;
  auto expected = step_up_code(res.fields, *key);
  if (!expected || code.size() != expected->size()) return false;
  return CRYPTO_memcmp(code.data(), expected->data(), code.size()) == 0;
}

} // namespace authgate
