#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"

namespace authgate {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);

// Upper-case, every run of non-alphanumerics collapsed to a single '_',
// leading/trailing '_' stripped. "Web Attack – XSS" -> "WEB_ATTACK_XSS".
std::string normalize_token(std::string_view s);

std::vector<std::string> split(std::string_view s, char delim);

// Strict parsers: the whole (trimmed) input must be consumed.
std::optional<double> parse_double(std::string_view s);
std::optional<uint64_t> parse_u64(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d);
// "YYYY-MM-DD", optionally followed by a time part which is ignored.
std::optional<int64_t> parse_iso_date_days(std::string_view s);

std::string hex_encode(const uint8_t* data, size_t len);
std::optional<std::vector<uint8_t>> hex_decode(std::string_view hex);

// "2024-05-01T12:00:00.250Z" for a Unix epoch millisecond timestamp.
std::string format_iso8601_ms(TimeMs epoch_ms);

// "sess-" followed by 8 random hex digits.
std::string generate_session_id();

inline double clamp01(double v) {
  return v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v);
}

} // namespace authgate
