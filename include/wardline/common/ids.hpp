#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace wardline::common {

/// Hex string of `bytes` cryptographically random bytes.
[[nodiscard]] std::string random_hex(std::size_t bytes);

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// ISO-8601 UTC with millisecond precision, e.g. 2024-01-31T12:00:00.000Z.
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point time);
[[nodiscard]] std::string iso8601_now();

} // namespace wardline::common
