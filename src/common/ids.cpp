#include "wardline/common/ids.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <atomic>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace wardline::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // Ids only need to be unique within a process when the CSPRNG is unavailable.
    static std::atomic<std::uint64_t> counter{0};
    const auto now = static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    std::uint64_t mixed = now ^ (counter.fetch_add(1) * 0x9E3779B97F4A7C15ULL);
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(mixed & 0xFFU);
      mixed = (mixed >> 8U) | (mixed << 56U);
    }
  }
  return to_hex(data.data(), data.size());
}

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

std::string iso8601_utc(const std::chrono::system_clock::time_point time) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() %
      1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream stream;
  stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
         << std::setfill('0') << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return stream.str();
}

std::string iso8601_now() { return iso8601_utc(std::chrono::system_clock::now()); }

} // namespace wardline::common
