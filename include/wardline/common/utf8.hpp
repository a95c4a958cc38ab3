#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wardline::common {

inline constexpr std::uint32_t kReplacementCharacter = 0xFFFDU;

/// Decodes one code point starting at `index` and advances past it.
/// Returns false for an invalid, overlong, surrogate or truncated sequence, in
/// which case `index` advances by exactly one byte and `cp` holds the raw byte.
bool decode_utf8(std::string_view input, std::size_t &index, std::uint32_t &cp);

void append_utf8(std::string &output, std::uint32_t cp);

/// Length in UTF-16 code units. Invalid bytes count as one unit each.
[[nodiscard]] std::size_t utf16_length(std::string_view input);

/// Largest prefix length <= max_bytes that does not split a multi-byte sequence.
[[nodiscard]] std::size_t utf8_prefix_length(std::string_view input, std::size_t max_bytes);

/// Replaces every invalid sequence with U+FFFD. `replaced` receives the count.
[[nodiscard]] std::string repair_utf8(std::string_view input, std::size_t &replaced);

} // namespace wardline::common
