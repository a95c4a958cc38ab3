#include "wardline/common/utf8.hpp"

namespace wardline::common {

namespace {

bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

} // namespace

bool decode_utf8(std::string_view input, std::size_t &index, std::uint32_t &cp) {
  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  std::uint32_t minimum = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
    minimum = 0x80U;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
    minimum = 0x800U;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
    minimum = 0x10000U;
  } else {
    cp = lead;
    ++index;
    return false;
  }

  if (index + extra >= input.size()) {
    cp = lead;
    ++index;
    return false;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if (!is_continuation(cont)) {
      cp = lead;
      ++index;
      return false;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }

  if (value < minimum || value > 0x10FFFFU || (value >= 0xD800U && value <= 0xDFFFU)) {
    cp = lead;
    ++index;
    return false;
  }

  index += extra + 1;
  cp = value;
  return true;
}

void append_utf8(std::string &output, const std::uint32_t cp) {
  if (cp < 0x80U) {
    output.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    output.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    output.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    output.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    output.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    output.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    output.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::size_t utf16_length(std::string_view input) {
  std::size_t units = 0;
  std::size_t index = 0;
  while (index < input.size()) {
    std::uint32_t cp = 0;
    if (decode_utf8(input, index, cp) && cp >= 0x10000U) {
      units += 2;
    } else {
      ++units;
    }
  }
  return units;
}

std::size_t utf8_prefix_length(std::string_view input, const std::size_t max_bytes) {
  if (max_bytes >= input.size()) {
    return input.size();
  }
  std::size_t cut = max_bytes;
  // Back off over at most three continuation bytes to reach a lead byte.
  std::size_t steps = 0;
  while (cut > 0 && steps < 3 && is_continuation(static_cast<unsigned char>(input[cut]))) {
    --cut;
    ++steps;
  }
  return cut;
}

std::string repair_utf8(std::string_view input, std::size_t &replaced) {
  replaced = 0;
  std::string output;
  output.reserve(input.size());
  std::size_t index = 0;
  while (index < input.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (decode_utf8(input, index, cp)) {
      output.append(input.substr(start, index - start));
    } else {
      append_utf8(output, kReplacementCharacter);
      ++replaced;
    }
  }
  return output;
}

} // namespace wardline::common
