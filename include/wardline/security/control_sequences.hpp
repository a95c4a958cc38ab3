#pragma once

#include "wardline/security/sanitize_config.hpp"
#include "wardline/security/violation.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::security {

struct ControlScanResult {
  std::string output;
  /// Offset in the scanned text of every output byte. Tags map to the start
  /// of the sequence they replace.
  std::vector<std::size_t> origins;
  std::vector<SecurityViolation> violations;
};

/// Single left-to-right pass over valid UTF-8 text. Terminal escape sequences
/// become bracketed tags, raw control characters are removed. Line breaks are
/// left in place for the line-ending pass.
[[nodiscard]] ControlScanResult scan_control_sequences(std::string_view text,
                                                       const SanitizationConfig &config);

} // namespace wardline::security
