#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace wardline::common {

enum class Severity { Low = 0, Medium = 1, High = 2, Critical = 3 };

enum class ProtectionLevel { Permissive, Standard, Strict };

[[nodiscard]] std::string_view severity_name(Severity severity);
[[nodiscard]] std::optional<Severity> parse_severity(const std::string &value);

[[nodiscard]] std::string_view protection_level_name(ProtectionLevel level);
[[nodiscard]] std::optional<ProtectionLevel> parse_protection_level(const std::string &value);

} // namespace wardline::common
