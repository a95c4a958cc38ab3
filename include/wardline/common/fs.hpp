#pragma once

#include "wardline/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] bool ends_with(std::string_view value, std::string_view suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

} // namespace wardline::common
