#pragma once

#include "wardline/memory/config.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/security/sanitize_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wardline::guard {

inline constexpr std::string_view kMessageTruncatedNote = "...[message truncated for memory protection]";
inline constexpr std::string_view kContextFailedMessage =
    "Context processing failed due to memory protection";

struct ProtectedContext {
  memory::Value context;
  std::vector<std::string> warnings;
  bool truncated = false;
};

/// Sanitizer settings derived from a memory configuration: same protection
/// level, input bounded by max_message_length.
[[nodiscard]] security::SanitizationConfig message_sanitization(const memory::MemoryConfig &config);

/// Returns an Error value safe to display: the message is sanitized, the stack
/// limited to max_stack_frames lines. Oversized errors lose their stack and
/// keep a truncated message. Non-error values are wrapped.
[[nodiscard]] memory::Value sanitize_error_with_memory_protection(const memory::Value &error,
                                                                  const memory::MemoryConfig &config = {});

[[nodiscard]] std::string truncate_message_with_memory_protection(std::string_view message,
                                                                  const memory::MemoryConfig &config = {});

/// Bounds a structured log context by max_context_size. A context whose
/// accessors throw is replaced by a single error entry.
[[nodiscard]] ProtectedContext process_context_with_memory_protection(const memory::Value &context,
                                                                      const memory::MemoryConfig &config = {});

} // namespace wardline::guard
