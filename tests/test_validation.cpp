#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/validation/input_validator.hpp"

#include <initializer_list>
#include <string>
#include <vector>

void register_validation_tests(std::vector<wardline::tests::TestCase> &tests) {
  using wardline::tests::require;
  namespace val = wardline::validation;
  namespace sec = wardline::security;
  namespace mem = wardline::memory;
  namespace testing = wardline::testing;

  tests.push_back({"validation_project_name_auto_sanitize", [] {
                     val::ValidationConfig config;
                     config.auto_sanitize = true;
                     const auto result = val::validate_project_name("My Project!", config);
                     require(result.is_valid, "auto-sanitized name should be valid");
                     require(result.sanitized == "my-project", "got " + result.sanitized);
                     require(!result.suggestions.empty(), "sanitizing should be reported");
                   }});

  tests.push_back({"validation_project_name_without_auto_sanitize", [] {
                     const auto result = val::validate_project_name("My Project!");
                     require(!result.is_valid, "invalid without auto-sanitize");
                     require(result.sanitized == "my-project", "candidate still offered");
                     require(!result.errors.empty(), "format error reported");
                     require(result.suggestions.size() == 1 &&
                                 result.suggestions[0] == "Try 'my-project'",
                             "suggestion mismatch");

                     const auto ok = val::validate_project_name("my-app.v2");
                     require(ok.is_valid && ok.sanitized == "my-app.v2", "valid name kept");
                     require(ok.risk_score == 0 && ok.violations.empty(), "no violations");
                   }});

  tests.push_back({"validation_project_name_security_blocks_auto_sanitize", [] {
                     val::ValidationConfig config;
                     config.auto_sanitize = true;
                     const auto traversal = val::validate_project_name("../evil", config);
                     require(!traversal.is_valid, "traversal never auto-sanitized");
                     require(traversal.violations[0].category == sec::ThreatCategory::PathTraversal,
                             "traversal category");

                     const auto shell = val::validate_project_name("app;rm", config);
                     require(!shell.is_valid, "shell metacharacters never auto-sanitized");

                     require(!val::validate_project_name("a").is_valid, "too short");
                     require(!val::validate_project_name(std::string(215, 'a')).is_valid,
                             "too long");
                     require(!val::validate_project_name("-app").is_valid, "leading separator");
                     require(!val::validate_project_name("a--b").is_valid,
                             "consecutive separators");
                   }});

  tests.push_back({"validation_malformed_input_scores_100", [] {
                     const auto empty = val::validate_project_name("");
                     require(!empty.is_valid && empty.risk_score == 100, "empty is malformed");
                     require(empty.sanitized == "untitled-project", "safe default returned");
                     require(empty.violations[0].category == sec::ThreatCategory::MalformedInput &&
                                 empty.violations[0].severity == sec::Severity::Critical,
                             "malformed violation");

                     const auto nul = val::validate_path(std::string("a\0b", 3));
                     require(!nul.is_valid && nul.risk_score == 100, "NUL is malformed");
                     require(nul.sanitized == ".", "path default");

                     const auto utf8 = val::validate_command_arg("x\xFF");
                     require(!utf8.is_valid && utf8.risk_score == 100, "bad UTF-8 is malformed");
                   }});

  tests.push_back({"validation_sanitize_project_name", [] {
                     require(val::sanitize_project_name("  Hello__World  ") == "hello_world",
                             "got " + val::sanitize_project_name("  Hello__World  "));
                     require(val::sanitize_project_name("!!!") == "untitled-project",
                             "nothing usable falls back");
                     require(val::sanitize_project_name("x") == "untitled-project",
                             "too short falls back");
                     require(val::sanitize_project_name(std::string(300, 'b')).size() == 214,
                             "length capped");
                   }});

  tests.push_back({"validation_package_manager", [] {
                     const auto ok = val::validate_package_manager(" PNPM ");
                     require(ok.is_valid && ok.sanitized == "pnpm", "normalized manager");

                     const auto injected = val::validate_package_manager("npm; rm -rf /");
                     require(!injected.is_valid, "injection rejected");
                     require(injected.sanitized == "npm", "default manager offered");
                     require(injected.violations[0].category ==
                                     sec::ThreatCategory::CommandInjection &&
                                 injected.violations[0].severity == sec::Severity::Critical,
                             "injection is critical");

                     const auto unknown = val::validate_package_manager("maven");
                     require(!unknown.is_valid, "unsupported manager rejected");
                     require(unknown.violations[0].severity == sec::Severity::Medium,
                             "unsupported is medium");
                     require(unknown.suggestions[0] == "Use one of: npm, pnpm, yarn, bun",
                             "suggestion lists the allowed managers");

                     val::ValidationConfig custom;
                     custom.allowed_package_managers = {"maven"};
                     require(val::validate_package_manager("maven", custom).is_valid,
                             "allow-list is configurable");
                   }});

  tests.push_back({"validation_path_relative_inside_root", [] {
                     const testing::TempWorkspace workspace;
                     val::ValidationConfig config;
                     config.working_directory = workspace.path().string();
                     const auto result = val::validate_path("src/./main.cpp", config);
                     require(result.is_valid, result.errors.empty() ? "invalid" : result.errors[0]);
                     require(result.sanitized == "src/main.cpp", "got " + result.sanitized);
                     require(val::validate_path("src\\lib\\a.c", config).sanitized == "src/lib/a.c",
                             "backslashes become separators");
                   }});

  tests.push_back({"validation_path_traversal", [] {
                     const testing::TempWorkspace workspace;
                     val::ValidationConfig config;
                     config.working_directory = workspace.path().string();
                     const auto blocked = val::validate_path("src/../lib", config);
                     require(!blocked.is_valid, "traversal rejected by default");
                     require(blocked.sanitized == ".", "safe default returned");

                     config.allow_path_traversal = true;
                     const auto inside = val::validate_path("src/../lib", config);
                     require(inside.is_valid && inside.sanitized == "lib",
                             "traversal that stays inside is allowed");

                     const auto escape = val::validate_path("../../outside", config);
                     require(!escape.is_valid, "escape rejected");
                     require(escape.errors[0] == "Path escapes working directory",
                             "escape error mismatch");

                     require(!val::validate_path("%2e%2e/x", config).is_valid,
                             "encoded traversal is never allowed");
                     require(!val::validate_path("\xEF\xBC\x8E\xEF\xBC\x8E/x", config).is_valid,
                             "full-width traversal is never allowed");
                   }});

  tests.push_back({"validation_path_non_ascii_traversal_inside_root", [] {
                     const testing::TempWorkspace workspace;
                     val::ValidationConfig config;
                     config.working_directory = workspace.path().string();
                     config.allow_path_traversal = true;
                     const auto accented = val::validate_path("docs/caf\xC3\xA9/../x", config);
                     require(accented.is_valid,
                             accented.errors.empty() ? "invalid" : accented.errors[0]);
                     require(accented.sanitized == "docs/x", "got " + accented.sanitized);
                     require(val::validate_path("caf\xC3\xA9/menu", config).sanitized ==
                                 "caf\xC3\xA9/menu",
                             "non-ASCII names pass through");
                     require(!val::validate_path("docs/%2e%2e/%2e%2e/x", config).is_valid,
                             "percent-encoded traversal still rejected");
                   }});

  tests.push_back({"validation_path_never_expands_home_or_variables", [] {
                     const testing::EnvGuard home("HOME", std::string("/home/victim"));
                     const testing::TempWorkspace workspace;
                     val::ValidationConfig config;
                     config.working_directory = workspace.path().string();
                     for (const char *raw : {"$HOME", "${HOME}/x", "~evil", "~", "~/notes"}) {
                       const auto result = val::validate_path(raw, config);
                       require(!result.is_valid, std::string("accepted ") + raw);
                       require(result.sanitized == ".", std::string("fallback expected for ") + raw);
                     }
                     require(val::validate_path("$HOME", config).errors[0] ==
                                 "Path contains a variable reference",
                             "variable reference named");

                     config.allow_absolute_paths = true;
                     const auto tilde = val::validate_path("~/notes/./todo/", config);
                     require(tilde.is_valid && tilde.sanitized == "~/notes/todo",
                             "home form kept as written, got " + tilde.sanitized);
                     require(!val::validate_path("${HOME}/x", config).is_valid,
                             "variables rejected even when absolute paths are allowed");
                   }});

  tests.push_back({"validation_path_absolute_and_sensitive", [] {
                     const auto absolute = val::validate_path("/opt/data");
                     require(!absolute.is_valid, "absolute rejected by default");
                     require(absolute.violations[0].severity == sec::Severity::High,
                             "absolute is high");

                     val::ValidationConfig config;
                     config.allow_absolute_paths = true;
                     const auto allowed = val::validate_path("/opt/./data/", config);
                     require(allowed.is_valid && allowed.sanitized == "/opt/data",
                             "got " + allowed.sanitized);

                     const auto sensitive = val::validate_path("/etc/passwd", config);
                     require(!sensitive.is_valid, "sensitive file rejected");
                     require(sensitive.violations[0].severity == sec::Severity::Critical,
                             "sensitive file is critical");

                     val::ValidationConfig tight;
                     tight.max_path_length = 8;
                     const auto too_long = val::validate_path("aaaaaaaaaa", tight);
                     require(!too_long.is_valid && too_long.risk_score == 100,
                             "over-long path is malformed");
                   }});

  tests.push_back({"validation_sanitize_path_result", [] {
                     const auto bad = val::sanitize_path("../x");
                     require(!bad.ok(), "traversal should fail");
                     require(bad.error() == "Path traversal detected", "error mismatch");

                     const testing::TempWorkspace workspace;
                     val::ValidationConfig config;
                     config.working_directory = workspace.path().string();
                     const auto good = val::sanitize_path("docs/readme.md", config);
                     require(good.ok() && good.value() == "docs/readme.md", "path kept");
                   }});

  tests.push_back({"validation_command_arg", [] {
                     const auto plain = val::validate_command_arg("hello");
                     require(plain.is_valid && plain.sanitized == "hello", "plain argument");
                     require(val::validate_command_arg("hello world").sanitized == "'hello world'",
                             "whitespace is quoted");
                     require(val::validate_command_arg("it's here").sanitized ==
                                 "'it'\\''s here'",
                             "single quotes escaped");

                     const auto shell = val::validate_command_arg("a;b");
                     require(!shell.is_valid, "metacharacters rejected");
                     require(shell.sanitized == "ab", "metacharacters stripped");
                     require(shell.violations[0].category == sec::ThreatCategory::CommandInjection,
                             "command injection category");
                     require(!val::validate_command_arg("a\nb").is_valid, "line break rejected");

                     val::ValidationConfig tight;
                     tight.max_arg_length = 5;
                     const auto long_arg = val::validate_command_arg("abcdefgh", tight);
                     require(!long_arg.is_valid && long_arg.sanitized == "abcde",
                             "over-long argument truncated");
                   }});

  tests.push_back({"validation_sanitize_command_args", [] {
                     const auto cleaned =
                         val::sanitize_command_args({"ok", "$(x)", "a b", ";;"});
                     require(cleaned.size() == 3, "empty results dropped");
                     require(cleaned[1] == "x" && cleaned[2] == "'a b'", "cleaned args mismatch");

                     val::ValidationConfig strict;
                     strict.strict_mode = true;
                     bool threw = false;
                     try {
                       (void)val::sanitize_command_args({"ok", "a|b"}, strict);
                     } catch (const val::InputValidationError &ex) {
                       threw = true;
                       require(std::string(ex.what()) ==
                                   "argument 1: Argument contains shell metacharacters",
                               std::string("message mismatch: ") + ex.what());
                       require(!ex.violations().empty(), "violations attached");
                     }
                     require(threw, "strict mode should throw");
                     require(val::sanitize_command_args({"x y"}, strict)[0] == "'x y'",
                             "valid args pass in strict mode");
                   }});

  tests.push_back({"validation_value_overload_and_kinds", [] {
                     const auto number =
                         val::validate_input(val::InputKind::Path, mem::Value::number(1));
                     require(!number.is_valid && number.risk_score == 100, "non-string rejected");
                     require(number.sanitized == ".", "kind default returned");
                     require(number.errors[0].find("number") != std::string::npos,
                             "error names the received kind");

                     const auto text = val::validate_input(val::InputKind::PackageManager,
                                                           mem::Value::string("yarn"));
                     require(text.is_valid && text.sanitized == "yarn", "string value validated");

                     require(val::parse_input_kind("pm") == val::InputKind::PackageManager,
                             "pm alias");
                     require(val::parse_input_kind("Project-Name") == val::InputKind::ProjectName,
                             "case-insensitive kind");
                     require(!val::parse_input_kind("email").has_value(), "unknown kind");
                     require(val::input_kind_name(val::InputKind::CommandArg) == "command-arg",
                             "kind name");
                   }});
}
