// assert_lint/project/project_config.hpp - Project configuration (assert_lint.yaml)
//
// Parses and validates assert_lint.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace assert_lint
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * `rules.missing_assertion` section.
 */
struct MissingAssertionRuleConfig
{
  /// Comma-separated "Type#method" entries, a trailing '*' for prefixes
  std::string custom_assertion_methods;

  std::vector<std::string> test_annotations{"org.junit.Test"};
  std::string legacy_test_base = "junit.framework.TestCase";
  std::string test_method_prefix = "test";
};

struct RulesConfig
{
  MissingAssertionRuleConfig missing_assertion;
};

/**
 * Complete project configuration (assert_lint.yaml).
 */
struct ProjectConfig
{
  /// Unit documents to check (absolute after loading)
  std::vector<std::filesystem::path> sources;

  /// Worker threads; 0 means one per hardware thread
  unsigned jobs = 1;

  RulesConfig rules;

  /// Directory containing assert_lint.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an assert_lint.yaml file.
 *
 * @param config_path Path to assert_lint.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative source paths are resolved against
 * `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to assert_lint.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "assert_lint.yaml";

}  // namespace assert_lint
