// assert_lint/project/project_config.cpp - Project configuration implementation
//
#include "assert_lint/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace assert_lint
{

namespace
{

/// Parse an optional list of strings
bool parse_string_list(
  const YAML::Node & node, const char * key, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

std::optional<std::string> parse_missing_assertion(
  const YAML::Node & node, MissingAssertionRuleConfig & rule)
{
  if (!node.IsMap()) {
    return "rules.missing_assertion must be a map";
  }

  if (node["custom_assertion_methods"]) {
    const auto & custom = node["custom_assertion_methods"];
    if (custom.IsSequence()) {
      // Also accept a list of entries
      std::string joined;
      for (const auto & entry : custom) {
        if (!joined.empty()) joined += ',';
        joined += entry.as<std::string>();
      }
      rule.custom_assertion_methods = std::move(joined);
    } else {
      rule.custom_assertion_methods = custom.as<std::string>();
    }
  }

  if (node["test_annotations"]) {
    std::string error;
    if (!parse_string_list(
          node["test_annotations"], "rules.missing_assertion.test_annotations",
          rule.test_annotations, error)) {
      return error;
    }
  }

  if (node["legacy_test_base"]) {
    rule.legacy_test_base = node["legacy_test_base"].as<std::string>();
  }

  if (node["test_method_prefix"]) {
    rule.test_method_prefix = node["test_method_prefix"].as<std::string>();
    if (rule.test_method_prefix.empty()) {
      return "rules.missing_assertion.test_method_prefix must not be empty";
    }
  }

  return std::nullopt;
}

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'sources' section
  if (root["sources"]) {
    if (!root["sources"].IsSequence()) {
      return ConfigLoadResult::fail("sources must be a list");
    }
    for (const auto & src : root["sources"]) {
      std::filesystem::path p = src.as<std::string>();
      config.sources.push_back(p.is_absolute() ? p : project_root / p);
    }
  }

  // Parse 'jobs'
  if (root["jobs"]) {
    const int jobs = root["jobs"].as<int>();
    if (jobs < 0) {
      return ConfigLoadResult::fail("jobs must not be negative");
    }
    config.jobs = static_cast<unsigned>(jobs);
  }

  // Parse 'rules' section
  if (root["rules"]) {
    const auto & rules = root["rules"];
    if (!rules.IsMap()) {
      return ConfigLoadResult::fail("rules must be a map");
    }
    if (rules["missing_assertion"]) {
      if (auto error = parse_missing_assertion(rules["missing_assertion"], config.rules.missing_assertion)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return build_config(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return build_config(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    // Wrong scalar types surface as conversion errors
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace assert_lint
