// assert_lint/frontend/unit_loader.hpp - Load analysis units exported by a front-end
//
// The parser and resolver live outside this project; they hand over each
// compilation unit as a JSON document holding the class/method tree, the
// resolved type and method symbols and (optionally) the source text.
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "assert_lint/frontend/analysis_unit.hpp"

namespace assert_lint
{

/**
 * A unit document is unreadable or structurally invalid.
 */
class UnitLoadError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Build a unit from JSON text.
 *
 * @param json_text   Unit document
 * @param source_path Path reported for the unit unless the document names one
 * @throws UnitLoadError on malformed input
 */
[[nodiscard]] AnalysisUnit load_unit_from_string(
  std::string_view json_text, const std::filesystem::path & source_path = "<unit>");

/**
 * Read and build a unit from a file.
 *
 * @throws UnitLoadError if the file cannot be read or is malformed
 */
[[nodiscard]] AnalysisUnit load_unit_from_file(const std::filesystem::path & path);

/**
 * Default file extension of unit documents.
 */
inline constexpr const char * k_unit_file_extension = ".json";

}  // namespace assert_lint
