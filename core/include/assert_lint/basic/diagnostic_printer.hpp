// assert_lint/basic/diagnostic_printer.hpp
//
// Prints diagnostics with file:line:column and a source excerpt in
// Rust-style format, or as a JSON document for tooling.
//
#pragma once

#include <iosfwd>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "assert_lint/basic/diagnostic.hpp"
#include "assert_lint/basic/source_manager.hpp"

namespace assert_lint
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[missing-assertion]: Add at least one assertion to this test case.
 *     --> FooTest.java:12:15
 *      |
 *   12 |   public void emptyTest() {
 *      |               ^^^^^^^^^
 *      |
 *
 * Units without source text print only the header and the location line.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics of a unit, ordered by location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

/**
 * Serialize one diagnostic as a JSON object:
 * {file, severity, code, message, start, end, line, column}.
 *
 * line/column are null when the unit has no source text.
 */
[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic & diag, const SourceFile & source);

}  // namespace assert_lint
