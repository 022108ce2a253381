// eligian/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "eligian/basic/diagnostic.hpp"
#include "eligian/basic/source_manager.hpp"

namespace eligian
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[UNKNOWN_CSS_CLASS]: Unknown CSS class: 'primry'
 *     --> presentation.eligian:5:20
 *      |
 *    5 |   selectElement(".button.primry")
 *      |                 ^^^^^^^^^^^^^^^^
 *      |
 *      = help: Did you mean 'primary'?
 *
 * When the document text is not available only the header, the location
 * line (uri only) and the help line are printed.
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

  /// Print every diagnostic ordered by primary location, then a summary line
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);
  void print_summary(const DiagnosticBag & diags);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace eligian
