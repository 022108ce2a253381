// eligian/basic/errors.hpp - Fatal pipeline errors
//
// User-facing problems are Diagnostics. These exceptions cover the two ways
// a compilation can fail outright: a syntax tree that breaks the parser
// contract, and an IR value the output schema cannot represent.
//
#pragma once

#include <stdexcept>
#include <string>

#include "eligian/basic/source_manager.hpp"

namespace eligian
{

/**
 * The syntax tree is structurally invalid (missing child, unknown node tag,
 * non-constant time expression). Thrown by the tree reader and by lowering.
 */
class TransformError : public std::runtime_error
{
public:
  explicit TransformError(const std::string & message, SourceRange range = {})
  : std::runtime_error(message), range_(range)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  SourceRange range_;
};

/**
 * An IR value cannot be written to the configuration JSON.
 * `field_path` points at the value, e.g. "timelines[0].timelineActions[2].duration.end".
 */
class EmitError : public std::runtime_error
{
public:
  EmitError(const std::string & message, std::string field_path)
  : std::runtime_error(message + " at " + field_path), field_path_(std::move(field_path))
  {
  }

  [[nodiscard]] const std::string & field_path() const noexcept { return field_path_; }

private:
  std::string field_path_;
};

}  // namespace eligian
