// eligian/ast/syntax_tree_provider.hpp - Source of parsed syntax trees
//
// The parser lives outside this project. The compiler only sees a finished
// tree through SyntaxTreeProvider.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "eligian/ast/ast.hpp"
#include "eligian/ast/ast_context.hpp"

namespace eligian
{

/**
 * Supplies a fully parsed syntax tree.
 *
 * Implementations allocate the tree in the given context and throw
 * TransformError when the input cannot be turned into a tree.
 */
class SyntaxTreeProvider
{
public:
  virtual ~SyntaxTreeProvider() = default;

  [[nodiscard]] virtual const Program * provide(AstContext & ctx) = 0;
};

/**
 * Reads the JSON serialization emitted by the parser.
 *
 * Every node is an object with a "type" tag (see ast_nodes.def) and a
 * "range" of byte offsets:
 * @code
 *   {"type": "TimedEvent", "range": {"start": 120, "end": 148},
 *    "start": {"type": "TimeLiteral", "text": "0s"},
 *    "end": {"type": "TimeLiteral", "text": "5s"},
 *    "call": {"type": "OperationCall", "name": "fadeIn", "args": []}}
 * @endcode
 */
class JsonSyntaxTreeProvider : public SyntaxTreeProvider
{
public:
  explicit JsonSyntaxTreeProvider(nlohmann::json tree) : tree_(std::move(tree)) {}

  /// Parse JSON text. Throws TransformError on malformed JSON.
  [[nodiscard]] static JsonSyntaxTreeProvider from_string(const std::string & text);

  /// Read and parse a file. Throws TransformError if it cannot be read.
  [[nodiscard]] static JsonSyntaxTreeProvider from_file(const std::filesystem::path & path);

  [[nodiscard]] const Program * provide(AstContext & ctx) override;

private:
  nlohmann::json tree_;
};

/**
 * Build a Program from its JSON form. Throws TransformError on unknown node
 * tags or missing required fields.
 */
[[nodiscard]] const Program * program_from_json(const nlohmann::json & tree, AstContext & ctx);

}  // namespace eligian
