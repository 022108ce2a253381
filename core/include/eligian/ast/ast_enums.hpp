// eligian/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators, and the import/timeline attributes carried by
// declarations. Every enum has a to_string() and a parse_*() counterpart
// used by the JSON tree reader.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace eligian
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
#define AST_NODE(Class, Kind, Tag) Kind,
#include "eligian/ast/ast_nodes.def"
};

/// JSON "type" tag of a node kind
[[nodiscard]] constexpr std::string_view node_kind_tag(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Tag) \
  case NodeKind::Kind:             \
    return Tag;
#include "eligian/ast/ast_nodes.def"
  }
  return "";
}

[[nodiscard]] constexpr std::optional<NodeKind> parse_node_kind(std::string_view tag) noexcept
{
#define AST_NODE(Class, Kind, Tag) \
  if (tag == Tag) return NodeKind::Kind;
#include "eligian/ast/ast_nodes.def"
  return std::nullopt;
}

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators over argument values. Constant operands are folded
 * during lowering.
 */
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< **
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

/// Operators allowed between time expressions.
enum class TimeOp : uint8_t { Add, Sub, Mul, Div };

// ============================================================================
// Declaration attributes
// ============================================================================

/**
 * Keyword of a default import: `layout "./layout.html"`.
 */
enum class ImportCategory : uint8_t { Layout, Styles, Provider, Labels, Locales };

/// Asset type of a named import, explicit (`as css`) or inferred from the extension.
enum class AssetType : uint8_t { Html, Css, Media };

/// Timeline provider: `timeline "main" in "#app" using video from "./v.mp4"`.
enum class TimelineProvider : uint8_t { Video, Audio, Raf, Custom };

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(TimeOp op) noexcept
{
  switch (op) {
    case TimeOp::Add:
      return "+";
    case TimeOp::Sub:
      return "-";
    case TimeOp::Mul:
      return "*";
    case TimeOp::Div:
      return "/";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ImportCategory category) noexcept
{
  switch (category) {
    case ImportCategory::Layout:
      return "layout";
    case ImportCategory::Styles:
      return "styles";
    case ImportCategory::Provider:
      return "provider";
    case ImportCategory::Labels:
      return "labels";
    case ImportCategory::Locales:
      return "locales";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssetType type) noexcept
{
  switch (type) {
    case AssetType::Html:
      return "html";
    case AssetType::Css:
      return "css";
    case AssetType::Media:
      return "media";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(TimelineProvider provider) noexcept
{
  switch (provider) {
    case TimelineProvider::Video:
      return "video";
    case TimelineProvider::Audio:
      return "audio";
    case TimelineProvider::Raf:
      return "raf";
    case TimelineProvider::Custom:
      return "custom";
  }
  return "";
}

// ============================================================================
// Parsing helpers (inverse of to_string)
// ============================================================================

[[nodiscard]] constexpr std::optional<BinaryOp> parse_binary_op(std::string_view s) noexcept
{
  constexpr BinaryOp k_all[] = {
    BinaryOp::Add, BinaryOp::Sub, BinaryOp::Mul, BinaryOp::Div, BinaryOp::Mod,
    BinaryOp::Pow, BinaryOp::Eq,  BinaryOp::Ne,  BinaryOp::Lt,  BinaryOp::Le,
    BinaryOp::Gt,  BinaryOp::Ge,  BinaryOp::And, BinaryOp::Or};
  for (const auto op : k_all) {
    if (to_string(op) == s) return op;
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<UnaryOp> parse_unary_op(std::string_view s) noexcept
{
  if (s == "!") return UnaryOp::Not;
  if (s == "-") return UnaryOp::Neg;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<TimeOp> parse_time_op(std::string_view s) noexcept
{
  if (s == "+") return TimeOp::Add;
  if (s == "-") return TimeOp::Sub;
  if (s == "*") return TimeOp::Mul;
  if (s == "/") return TimeOp::Div;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<ImportCategory> parse_import_category(
  std::string_view s) noexcept
{
  if (s == "layout") return ImportCategory::Layout;
  if (s == "styles") return ImportCategory::Styles;
  if (s == "provider") return ImportCategory::Provider;
  if (s == "labels") return ImportCategory::Labels;
  if (s == "locales") return ImportCategory::Locales;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<AssetType> parse_asset_type(std::string_view s) noexcept
{
  if (s == "html") return AssetType::Html;
  if (s == "css") return AssetType::Css;
  if (s == "media") return AssetType::Media;
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<TimelineProvider> parse_timeline_provider(
  std::string_view s) noexcept
{
  if (s == "video") return TimelineProvider::Video;
  if (s == "audio") return TimelineProvider::Audio;
  if (s == "raf") return TimelineProvider::Raf;
  if (s == "custom") return TimelineProvider::Custom;
  return std::nullopt;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::StringLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::UnaryExpr;

inline constexpr NodeKind k_first_time_kind = NodeKind::TimeLiteral;
inline constexpr NodeKind k_last_time_kind = NodeKind::TimeRef;

inline constexpr NodeKind k_first_event_kind = NodeKind::TimedEvent;
inline constexpr NodeKind k_last_event_kind = NodeKind::StaggerBlock;

inline constexpr NodeKind k_first_decl_kind = NodeKind::DefaultImport;
inline constexpr NodeKind k_last_decl_kind = NodeKind::LanguagesDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_time_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_time_kind && kind <= detail::k_last_time_kind;
}

[[nodiscard]] constexpr bool is_event_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_event_kind && kind <= detail::k_last_event_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace eligian
