// eligian/ast/ast.hpp - Syntax tree node classes for Eligian
//
// Nodes follow the LLVM/Clang style with classof() for RTTI support.
// The tree is produced by an upstream parser and is read-only here.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "eligian/ast/ast_enums.hpp"
#include "eligian/basic/casting.hpp"
#include "eligian/basic/source_manager.hpp"

namespace eligian
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceFile.

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category base to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/// Argument value expression.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Time expression (start/end/duration/delay positions).
class TimeExpr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_time_kind(node->kind); }

protected:
  explicit TimeExpr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Timeline event: timed event, sequence or stagger.
class Event : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_event_kind(node->kind); }

protected:
  explicit Event(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Top-level declaration.
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Value Expressions
// ============================================================================

class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  double value;

  explicit NumberLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Key/value pair of an object literal.
class ObjectProperty : public NodeBase<ObjectProperty, AstNode, NodeKind::ObjectProperty>
{
public:
  std::string_view key;
  Expr * value;

  ObjectProperty(std::string_view k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v)
  {
  }
};

/// Object literal: {opacity: 1, duration: 500}
class ObjectLiteralExpr : public NodeBase<ObjectLiteralExpr, Expr, NodeKind::ObjectLiteral>
{
public:
  gsl::span<ObjectProperty *> properties;

  explicit ObjectLiteralExpr(gsl::span<ObjectProperty *> props = {}, SourceRange r = {})
  : NodeBase(r), properties(props)
  {
  }
};

/// Array literal: ["a", "b"]
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems = {}, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// Runtime property chain: $context.currentItem, $operationdata.foo.bar
class PropertyRefExpr : public NodeBase<PropertyRefExpr, Expr, NodeKind::PropertyRef>
{
public:
  std::string_view scope;  ///< Includes the leading '$'
  gsl::span<std::string_view> properties;

  PropertyRefExpr(std::string_view s, gsl::span<std::string_view> props, SourceRange r = {})
  : NodeBase(r), scope(s), properties(props)
  {
  }
};

/// Bare reference to a parameter of the enclosing action.
class ParamRefExpr : public NodeBase<ParamRefExpr, Expr, NodeKind::ParamRef>
{
public:
  std::string_view name;

  explicit ParamRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

// ============================================================================
// Time Expressions
// ============================================================================

/// Literal time text as written: "500ms", "1.5s".
class TimeLiteral : public NodeBase<TimeLiteral, TimeExpr, NodeKind::TimeLiteral>
{
public:
  std::string_view text;

  explicit TimeLiteral(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// Time relative to the end of the previous event: +2s
class RelativeTime : public NodeBase<RelativeTime, TimeExpr, NodeKind::RelativeTime>
{
public:
  TimeExpr * offset;

  explicit RelativeTime(TimeExpr * o, SourceRange r = {}) : NodeBase(r), offset(o) {}
};

class BinaryTimeExpr : public NodeBase<BinaryTimeExpr, TimeExpr, NodeKind::BinaryTimeExpr>
{
public:
  TimeExpr * lhs;
  TimeOp op;
  TimeExpr * rhs;

  BinaryTimeExpr(TimeExpr * l, TimeOp o, TimeExpr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// Property chain in a time position. Not constant, rejected by lowering.
class TimeRefExpr : public NodeBase<TimeRefExpr, TimeExpr, NodeKind::TimeRef>
{
public:
  std::string_view scope;
  gsl::span<std::string_view> properties;

  TimeRefExpr(std::string_view s, gsl::span<std::string_view> props, SourceRange r = {})
  : NodeBase(r), scope(s), properties(props)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Call argument, positional or keyword (`name: value`).
class Argument : public NodeBase<Argument, AstNode, NodeKind::Argument>
{
public:
  std::optional<std::string_view> name;
  Expr * value;

  explicit Argument(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}

  Argument(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// Call of a built-in operation or of a declared action.
class OperationCall : public NodeBase<OperationCall, AstNode, NodeKind::OperationCall>
{
public:
  std::string_view name;
  gsl::span<Argument *> args;

  explicit OperationCall(std::string_view n, gsl::span<Argument *> a = {}, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// Action parameter: `selector: string`
class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  std::string_view name;
  std::optional<std::string_view> typeName;

  explicit ParamDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// One step of a sequence block: `fadeIn() for 2s`
class SequenceItem : public NodeBase<SequenceItem, AstNode, NodeKind::SequenceItem>
{
public:
  OperationCall * call;
  TimeExpr * duration;

  SequenceItem(OperationCall * c, TimeExpr * d, SourceRange r = {})
  : NodeBase(r), call(c), duration(d)
  {
  }
};

/// Entry of the languages block: `* "en-US" "English"`
class LanguageEntry : public NodeBase<LanguageEntry, AstNode, NodeKind::LanguageEntry>
{
public:
  std::string_view code;
  std::string_view label;
  bool isDefault = false;

  LanguageEntry(std::string_view c, std::string_view l, bool def, SourceRange r = {})
  : NodeBase(r), code(c), label(l), isDefault(def)
  {
  }
};

// ============================================================================
// Timeline Events
// ============================================================================

/**
 * `at T1..T2 call()`, `at T for D call()`, or the inline form
 * `at T1..T2 [start ops] [end ops]`.
 *
 * Exactly one of `end` and `duration` is set. Exactly one of `call` and the
 * inline operation lists is used.
 */
class TimedEvent : public NodeBase<TimedEvent, Event, NodeKind::TimedEvent>
{
public:
  TimeExpr * start;
  TimeExpr * end = nullptr;
  TimeExpr * duration = nullptr;
  OperationCall * call = nullptr;
  gsl::span<OperationCall *> startOps;
  gsl::span<OperationCall *> endOps;

  explicit TimedEvent(TimeExpr * s, SourceRange r = {}) : NodeBase(r), start(s) {}

  [[nodiscard]] bool has_inline_ops() const noexcept { return call == nullptr; }
};

/// `sequence { a() for 2s  b() for 1s }`
class SequenceBlock : public NodeBase<SequenceBlock, Event, NodeKind::SequenceBlock>
{
public:
  gsl::span<SequenceItem *> items;

  explicit SequenceBlock(gsl::span<SequenceItem *> i = {}, SourceRange r = {})
  : NodeBase(r), items(i)
  {
  }
};

/// `stagger 200ms items with fadeIn() for 1s`
class StaggerBlock : public NodeBase<StaggerBlock, Event, NodeKind::StaggerBlock>
{
public:
  TimeExpr * delay;
  Expr * items;
  TimeExpr * duration;
  OperationCall * call = nullptr;
  gsl::span<OperationCall *> startOps;
  gsl::span<OperationCall *> endOps;

  StaggerBlock(TimeExpr * d, Expr * i, TimeExpr * dur, SourceRange r = {})
  : NodeBase(r), delay(d), items(i), duration(dur)
  {
  }

  [[nodiscard]] bool has_inline_ops() const noexcept { return call == nullptr; }
};

// ============================================================================
// Declarations
// ============================================================================

/// `layout "./layout.html"`, `styles "./main.css"`, `labels "./labels.json"`
class DefaultImportDecl : public NodeBase<DefaultImportDecl, Decl, NodeKind::DefaultImport>
{
public:
  ImportCategory category;
  std::string_view path;

  DefaultImportDecl(ImportCategory c, std::string_view p, SourceRange r = {})
  : NodeBase(r), category(c), path(p)
  {
  }
};

/// `import tooltip from "./tooltip.html" as html`
class NamedImportDecl : public NodeBase<NamedImportDecl, Decl, NodeKind::NamedImport>
{
public:
  std::string_view name;
  std::string_view path;
  std::optional<AssetType> assetType;

  NamedImportDecl(std::string_view n, std::string_view p, SourceRange r = {})
  : NodeBase(r), name(n), path(p)
  {
  }
};

/// `action fadeIn(selector) [ ... ]` or `endable action show(selector) [ ... ] [ ... ]`
class ActionDecl : public NodeBase<ActionDecl, Decl, NodeKind::ActionDecl>
{
public:
  std::string_view name;
  bool endable = false;
  gsl::span<ParamDecl *> params;
  gsl::span<OperationCall *> startOps;
  gsl::span<OperationCall *> endOps;

  explicit ActionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `timeline "main" in "#app" using video from "./intro.mp4" { ... }`
class TimelineDecl : public NodeBase<TimelineDecl, Decl, NodeKind::TimelineDecl>
{
public:
  std::string_view name;
  TimelineProvider provider;
  std::string_view container;
  std::optional<std::string_view> source;
  bool loop = false;
  gsl::span<Event *> events;

  TimelineDecl(
    std::string_view n, TimelineProvider p, std::string_view c, SourceRange r = {})
  : NodeBase(r), name(n), provider(p), container(c)
  {
  }
};

/// `languages { * "en-US" "English"  "nl-NL" "Nederlands" }`
class LanguagesDecl : public NodeBase<LanguagesDecl, Decl, NodeKind::LanguagesDecl>
{
public:
  gsl::span<LanguageEntry *> entries;

  explicit LanguagesDecl(gsl::span<LanguageEntry *> e = {}, SourceRange r = {})
  : NodeBase(r), entries(e)
  {
  }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  std::string_view uri;
  gsl::span<Decl *> imports;  ///< DefaultImportDecl / NamedImportDecl in source order
  LanguagesDecl * languages = nullptr;
  gsl::span<ActionDecl *> actions;
  gsl::span<TimelineDecl *> timelines;

  explicit Program(std::string_view u = {}, SourceRange r = {}) : NodeBase(r), uri(u) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace eligian
