// eligian/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any hierarchy that exposes a static `classof` predicate.
// The syntax tree (eligian/ast/ast.hpp) is the main user.
//
// Usage:
//   if (isa<TimedEvent>(event)) { ... }
//   auto * seq = cast<SequenceBlock>(event);        // asserts on mismatch
//   if (auto * st = dyn_cast<StaggerBlock>(event))  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace eligian
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/**
 * Check whether `node` is a T. A null node is never a T.
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/**
 * Checked downcast. The caller guarantees the kind, typically after
 * switching on NodeKind.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of a different kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of a different kind");
  return static_cast<const T *>(node);
}

/**
 * Downcast returning nullptr when `node` is null or not a T.
 */
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace eligian
