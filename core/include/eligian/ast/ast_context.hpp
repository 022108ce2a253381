// eligian/ast/ast_context.hpp - AST arena allocator and string pool
//
// Owns every node and string of one syntax tree. Backed by
// std::pmr::monotonic_buffer_resource: nothing is freed individually,
// everything goes away with the context.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace eligian
{

class AstNode;

/**
 * Arena for one syntax tree.
 *
 * Nodes must be trivially destructible, so they hold std::string_view and
 * gsl::span into this arena rather than owning containers.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * t = ctx.create<TimeLiteral>(ctx.intern("500ms"));
 *   auto ops = ctx.copy_to_arena(std::vector<OperationCall *>{call});
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB). Eligian documents are small.
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  // PMR resources are not movable
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer, valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Copy a string into the arena once and return a stable view of it.
   * Interning the same text twice returns the same pointer.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /// Value-initialized array of `size` elements (nullptr for pointer types)
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a builder vector into the arena
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace eligian
