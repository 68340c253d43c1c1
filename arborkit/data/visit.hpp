#pragma once

//
// ... Standard header files
//
#include <functional>
#include <type_traits>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/import.hpp>

namespace arborkit::data::detail {

  // Placeholder for an omitted visitor; its calls compile away.
  struct No_visit {
    template <typename... Args>
    void
    operator()(Args&&...) const {}
  };

  /**
   * @brief Call a visitor with `(depth, node)` when it accepts that,
   *  otherwise with `(node)`.
   */
  template <typename Visitor, typename F>
  void
  invoke_visitor(Visitor& visitor, size_type depth, F const& node) {
    if constexpr (std::is_same_v<Visitor, No_visit>) {
      return;
    } else if constexpr (std::is_invocable_v<Visitor&, size_type, F const&>) {
      std::invoke(visitor, depth, node);
    } else {
      std::invoke(visitor, node);
    }
  }

  /**
   * @brief Copy the children of @a node into a vector of handles.
   *
   * @a children_fn may answer a range of F or a pointer to one; a null
   * pointer means the node has no children list at all and yields an
   * empty result.
   */
  template <typename F, typename ChildrenFn>
  std::vector<F>
  collect_children(ChildrenFn& children_fn, F const& node) {
    decltype(auto) children = std::invoke(children_fn, node);
    using result_type = std::remove_cvref_t<decltype(children)>;

    std::vector<F> result;
    if constexpr (std::is_pointer_v<result_type>) {
      if (children == nullptr) { return result; }
      for (auto const& child : *children) {
        result.push_back(child);
      }
    } else {
      for (auto const& child : children) {
        result.push_back(child);
      }
    }
    return result;
  }

} // end of namespace arborkit::data::detail
