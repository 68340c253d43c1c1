#pragma once

//
// ... Standard header files
//
#include <functional>
#include <ranges>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/data/tree_walker.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Append, in pre-order, every node of the forest for which
   *  @a include_if holds.
   *
   * Excluding a node does not prune its subtree: its descendants are
   * tested on their own.
   */
  template <
    std::ranges::input_range Range,
    typename ChildrenFn,
    typename IncludeIf,
    typename F = std::ranges::range_value_t<Range>>
  void
  flatten_into(
    Range const& roots,
    ChildrenFn children_fn,
    IncludeIf include_if,
    std::vector<F>& target) {
    walk(roots, children_fn, [&](F const& node) {
      if (std::invoke(include_if, node)) { target.push_back(node); }
    });
  }

  template <
    std::ranges::input_range Range,
    typename ChildrenFn,
    typename IncludeIf,
    typename F = std::ranges::range_value_t<Range>>
  std::vector<F>
  flatten(Range const& roots, ChildrenFn children_fn, IncludeIf include_if) {
    std::vector<F> target;
    flatten_into(roots, children_fn, include_if, target);
    return target;
  }

} // end of namespace arborkit::data::detail
