#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <ranges>
#include <utility>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/import.hpp>
#include <arborkit/data/visit.hpp>

namespace arborkit::data::detail {

  template <typename F>
  struct Walk_frame {
    std::vector<F> siblings;
    std::size_t next;
  };

  /**
   * @brief Depth-first walk over a forest.
   *
   * For each node, in sibling order: @a pre_visit(node), then the walk of
   * @a children_fn(node), then @a post_visit(node). A node's pre-visit
   * precedes every visit of its subtree and its post-visit follows them.
   * Either visitor may be omitted, and either may take `(depth, node)`
   * instead of `(node)`; roots are at depth 0.
   *
   * The recursion is carried on an explicit stack, so the depth of the
   * forest is bounded by memory rather than by the call stack.
   *
   * @tparam Range       Input range of record handles.
   * @tparam ChildrenFn  Callable: F -> range of F, or pointer to one
   *                     (null means no children).
   */
  template <
    std::ranges::input_range Range,
    typename ChildrenFn,
    typename PreVisit = No_visit,
    typename PostVisit = No_visit>
  void
  walk(
    Range const& nodes,
    ChildrenFn children_fn,
    PreVisit pre_visit = {},
    PostVisit post_visit = {}) {
    using F = std::ranges::range_value_t<Range>;

    std::vector<F> roots;
    for (auto const& node : nodes) {
      roots.push_back(node);
    }
    if (roots.empty()) { return; }

    std::vector<Walk_frame<F>> stack;
    stack.push_back(Walk_frame<F>{std::move(roots), 0});

    while (!stack.empty()) {
      auto depth = static_cast<size_type>(stack.size()) - 1;
      auto& top = stack.back();

      if (top.next == top.siblings.size()) {
        stack.pop_back();
        if (!stack.empty()) {
          auto const& parent = stack.back();
          invoke_visitor(post_visit, depth - 1, parent.siblings[parent.next - 1]);
        }
        continue;
      }

      auto const& node = top.siblings[top.next++];
      invoke_visitor(pre_visit, depth, node);

      auto children = collect_children<F>(children_fn, node);
      if (children.empty()) {
        invoke_visitor(post_visit, depth, node);
      } else {
        // top and node are invalidated by the push below.
        stack.push_back(Walk_frame<F>{std::move(children), 0});
      }
    }
  }

} // end of namespace arborkit::data::detail
