#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <ranges>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/import.hpp>
#include <arborkit/data/tree_walker.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Structural summary of an assembled forest.
   */
  struct Tree_info {
    size_type n_roots{};
    size_type n_nodes{};
    size_type n_leaves{};

    // Number of levels; 0 for an empty forest.
    size_type height{};

    friend bool
    operator==(Tree_info const& a, Tree_info const& b);
  };

  void
  to_json(json& j, Tree_info const& info);

  void
  from_json(json const& j, Tree_info& info);

  template <std::ranges::input_range Range, typename ChildrenFn>
  Tree_info
  tree_info(Range const& roots, ChildrenFn children_fn) {
    using F = std::ranges::range_value_t<Range>;

    Tree_info info;
    // A leaf's post-visit comes straight after its own pre-visit.
    bool fresh = false;

    walk(
      roots,
      children_fn,
      [&](size_type depth, F const&) {
        ++info.n_nodes;
        if (depth == 0) { ++info.n_roots; }
        info.height = std::max(info.height, depth + 1);
        fresh = true;
      },
      [&](size_type, F const&) {
        if (fresh) { ++info.n_leaves; }
        fresh = false;
      });

    return info;
  }

} // end of namespace arborkit::data::detail
