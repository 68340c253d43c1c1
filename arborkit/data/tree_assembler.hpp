#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/errors.hpp>
#include <arborkit/data/group_index.hpp>
#include <arborkit/data/import.hpp>
#include <arborkit/data/parallel_group_index.hpp>
#include <arborkit/data/validation.hpp>
#include <arborkit/data/visit.hpp>

namespace arborkit::data::detail {

  struct Assembly_config {
    /**
     * @brief Deepest level a node may be attached at; roots are level 0.
     *
     * @details Zero leaves assembly unguarded, and a cyclic parent-id chain
     *  then never terminates. A positive value turns such a chain into a
     *  Cycle_detected exception once it passes this depth. Nodes visited
     *  before the throw keep the children already attached to them; use
     *  Tree_config::strict to reject a cycle before anything is attached.
     */
    size_type max_depth{0};
  };

  struct Tree_config {
    Group_index_config grouping{};
    Assembly_config assembly{};

    /**
     * @brief Validate the source first and throw on duplicate ids,
     *  unreachable records or cycles.
     */
    bool strict{false};
  };

  template <typename F>
  struct Assembly_frame {
    std::vector<F> const* siblings;
    std::size_t next;
  };

  /**
   * @brief Attach to every node reachable from @a roots its bucket in
   *  @a index.
   *
   * @a attach_children is called exactly once per visited node, with an
   * empty sequence when the node's id has no bucket, before any of that
   * node's children are visited. @a on_visit, when supplied, is called
   * with `(depth, node)` after the node's whole subtree has been attached.
   *
   * @return @a roots
   */
  template <
    typename T,
    typename F,
    typename Hash,
    typename IdFn,
    typename AttachFn,
    typename OnVisit = No_visit>
  std::vector<F>&
  assemble(
    std::vector<F>& roots,
    Group_index<T, F, Hash> const& index,
    IdFn id_fn,
    AttachFn attach_children,
    OnVisit on_visit = {},
    Assembly_config const& cfg = {}) {
    if (cfg.max_depth < 0) {
      throw invalid_argument("Assembly_config::max_depth must be >= 0");
    }
    if (roots.empty()) { return roots; }

    // Sibling vectors live in roots and in index, neither of which
    // changes during assembly, so frames can point at them.
    std::vector<Assembly_frame<F>> stack;
    stack.push_back(Assembly_frame<F>{&roots, 0});

    while (!stack.empty()) {
      auto depth = static_cast<size_type>(stack.size()) - 1;
      auto& top = stack.back();

      if (top.next == top.siblings->size()) {
        stack.pop_back();
        if (!stack.empty()) {
          auto const& parent = stack.back();
          invoke_visitor(
            on_visit, depth - 1, (*parent.siblings)[parent.next - 1]);
        }
        continue;
      }

      if (cfg.max_depth > 0 && depth > cfg.max_depth) {
        throw Cycle_detected::at_depth(depth, cfg.max_depth);
      }

      auto const& current = (*top.siblings)[top.next++];
      auto const& bucket = index.children_of(std::invoke(id_fn, current));
      std::invoke(attach_children, current, bucket);

      if (bucket.empty()) {
        invoke_visitor(on_visit, depth, current);
      } else {
        stack.push_back(Assembly_frame<F>{&bucket, 0});
      }
    }

    return roots;
  }

  /**
   * @brief Assemble a forest from a materialized flat collection.
   *
   * Roots are the records satisfying @a is_root, in source order; all
   * others are grouped by @a parent_id_fn, in parallel when
   * Tree_config::grouping asks for more than one worker. @a Hash hashes
   * the id type; void selects std::hash.
   */
  template <
    typename Hash = void,
    std::ranges::random_access_range Range,
    typename AttachFn,
    typename IdFn,
    typename ParentIdFn,
    typename RootPredicate,
    typename OnVisit = No_visit>
  std::vector<record_t<Range>>
  tree_from_list(
    Range const& source,
    AttachFn attach_children,
    IdFn id_fn,
    ParentIdFn parent_id_fn,
    RootPredicate is_root,
    OnVisit on_visit = {},
    Tree_config const& cfg = {}) {
    if (cfg.strict) {
      validate_forest<Hash>(source, id_fn, parent_id_fn, is_root);
    }

    auto roots = select_roots(source, is_root);
    if (roots.empty()) { return roots; }

    auto index =
      build_group_index<Hash>(source, parent_id_fn, is_root, cfg.grouping);
    assemble(roots, index, id_fn, attach_children, on_visit, cfg.assembly);
    return roots;
  }

  /**
   * @brief Assemble a forest from a single-pass input range.
   *
   * [first, last) is consumed once, sequentially, so children keep their
   * source order. Tree_config::grouping is ignored.
   */
  template <
    typename Hash = void,
    typename Iter,
    typename Sentinel,
    typename AttachFn,
    typename IdFn,
    typename ParentIdFn,
    typename RootPredicate,
    typename OnVisit = No_visit>
  auto
  tree_from_stream(
    Iter first,
    Sentinel last,
    AttachFn attach_children,
    IdFn id_fn,
    ParentIdFn parent_id_fn,
    RootPredicate is_root,
    OnVisit on_visit = {},
    Tree_config const& cfg = {}) {
    auto split = split_forest<Hash>(first, last, parent_id_fn, is_root);
    if (cfg.strict) { throw_if_invalid(check_forest(split, id_fn)); }

    assemble(
      split.roots, split.index, id_fn, attach_children, on_visit, cfg.assembly);
    return std::move(split.roots);
  }

} // end of namespace arborkit::data::detail
