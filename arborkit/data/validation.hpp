#pragma once

//
// ... Standard header files
//
#include <cstddef>
#include <functional>
#include <ranges>
#include <string>
#include <unordered_map>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/errors.hpp>
#include <arborkit/data/group_index.hpp>
#include <arborkit/data/import.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Findings of strict validation over a flat collection.
   */
  template <typename T, typename F>
  struct Forest_report {
    /** Ids carried by more than one record, each listed once. */
    std::vector<T> duplicate_ids{};

    /** Non-root records that assembly would never attach. */
    std::vector<F> unreachable{};

    /** True when a parent-id chain reachable from a root loops. */
    bool has_cycle{};

    bool
    is_valid() const {
      return duplicate_ids.empty() && unreachable.empty() && !has_cycle;
    }
  };

  /**
   * @brief Ids occurring more than once in @a source, in order of their
   *  first repetition.
   */
  template <typename Hash = void, std::ranges::input_range Range, typename IdFn>
  auto
  find_duplicate_ids(Range const& source, IdFn id_fn) {
    using T = id_result_t<record_t<Range>, IdFn>;

    std::unordered_map<T, size_type, hash_for_t<Hash, T>> seen;
    std::vector<T> duplicates;
    for (auto const& record : source) {
      auto id = std::invoke(id_fn, record);
      if (++seen[id] == 2) { duplicates.push_back(std::move(id)); }
    }
    return duplicates;
  }

  /**
   * @brief Validate an already split forest.
   *
   * Reachability and cycles are decided on the id graph: an edge runs from
   * id @c u to the id of every record in the bucket of @c u. Assembly
   * expands exactly the ids reachable from the roots, so it terminates iff
   * that part of the graph is acyclic, and a bucket whose parent id is
   * never reached is never attached.
   */
  template <typename T, typename F, typename Hash, typename IdFn>
  Forest_report<T, F>
  check_forest(Forest_split<T, F, Hash> const& split, IdFn id_fn) {
    Forest_report<T, F> report;

    std::vector<F> records(split.roots.begin(), split.roots.end());
    for (auto const& [parent_id, bucket] : split.index) {
      records.insert(records.end(), bucket.begin(), bucket.end());
    }
    report.duplicate_ids =
      find_duplicate_ids<Hash>(records, id_fn);

    // 1 = on the current path, 2 = finished
    std::unordered_map<T, char, Hash> state;

    struct Frame {
      T id;
      std::size_t next;
    };
    std::vector<Frame> stack;

    for (auto const& root : split.roots) {
      T root_id = std::invoke(id_fn, root);
      if (state.count(root_id) != 0) { continue; }

      state[root_id] = 1;
      stack.push_back(Frame{root_id, 0});

      while (!stack.empty() && !report.has_cycle) {
        auto& top = stack.back();
        auto const& bucket = split.index.children_of(top.id);

        if (top.next == bucket.size()) {
          state[top.id] = 2;
          stack.pop_back();
          continue;
        }

        T child_id = std::invoke(id_fn, bucket[top.next++]);
        auto it = state.find(child_id);
        if (it == state.end()) {
          state.emplace(child_id, 1);
          stack.push_back(Frame{std::move(child_id), 0});
        } else if (it->second == 1) {
          report.has_cycle = true;
        }
      }

      if (report.has_cycle) { break; }
    }

    if (!report.has_cycle) {
      for (auto const& [parent_id, bucket] : split.index) {
        if (state.count(parent_id) == 0) {
          report.unreachable.insert(
            report.unreachable.end(), bucket.begin(), bucket.end());
        }
      }
    }

    return report;
  }

  template <
    typename Hash = void,
    std::ranges::input_range Range,
    typename IdFn,
    typename ParentIdFn,
    typename RootPredicate>
  auto
  check_forest(
    Range const& source,
    IdFn id_fn,
    ParentIdFn parent_id_fn,
    RootPredicate is_root) {
    auto split = split_forest<Hash>(
      std::ranges::begin(source),
      std::ranges::end(source),
      parent_id_fn,
      is_root);
    return check_forest(split, id_fn);
  }

  template <typename T, typename F>
  void
  throw_if_invalid(Forest_report<T, F> const& report) {
    if (report.has_cycle) {
      throw Cycle_detected("parent-id chain reachable from a root is cyclic");
    }
    if (!report.is_valid()) {
      auto n_duplicates = static_cast<size_type>(report.duplicate_ids.size());
      auto n_unreachable = static_cast<size_type>(report.unreachable.size());
      throw Invalid_forest(
        "invalid forest: " + std::to_string(n_duplicates) +
          " duplicate id(s), " + std::to_string(n_unreachable) +
          " unreachable record(s)",
        n_duplicates,
        n_unreachable);
    }
  }

  /**
   * @brief Throw Cycle_detected or Invalid_forest unless @a source forms
   *  a well-formed forest under the given accessors.
   */
  template <
    typename Hash = void,
    std::ranges::input_range Range,
    typename IdFn,
    typename ParentIdFn,
    typename RootPredicate>
  void
  validate_forest(
    Range const& source,
    IdFn id_fn,
    ParentIdFn parent_id_fn,
    RootPredicate is_root) {
    throw_if_invalid(check_forest<Hash>(source, id_fn, parent_id_fn, is_root));
  }

} // end of namespace arborkit::data::detail
