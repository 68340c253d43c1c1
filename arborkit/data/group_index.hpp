#pragma once

//
// ... Standard header files
//
#include <functional>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/import.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Children of each parent id, in the order they were appended.
   *
   * Only non-root records are ever indexed. A parent id without a bucket
   * has no children; children_of() answers an empty sequence for it.
   *
   * @tparam T     Id type: equality comparable and hashable by @a Hash.
   * @tparam F     Record handle type (pointer, shared_ptr, index, ...).
   * @tparam Hash  Hash functor for @a T.
   */
  template <typename T, typename F, typename Hash = std::hash<T>>
  class Group_index final {
  public:
    using id_type = T;
    using value_type = F;
    using bucket_type = std::vector<F>;
    using map_type = std::unordered_map<T, bucket_type, Hash>;
    using const_iterator = typename map_type::const_iterator;

    void
    append(T const& parent_id, F const& record) {
      buckets_[parent_id].push_back(record);
      ++n_records_;
    }

    bucket_type const&
    children_of(T const& id) const {
      auto it = buckets_.find(id);
      return it == buckets_.end() ? empty_bucket() : it->second;
    }

    bool
    contains(T const& id) const {
      return buckets_.find(id) != buckets_.end();
    }

    // Number of distinct parent ids.
    size_type
    size() const {
      return static_cast<size_type>(buckets_.size());
    }

    // Number of indexed records.
    size_type
    count() const {
      return n_records_;
    }

    bool
    empty() const {
      return buckets_.empty();
    }

    /**
     * @brief Append every bucket of @a other after the matching bucket of
     *  this index.
     */
    void
    merge(Group_index&& other) {
      for (auto& [id, bucket] : other.buckets_) {
        auto& target = buckets_[id];
        if (target.empty()) {
          target = std::move(bucket);
        } else {
          target.insert(
            target.end(),
            std::make_move_iterator(bucket.begin()),
            std::make_move_iterator(bucket.end()));
        }
      }
      n_records_ += other.n_records_;
      other.buckets_.clear();
      other.n_records_ = 0;
    }

    const_iterator
    begin() const {
      return buckets_.begin();
    }

    const_iterator
    end() const {
      return buckets_.end();
    }

  private:
    static bucket_type const&
    empty_bucket() {
      static bucket_type const empty{};
      return empty;
    }

    map_type buckets_{};
    size_type n_records_{};

  }; // end of class Group_index

  /**
   * @brief Roots and grouped non-roots of a flat collection.
   */
  template <typename T, typename F, typename Hash = std::hash<T>>
  struct Forest_split {
    std::vector<F> roots;
    Group_index<T, F, Hash> index;
  };

  template <typename F, typename ParentIdFn>
  using id_result_t =
    std::decay_t<std::invoke_result_t<ParentIdFn&, F const&>>;

  template <typename Range>
  using record_t = std::ranges::range_value_t<Range>;

  // Hash functor for id type T; void selects std::hash<T>.
  template <typename Hash, typename T>
  using hash_for_t =
    std::conditional_t<std::is_void_v<Hash>, std::hash<T>, Hash>;

  /**
   * @brief Single sequential pass over [first, last): roots are collected
   *  in order, every other record is appended under its parent id.
   *
   * Works on single-pass input iterators, so lazily produced sequences
   * are consumed exactly once. Ids without a std::hash specialization
   * need an explicit @a Hash, e.g. `split_forest<Pair_hash>(...)`.
   */
  template <
    typename Hash = void,
    typename Iter,
    typename Sentinel,
    typename ParentIdFn,
    typename RootPredicate>
  auto
  split_forest(
    Iter first,
    Sentinel last,
    ParentIdFn parent_id_fn,
    RootPredicate is_root) {
    using F = std::iter_value_t<Iter>;
    using T = id_result_t<F, ParentIdFn>;

    Forest_split<T, F, hash_for_t<Hash, T>> split;
    for (; first != last; ++first) {
      F record = *first;
      if (std::invoke(is_root, record)) {
        split.roots.push_back(std::move(record));
      } else {
        split.index.append(std::invoke(parent_id_fn, record), record);
      }
    }
    return split;
  }

  /**
   * @brief Index every non-root record of @a source under its parent id,
   *  preserving source order within each bucket.
   */
  template <
    typename Hash = void,
    std::ranges::input_range Range,
    typename ParentIdFn,
    typename RootPredicate>
  auto
  build_group_index(
    Range const& source,
    ParentIdFn parent_id_fn,
    RootPredicate is_root) {
    using F = record_t<Range>;
    using T = id_result_t<F, ParentIdFn>;

    Group_index<T, F, hash_for_t<Hash, T>> index;
    for (auto const& record : source) {
      if (!std::invoke(is_root, record)) {
        index.append(std::invoke(parent_id_fn, record), record);
      }
    }
    return index;
  }

  template <std::ranges::input_range Range, typename RootPredicate>
  std::vector<record_t<Range>>
  select_roots(Range const& source, RootPredicate is_root) {
    std::vector<record_t<Range>> roots;
    for (auto const& record : source) {
      if (std::invoke(is_root, record)) { roots.push_back(record); }
    }
    return roots;
  }

} // end of namespace arborkit::data::detail
