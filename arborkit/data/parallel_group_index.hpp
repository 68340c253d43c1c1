#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <exception>
#include <functional>
#include <mutex>
#include <ranges>
#include <thread>
#include <utility>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data/group_index.hpp>
#include <arborkit/data/import.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Controls the data-parallel grouping pass.
   */
  struct Group_index_config {
    /**
     * @brief Number of worker threads. Zero selects
     *  std::thread::hardware_concurrency(); one forces the sequential path.
     *  Larger requests are capped at the hardware concurrency.
     *
     * @details Defaults to one so that children keep their source order
     *  unless a caller opts into parallel grouping.
     */
    size_type n_workers{1};

    /**
     * @brief Smallest partition worth a thread of its own.
     */
    size_type min_records_per_worker{1024};
  };

  /**
   * @brief Worker count for @a n_records under @a cfg.
   *
   * Never more than the hardware concurrency, and never so many that a
   * worker gets less than one grain of records.
   */
  size_type
  resolve_worker_count(Group_index_config const& cfg, size_type n_records);

  struct Spawn_thread {
    template <typename Fn>
    std::thread
    operator()(Fn&& fn) const {
      return std::thread(std::forward<Fn>(fn));
    }
  };

  /**
   * @brief Run @a work(w) for w in [0, n_workers) on threads made by
   *  @a spawn, and join them all.
   *
   * The first exception thrown by any @a work call is rethrown after the
   * join. If @a spawn throws, the threads already started are joined
   * before that exception propagates.
   */
  template <typename Work, typename Spawn = Spawn_thread>
  void
  run_workers(size_type n_workers, Work& work, Spawn spawn = {}) {
    std::exception_ptr error;
    std::mutex error_mutex;

    auto guarded = [&](size_type w) {
      try {
        std::invoke(work, w);
      } catch (...) {
        std::lock_guard<std::mutex> lock{error_mutex};
        if (!error) { error = std::current_exception(); }
      }
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(n_workers));

    auto join_all = [&] {
      for (auto& t : threads) {
        if (t.joinable()) { t.join(); }
      }
    };

    try {
      for (size_type w = 0; w < n_workers; ++w) {
        threads.push_back(std::invoke(spawn, [&guarded, w] { guarded(w); }));
      }
    } catch (...) {
      join_all();
      throw;
    }
    join_all();

    if (error) { std::rethrow_exception(error); }
  }

  /**
   * @brief Data-parallel build of a Group_index.
   *
   * The source is cut into contiguous partitions, one per worker. Each
   * worker indexes its partition into a private Group_index, so no map is
   * shared between threads; the private indices are merged on the calling
   * thread once all workers have joined. Membership of every bucket matches
   * the sequential build; the order within a bucket is not part of the
   * contract.
   *
   * An exception thrown by @a parent_id_fn or @a is_root on any worker is
   * rethrown here after the remaining workers finish.
   */
  template <
    typename Hash = void,
    std::ranges::random_access_range Range,
    typename ParentIdFn,
    typename RootPredicate>
  auto
  build_group_index(
    Range const& source,
    ParentIdFn parent_id_fn,
    RootPredicate is_root,
    Group_index_config const& cfg) {
    using F = record_t<Range>;
    using T = id_result_t<F, ParentIdFn>;
    using index_type = Group_index<T, F, hash_for_t<Hash, T>>;

    auto n = static_cast<size_type>(std::ranges::distance(source));
    auto n_workers = resolve_worker_count(cfg, n);

    if (n_workers <= 1) {
      return build_group_index<Hash>(source, parent_id_fn, is_root);
    }

    auto first = std::ranges::begin(source);
    auto chunk = (n + n_workers - 1) / n_workers;
    std::vector<index_type> partials(static_cast<std::size_t>(n_workers));

    auto work = [&](size_type w) {
      auto begin = w * chunk;
      auto end = std::min(n, begin + chunk);
      auto& local = partials[static_cast<std::size_t>(w)];
      for (auto i = begin; i < end; ++i) {
        auto const& record = first[i];
        if (!std::invoke(is_root, record)) {
          local.append(std::invoke(parent_id_fn, record), record);
        }
      }
    };
    run_workers(n_workers, work);

    index_type index;
    for (auto& partial : partials) {
      index.merge(std::move(partial));
    }
    return index;
  }

} // end of namespace arborkit::data::detail
