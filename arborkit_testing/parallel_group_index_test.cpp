//
// ... Test header files
//
#include <gtest/gtest.h>

//
// ... Standard header files
//
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/data/group_index.hpp>
#include <arborkit/data/parallel_group_index.hpp>

//
// ... Test helpers
//
#include "org_chart.hpp"

namespace arborkit::testing {

  using arborkit::data::detail::Group_index_config;
  using arborkit::data::detail::build_group_index;
  using arborkit::data::detail::resolve_worker_count;
  using arborkit::data::detail::run_workers;

  config::size_type
  hardware_workers() {
    return static_cast<config::size_type>(
      std::max(1u, std::thread::hardware_concurrency()));
  }

  // -- Worker count --

  TEST(parallel_group_index, worker_count_single)
  {
    EXPECT_EQ(resolve_worker_count(Group_index_config{1, 1}, 100000), 1);
  }

  TEST(parallel_group_index, default_config_is_sequential)
  {
    EXPECT_EQ(resolve_worker_count(Group_index_config{}, 1000000), 1);
  }

  TEST(parallel_group_index, worker_count_limited_by_grain)
  {
    EXPECT_EQ(
      resolve_worker_count(Group_index_config{8, 100}, 250),
      std::min<config::size_type>(2, hardware_workers()));
    EXPECT_EQ(resolve_worker_count(Group_index_config{8, 100}, 50), 1);
    EXPECT_EQ(resolve_worker_count(Group_index_config{8, 100}, 0), 1);
  }

  TEST(parallel_group_index, worker_count_hardware)
  {
    EXPECT_EQ(
      resolve_worker_count(Group_index_config{0, 1}, 1000000),
      hardware_workers());
  }

  TEST(parallel_group_index, worker_count_capped_at_hardware)
  {
    EXPECT_EQ(
      resolve_worker_count(Group_index_config{5000, 1}, 1000000),
      hardware_workers());
  }

  TEST(parallel_group_index, worker_count_rejects_bad_config)
  {
    EXPECT_THROW(
      resolve_worker_count(Group_index_config{-1, 1}, 10), std::invalid_argument);
    EXPECT_THROW(
      resolve_worker_count(Group_index_config{2, 0}, 10), std::invalid_argument);
  }

  // -- Worker pool --

  TEST(parallel_group_index, run_workers_runs_every_index)
  {
    std::vector<int> hits(6, 0);
    auto work = [&](config::size_type w) { ++hits[static_cast<std::size_t>(w)]; };

    run_workers(6, work);

    EXPECT_EQ(hits, (std::vector<int>(6, 1)));
  }

  TEST(parallel_group_index, failed_spawn_joins_started_workers)
  {
    std::atomic<int> finished{0};
    auto work = [&](config::size_type) { ++finished; };

    int spawned = 0;
    auto spawn = [&spawned](auto&& fn) {
      if (++spawned == 3) {
        throw std::system_error(
          std::make_error_code(std::errc::resource_unavailable_try_again));
      }
      return std::thread(std::forward<decltype(fn)>(fn));
    };

    EXPECT_THROW(run_workers(4, work, spawn), std::system_error);
    EXPECT_EQ(spawned, 3);
    EXPECT_EQ(finished.load(), 2);
  }

  TEST(parallel_group_index, worker_exception_is_rethrown_after_join)
  {
    std::atomic<int> finished{0};
    auto work = [&](config::size_type w) {
      if (w == 1) { throw std::runtime_error("worker failed"); }
      ++finished;
    };

    EXPECT_THROW(run_workers(4, work), std::runtime_error);
    EXPECT_EQ(finished.load(), 3);
  }

  // -- Parallel build --

  TEST(parallel_group_index, matches_sequential_membership)
  {
    auto chart = Org_chart::balanced(20000, 5);

    auto sequential = build_group_index(chart.rows(), pid_of, is_top);
    auto parallel =
      build_group_index(chart.rows(), pid_of, is_top, Group_index_config{4, 16});

    ASSERT_EQ(parallel.size(), sequential.size());
    ASSERT_EQ(parallel.count(), sequential.count());
    for (auto const& [parent_id, bucket] : sequential) {
      EXPECT_EQ(sorted_ids(parallel.children_of(parent_id)), sorted_ids(bucket));
    }
  }

  TEST(parallel_group_index, roots_are_excluded)
  {
    auto chart = Org_chart::balanced(1000, 3);

    auto index =
      build_group_index(chart.rows(), pid_of, is_top, Group_index_config{4, 10});

    EXPECT_EQ(index.count(), 999);
    EXPECT_FALSE(index.contains(0));
  }

  TEST(parallel_group_index, small_source_runs_sequentially)
  {
    Org_chart chart{{1, 0}, {4, 1}, {2, 1}, {3, 1}};

    auto index =
      build_group_index(chart.rows(), pid_of, is_top, Group_index_config{8, 1024});

    EXPECT_EQ(ids(index.children_of(1)), (std::vector<int>{4, 2, 3}));
  }

  TEST(parallel_group_index, empty_source)
  {
    std::vector<Record*> rows;
    auto index = build_group_index(rows, pid_of, is_top, Group_index_config{4, 1});

    EXPECT_TRUE(index.empty());
  }

  TEST(parallel_group_index, accessor_exception_reaches_caller)
  {
    auto chart = Org_chart::balanced(4000, 2);

    auto throwing_pid = [](Record const* r) {
      if (r->id == 3999) { throw std::runtime_error("bad row"); }
      return r->pid;
    };

    EXPECT_THROW(
      build_group_index(chart.rows(), throwing_pid, is_top, Group_index_config{4, 1}),
      std::runtime_error);
  }

  TEST(parallel_group_index, pair_ids_with_custom_hash)
  {
    std::vector<Cell> cells;
    cells.push_back(Cell{{0, 1}, {0, 0}});
    for (int i = 2; i <= 3000; ++i) {
      cells.push_back(Cell{{i % 7, i}, {0, 1}});
    }
    auto rows = handles(cells);

    auto index = build_group_index<Cell_key_hash>(
      rows, cell_pid, cell_is_top, Group_index_config{4, 100});

    EXPECT_EQ(index.size(), 1);
    EXPECT_EQ(index.count(), 2999);
    EXPECT_TRUE(index.contains(Cell_key{0, 1}));
    EXPECT_FALSE(index.contains(Cell_key{0, 0}));
  }

} // end of namespace arborkit::testing
