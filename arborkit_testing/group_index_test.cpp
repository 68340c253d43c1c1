//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <ranges>
#include <vector>

//
// ... arborkit header files
//
#include <arborkit/data/group_index.hpp>

//
// ... Test helpers
//
#include "org_chart.hpp"

namespace arborkit::testing {

  using arborkit::data::detail::Group_index;
  using arborkit::data::detail::build_group_index;
  using arborkit::data::detail::select_roots;
  using arborkit::data::detail::split_forest;

  TEST_CASE("group index - buckets non-roots by parent id", "[group_index]")
  {
    Org_chart chart{{1, 0}, {2, 1}, {3, 1}, {4, 2}};
    auto index = build_group_index(chart.rows(), pid_of, is_top);

    CHECK(index.size() == 2);
    CHECK(index.count() == 3);
    CHECK(ids(index.children_of(1)) == std::vector<int>{2, 3});
    CHECK(ids(index.children_of(2)) == std::vector<int>{4});
  }

  TEST_CASE("group index - roots are never indexed", "[group_index]")
  {
    // Row 5 names parent 1 but the root predicate claims it.
    Org_chart chart{{1, 0}, {5, 1}, {2, 1}};
    auto index = build_group_index(
      chart.rows(), pid_of, [](Record const* r) { return r->id == 1 || r->id == 5; });

    CHECK(index.count() == 1);
    CHECK(ids(index.children_of(1)) == std::vector<int>{2});
  }

  TEST_CASE("group index - absent id answers an empty bucket", "[group_index]")
  {
    Org_chart chart{{1, 0}, {2, 1}};
    auto index = build_group_index(chart.rows(), pid_of, is_top);

    CHECK_FALSE(index.contains(2));
    CHECK(index.children_of(2).empty());
    CHECK(index.children_of(42).empty());
  }

  TEST_CASE("group index - empty source", "[group_index]")
  {
    std::vector<Record*> rows;
    auto index = build_group_index(rows, pid_of, is_top);

    CHECK(index.empty());
    CHECK(index.size() == 0);
    CHECK(index.count() == 0);
  }

  TEST_CASE("group index - merge appends after existing buckets", "[group_index]")
  {
    Org_chart chart{{2, 1}, {3, 1}, {4, 2}, {5, 1}};

    Group_index<int, Record*> a;
    a.append(1, chart[0]);
    a.append(1, chart[1]);

    Group_index<int, Record*> b;
    b.append(2, chart[2]);
    b.append(1, chart[3]);

    a.merge(std::move(b));

    CHECK(a.count() == 4);
    CHECK(a.size() == 2);
    CHECK(ids(a.children_of(1)) == std::vector<int>{2, 3, 5});
    CHECK(ids(a.children_of(2)) == std::vector<int>{4});
    CHECK(b.empty());
    CHECK(b.count() == 0);
  }

  TEST_CASE("group index - select_roots keeps source order", "[group_index]")
  {
    Org_chart chart{{7, 0}, {2, 7}, {3, 0}, {4, 3}};
    auto roots = select_roots(chart.rows(), is_top);

    CHECK(ids(roots) == std::vector<int>{7, 3});
  }

  TEST_CASE("group index - split_forest consumes a lazy range once", "[group_index]")
  {
    Org_chart chart{{1, 0}, {2, 1}, {3, 1}, {4, 2}, {9, 0}};

    int produced = 0;
    auto lazy = std::views::iota(std::size_t{0}, chart.rows().size()) |
                std::views::transform([&](std::size_t i) {
                  ++produced;
                  return chart[i];
                });

    auto split = split_forest(lazy.begin(), lazy.end(), pid_of, is_top);

    CHECK(produced == 5);
    CHECK(ids(split.roots) == std::vector<int>{1, 9});
    CHECK(split.index.count() == 3);
    CHECK(ids(split.index.children_of(1)) == std::vector<int>{2, 3});
    CHECK(ids(split.index.children_of(2)) == std::vector<int>{4});
  }

  TEST_CASE("group index - pair ids with a custom hash", "[group_index]")
  {
    std::vector<Cell> cells{
      {{1, 1}, {0, 0}}, {{1, 2}, {1, 1}}, {{2, 1}, {1, 1}}, {{1, 3}, {1, 2}}};
    auto rows = handles(cells);

    auto index = build_group_index<Cell_key_hash>(rows, cell_pid, cell_is_top);
    CHECK(keys(index.children_of(Cell_key{1, 1})) == std::vector<Cell_key>{{1, 2}, {2, 1}});
    CHECK(index.children_of(Cell_key{2, 1}).empty());

    auto split = split_forest<Cell_key_hash>(
      rows.begin(), rows.end(), cell_pid, cell_is_top);
    CHECK(keys(split.roots) == std::vector<Cell_key>{{1, 1}});
    CHECK(split.index.count() == 3);
  }

} // end of namespace arborkit::testing
