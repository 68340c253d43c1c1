#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>

namespace arborkit::testing {

  // A row of a denormalized org chart. Handles into it are Record*.
  struct Record {
    int id;
    int pid;
    std::vector<Record*> children{};
    int attach_count{0};
  };

  // Owns the rows; rows() hands out stable pointers in insertion order.
  class Org_chart {
  public:
    Org_chart(std::initializer_list<std::pair<int, int>> rows) {
      storage_.reserve(rows.size());
      for (auto [id, pid] : rows) {
        storage_.push_back(Record{id, pid});
      }
      for (auto& r : storage_) {
        rows_.push_back(&r);
      }
    }

    // Rows 1..n where row i reports to row (i - 1) / fanout, 0 being the
    // parent id of the single root.
    static Org_chart
    balanced(int n, int fanout) {
      Org_chart chart{};
      chart.storage_.reserve(static_cast<std::size_t>(n));
      for (int i = 1; i <= n; ++i) {
        chart.storage_.push_back(Record{i, i == 1 ? 0 : (i - 2) / fanout + 1});
      }
      for (auto& r : chart.storage_) {
        chart.rows_.push_back(&r);
      }
      return chart;
    }

    Org_chart(Org_chart const&) = delete;
    Org_chart&
    operator=(Org_chart const&) = delete;
    Org_chart(Org_chart&&) = default;

    std::vector<Record*> const&
    rows() const {
      return rows_;
    }

    Record*
    operator[](std::size_t i) const {
      return rows_[i];
    }

  private:
    Org_chart() = default;

    std::vector<Record> storage_{};
    std::vector<Record*> rows_{};
  };

  inline constexpr auto id_of = [](Record const* r) { return r->id; };
  inline constexpr auto pid_of = [](Record const* r) { return r->pid; };
  inline constexpr auto is_top = [](Record const* r) { return r->pid == 0; };

  inline constexpr auto children_of =
    [](Record const* r) -> std::vector<Record*> const& { return r->children; };

  inline constexpr auto attach = [](Record* r, std::vector<Record*> const& c) {
    r->children = c;
    ++r->attach_count;
  };

  inline std::vector<int>
  ids(std::vector<Record*> const& records) {
    std::vector<int> result;
    for (auto r : records) {
      result.push_back(r->id);
    }
    return result;
  }

  inline std::vector<int>
  sorted_ids(std::vector<Record*> const& records) {
    auto result = ids(records);
    std::sort(result.begin(), result.end());
    return result;
  }

  // -- Composite keys --

  // A row keyed by (sheet, cell); std::pair has no std::hash.
  using Cell_key = std::pair<int, int>;

  struct Cell {
    Cell_key id;
    Cell_key pid;
    std::vector<Cell*> children{};
  };

  struct Cell_key_hash {
    std::size_t
    operator()(Cell_key const& key) const {
      auto h = std::hash<int>{}(key.first);
      return h ^ (std::hash<int>{}(key.second) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
  };

  inline constexpr auto cell_id = [](Cell const* c) { return c->id; };
  inline constexpr auto cell_pid = [](Cell const* c) { return c->pid; };
  inline constexpr auto cell_is_top =
    [](Cell const* c) { return c->pid == Cell_key{0, 0}; };
  inline constexpr auto cell_attach =
    [](Cell* c, std::vector<Cell*> const& children) { c->children = children; };

  inline std::vector<Cell*>
  handles(std::vector<Cell>& cells) {
    std::vector<Cell*> result;
    for (auto& c : cells) {
      result.push_back(&c);
    }
    return result;
  }

  inline std::vector<Cell_key>
  keys(std::vector<Cell*> const& cells) {
    std::vector<Cell_key> result;
    for (auto c : cells) {
      result.push_back(c->id);
    }
    return result;
  }

} // end of namespace arborkit::testing
