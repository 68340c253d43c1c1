#pragma once

//
// ... Standard header files
//
#include <functional>
#include <ranges>
#include <utility>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... arborkit header files
//
#include <arborkit/data/import.hpp>
#include <arborkit/data/tree_info.hpp>
#include <arborkit/data/tree_walker.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Render a forest as nested JSON.
   *
   * Produces an array with one element per root. Each element is
   * @a node_to_json(node), which must yield an object, extended with a
   * "children" array rendered the same way.
   */
  template <
    std::ranges::input_range Range,
    typename ChildrenFn,
    typename NodeToJson>
  json
  tree_to_json(Range const& roots, ChildrenFn children_fn, NodeToJson node_to_json) {
    using F = std::ranges::range_value_t<Range>;

    json forest = json::array();
    std::vector<json> open;

    walk(
      roots,
      children_fn,
      [&](F const& node) {
        json j = std::invoke(node_to_json, node);
        if (!j.is_object()) {
          throw invalid_argument("tree_to_json: node_to_json must yield an object");
        }
        j["children"] = json::array();
        open.push_back(std::move(j));
      },
      [&](F const&) {
        auto done = std::move(open.back());
        open.pop_back();
        if (open.empty()) {
          forest.push_back(std::move(done));
        } else {
          open.back()["children"].push_back(std::move(done));
        }
      });

    return forest;
  }

} // end of namespace arborkit::data::detail
