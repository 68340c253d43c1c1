//
// ... arborkit header files
//
#include <arborkit/data/tree_info.hpp>

namespace arborkit::data::detail {

  bool
  operator==(Tree_info const& a, Tree_info const& b) {
    return a.n_roots == b.n_roots && a.n_nodes == b.n_nodes &&
           a.n_leaves == b.n_leaves && a.height == b.height;
  }

  void
  to_json(json& j, Tree_info const& info) {
    j = {
      {"roots", info.n_roots},
      {"nodes", info.n_nodes},
      {"leaves", info.n_leaves},
      {"height", info.height}};
  }

  void
  from_json(json const& j, Tree_info& info) {
    if (!j.is_object()) {
      throw invalid_argument("Tree_info json must be an object");
    }
    info.n_roots = j.at("roots").get<size_type>();
    info.n_nodes = j.at("nodes").get<size_type>();
    info.n_leaves = j.at("leaves").get<size_type>();
    info.height = j.at("height").get<size_type>();
  }

} // end of namespace arborkit::data::detail
