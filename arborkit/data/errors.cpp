//
// ... Standard header files
//
#include <string>

//
// ... arborkit header files
//
#include <arborkit/data/errors.hpp>

namespace arborkit::data::detail {

  Cycle_detected::Cycle_detected(std::string const& what)
      : logic_error(what) {}

  Cycle_detected::Cycle_detected(std::string const& what, size_type depth)
      : logic_error(what)
      , depth_(depth) {}

  size_type
  Cycle_detected::depth() const { return depth_; }

  Cycle_detected
  Cycle_detected::at_depth(size_type depth, size_type max_depth) {
    return Cycle_detected(
      "tree depth " + std::to_string(depth) + " exceeds max_depth " +
        std::to_string(max_depth) + "; parent-id chain is likely cyclic",
      depth);
  }

  Invalid_forest::Invalid_forest(
    std::string const& what, size_type n_duplicate_ids, size_type n_unreachable)
      : logic_error(what)
      , n_duplicate_ids_(n_duplicate_ids)
      , n_unreachable_(n_unreachable) {}

  size_type
  Invalid_forest::duplicate_id_count() const { return n_duplicate_ids_; }

  size_type
  Invalid_forest::unreachable_count() const { return n_unreachable_; }

} // end of namespace arborkit::data::detail
