#pragma once

//
// ... arborkit header files
//
#include <arborkit/data/errors.hpp>
#include <arborkit/data/flattener.hpp>
#include <arborkit/data/group_index.hpp>
#include <arborkit/data/parallel_group_index.hpp>
#include <arborkit/data/tree_assembler.hpp>
#include <arborkit/data/tree_info.hpp>
#include <arborkit/data/tree_walker.hpp>
#include <arborkit/data/validation.hpp>

namespace arborkit::data {
  using ::arborkit::data::detail::Assembly_config;
  using ::arborkit::data::detail::Cycle_detected;
  using ::arborkit::data::detail::Forest_report;
  using ::arborkit::data::detail::Forest_split;
  using ::arborkit::data::detail::Group_index;
  using ::arborkit::data::detail::Group_index_config;
  using ::arborkit::data::detail::Invalid_forest;
  using ::arborkit::data::detail::No_visit;
  using ::arborkit::data::detail::Tree_config;
  using ::arborkit::data::detail::Tree_info;

  using ::arborkit::data::detail::assemble;
  using ::arborkit::data::detail::build_group_index;
  using ::arborkit::data::detail::check_forest;
  using ::arborkit::data::detail::find_duplicate_ids;
  using ::arborkit::data::detail::flatten;
  using ::arborkit::data::detail::flatten_into;
  using ::arborkit::data::detail::select_roots;
  using ::arborkit::data::detail::split_forest;
  using ::arborkit::data::detail::tree_from_list;
  using ::arborkit::data::detail::tree_from_stream;
  using ::arborkit::data::detail::tree_info;
  using ::arborkit::data::detail::validate_forest;
  using ::arborkit::data::detail::walk;

} // end of namespace arborkit::data
