#pragma once

//
// ... arborkit header files
//
#include <arborkit/config.hpp>
#include <arborkit/data.hpp>
#include <arborkit/data/json_serialization.hpp>

namespace arborkit {
  using namespace ::arborkit::data;

  using ::arborkit::data::detail::tree_to_json;

} // end of namespace arborkit
