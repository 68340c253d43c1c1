#pragma once

//
// ... Standard header files
//
#include <stdexcept>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... arborkit header files
//
#include <arborkit/config.hpp>

namespace arborkit::data::detail {

  using size_type = config::size_type;

  using nlohmann::json;

  using std::vector;

  using std::invalid_argument;
  using std::logic_error;

} // end of namespace arborkit::data::detail
