#pragma once

//
// ... Standard header files
//
#include <cstddef>

namespace arborkit::config {

  using size_type = std::ptrdiff_t;

} // end of namespace arborkit::config
