#pragma once

//
// ... Standard header files
//
#include <string>

//
// ... arborkit header files
//
#include <arborkit/data/import.hpp>

namespace arborkit::data::detail {

  /**
   * @brief Thrown when a parent-id chain loops back on itself.
   *
   * Raised only by the opt-in guards: Assembly_config::max_depth and
   * strict validation. Default assembly does not look for cycles.
   */
  class Cycle_detected : public logic_error {
  public:
    explicit Cycle_detected(std::string const& what);

    /** Depth at which the guard tripped, or -1 when found by validation. */
    size_type
    depth() const;

    static Cycle_detected
    at_depth(size_type depth, size_type max_depth);

  private:
    Cycle_detected(std::string const& what, size_type depth);

    size_type depth_{-1};
  };

  /**
   * @brief Thrown by strict validation for duplicate ids or records that
   *  no root can reach.
   */
  class Invalid_forest : public logic_error {
  public:
    Invalid_forest(
      std::string const& what, size_type n_duplicate_ids, size_type n_unreachable);

    size_type
    duplicate_id_count() const;

    size_type
    unreachable_count() const;

  private:
    size_type n_duplicate_ids_{};
    size_type n_unreachable_{};
  };

} // end of namespace arborkit::data::detail
