//
// ... Standard header files
//
#include <algorithm>
#include <stdexcept>
#include <thread>

//
// ... arborkit header files
//
#include <arborkit/data/parallel_group_index.hpp>

namespace arborkit::data::detail {

  size_type
  resolve_worker_count(Group_index_config const& cfg, size_type n_records) {
    if (cfg.n_workers < 0) {
      throw invalid_argument("Group_index_config::n_workers must be >= 0");
    }
    if (cfg.min_records_per_worker < 1) {
      throw invalid_argument(
        "Group_index_config::min_records_per_worker must be >= 1");
    }

    auto hardware = std::max<size_type>(
      1, static_cast<size_type>(std::thread::hardware_concurrency()));
    auto requested = cfg.n_workers == 0 ? hardware : std::min(cfg.n_workers, hardware);

    // Never hand a worker less than one grain of records.
    auto by_grain = std::max<size_type>(1, n_records / cfg.min_records_per_worker);
    return std::min(requested, by_grain);
  }

} // end of namespace arborkit::data::detail
