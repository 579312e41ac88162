#pragma once

#include <chrono>
#include <cstdint>

namespace cascade::core {

/*
  Tunables for initiation, processing and ledger retention.

  Built from the delete_operations config section; zero config values fall
  back to these defaults.
*/
struct CascadeOptions {
  uint32_t             max_concurrent_per_actor = 5;
  std::chrono::seconds retry_after{30};

  uint32_t batch_size          = 10;
  uint32_t discovery_page_size = 100;
  uint32_t claim_batch_size    = 16;

  std::chrono::milliseconds poll_interval{500};
  std::chrono::seconds      operation_retention{std::chrono::hours(24)};
  std::chrono::seconds      entity_retention{std::chrono::hours(24 * 90)};
  std::chrono::seconds      prune_interval{60};

  uint32_t worker_threads = 1;

  uint32_t default_list_limit = 20;
  uint32_t max_list_limit     = 100;
};

} // namespace cascade::core
