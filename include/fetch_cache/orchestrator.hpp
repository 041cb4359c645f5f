#pragma once

#include "fetch_cache/async_result.hpp"
#include "fetch_cache/cache_store.hpp"
#include "fetch_cache/config.hpp"
#include "fetch_cache/entity.hpp"
#include "fetch_cache/runner.hpp"
#include "fetch_cache/sweeper.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace fetch_cache {

using FetchResult = AsyncResult<Payload>;
using FetchBatch = BatchResult<Payload>;

inline CacheStoreConfig store_config_for(const FetchConfig &cfg) {
  CacheStoreConfig sc;
  sc.max_entries = cfg.max_cache_entries;
  return sc;
}

struct CustomerCompleteData {
  FetchResult customer;
  FetchResult appointments;
  FetchResult treatment_history;
  FetchResult satisfaction;
  std::uint64_t elapsed_ms{0};
  double cache_hit_rate{0.0};
};

struct ReviewsAndRatings {
  FetchBatch reviews;
  FetchBatch average_ratings;
  std::uint64_t elapsed_ms{0};
};

// Waits on launched fetches in order. A slot whose future throws becomes a
// failure reading "Query <index>: <message>", indexes counted from
// `first_index`.
std::vector<FetchResult>
collect_results(std::vector<std::future<FetchResult>> pending,
                std::size_t first_index);

// Cache-aware fetching in front of a set of slow data sources. The store is
// owned by the caller so several orchestrators, or a test, can share or
// isolate it explicitly.
class FetchOrchestrator {
public:
  // Throws std::invalid_argument when `cfg` fails validate_config.
  FetchOrchestrator(FetchConfig cfg, CacheStore &store, DataSources sources);

  FetchOrchestrator(const FetchOrchestrator &) = delete;
  FetchOrchestrator &operator=(const FetchOrchestrator &) = delete;

  FetchResult fetch(const FetchRequest &req);

  FetchResult fetch_customer(const std::string &customer_id);
  FetchResult fetch_appointments(const std::string &customer_id);
  FetchResult fetch_treatment_history(const std::string &customer_id);
  FetchResult fetch_satisfaction(const std::string &customer_id);
  FetchResult fetch_treatments_by_concern(const std::string &concern);
  FetchResult fetch_treatments_by_skin_type(const std::string &skin_type);
  FetchResult fetch_time_slots(const std::string &date,
                               const std::string &treatment_id);
  FetchResult fetch_reviews(const std::string &treatment_id);
  FetchResult fetch_average_rating(const std::string &treatment_id);

  // Runs consecutive groups of at most `concurrency` requests; each group is
  // fully resolved before the next starts. Results keep input order.
  FetchBatch fetch_batch(const std::vector<FetchRequest> &requests,
                         std::size_t concurrency);
  FetchBatch fetch_batch(const std::vector<FetchRequest> &requests);
  // Every request at once, no grouping.
  FetchBatch fetch_parallel(const std::vector<FetchRequest> &requests);

  FetchBatch fetch_customers(const std::vector<std::string> &customer_ids);
  CustomerCompleteData fetch_customer_complete(const std::string &customer_id);
  FetchBatch fetch_treatment_recommendations(
      const std::vector<std::string> &concerns,
      const std::vector<std::string> &skin_types);
  FetchBatch
  fetch_time_slots_parallel(const std::vector<std::string> &dates,
                            const std::vector<std::string> &treatment_ids);
  ReviewsAndRatings
  fetch_reviews_and_ratings(const std::vector<std::string> &treatment_ids);

  CacheStats stats() const { return store_.stats(); }
  void clear_cache() { store_.clear(); }

  const FetchConfig &config() const { return cfg_; }
  Millis ttl_for(EntityType type) const;
  std::size_t parked_operations() const { return runner_.parked(); }

private:
  std::vector<FetchResult> run_all(const std::vector<FetchRequest> &requests,
                                   std::size_t first, std::size_t last);

  FetchConfig cfg_;
  CacheStore &store_;
  DataSources sources_;
  OperationRunner runner_;
  std::unique_ptr<ExpirySweeper> sweeper_;
};

} // namespace fetch_cache
