#include "fetch_cache/orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fetch_cache {
namespace {
FetchConfig checked(FetchConfig cfg) {
  std::string err;
  if (!validate_config(cfg, &err))
    throw std::invalid_argument(err);
  return cfg;
}

FetchResult query_failure(std::size_t index, const std::string &reason) {
  return FetchResult::fail(ErrorKind::Failure,
                           "Query " + std::to_string(index) + ": " + reason, 0);
}
} // namespace

std::vector<FetchResult>
collect_results(std::vector<std::future<FetchResult>> pending,
                std::size_t first_index) {
  std::vector<FetchResult> out;
  out.reserve(pending.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      out.push_back(pending[i].get());
    } catch (const std::exception &e) {
      out.push_back(query_failure(first_index + i, e.what()));
    }
  }
  return out;
}

FetchOrchestrator::FetchOrchestrator(FetchConfig cfg, CacheStore &store,
                                     DataSources sources)
    : cfg_(checked(std::move(cfg))), store_(store), sources_(std::move(sources)),
      runner_(Millis(cfg_.operation_timeout_ms)) {
  if (cfg_.sweep_interval_ms > 0)
    sweeper_ = std::make_unique<ExpirySweeper>(store_, Millis(cfg_.sweep_interval_ms));
}

Millis FetchOrchestrator::ttl_for(EntityType type) const {
  return cfg_.ttl.ttl_for(type).value_or(Millis(cfg_.default_ttl_ms));
}

FetchResult FetchOrchestrator::fetch(const FetchRequest &req) {
  const auto key = canonical_key(req);
  if (auto cached = store_.get(key))
    return FetchResult::ok(std::move(*cached), 0, true);

  const FetchFn *fn = sources_.find(req.type);
  if (fn == nullptr)
    return FetchResult::fail(ErrorKind::Failure,
                             "no data source bound for " + entity_name(req.type),
                             0);

  auto result = runner_.run<Payload>(
      [fn, req](std::stop_token stop) { return (*fn)(req, stop); });
  if (result.success && result.value.has_value()) {
    // A key the store rejects is not cached; the value still goes back.
    store_.put(key, *result.value, ttl_for(req.type));
  }
  result.from_cache = false;
  return result;
}

FetchResult FetchOrchestrator::fetch_customer(const std::string &customer_id) {
  return fetch({EntityType::Customer, customer_id, {}});
}
FetchResult FetchOrchestrator::fetch_appointments(const std::string &customer_id) {
  return fetch({EntityType::Appointments, customer_id, {}});
}
FetchResult
FetchOrchestrator::fetch_treatment_history(const std::string &customer_id) {
  return fetch({EntityType::TreatmentHistory, customer_id, {}});
}
FetchResult FetchOrchestrator::fetch_satisfaction(const std::string &customer_id) {
  return fetch({EntityType::Satisfaction, customer_id, {}});
}
FetchResult
FetchOrchestrator::fetch_treatments_by_concern(const std::string &concern) {
  return fetch({EntityType::TreatmentsByConcern, concern, {}});
}
FetchResult
FetchOrchestrator::fetch_treatments_by_skin_type(const std::string &skin_type) {
  return fetch({EntityType::TreatmentsBySkinType, skin_type, {}});
}
FetchResult FetchOrchestrator::fetch_time_slots(const std::string &date,
                                                const std::string &treatment_id) {
  return fetch({EntityType::TimeSlots, treatment_id, date});
}
FetchResult FetchOrchestrator::fetch_reviews(const std::string &treatment_id) {
  return fetch({EntityType::Reviews, treatment_id, {}});
}
FetchResult
FetchOrchestrator::fetch_average_rating(const std::string &treatment_id) {
  return fetch({EntityType::AverageRating, treatment_id, {}});
}

std::vector<FetchResult>
FetchOrchestrator::run_all(const std::vector<FetchRequest> &requests,
                           std::size_t first, std::size_t last) {
  std::vector<std::future<FetchResult>> pending;
  pending.reserve(last - first);
  for (std::size_t i = first; i < last; ++i) {
    try {
      pending.push_back(std::async(std::launch::async,
                                   [this, &req = requests[i]] { return fetch(req); }));
    } catch (const std::system_error &) {
      // Could not start a thread; report it through the slot like any failure.
      std::promise<FetchResult> failed;
      failed.set_exception(std::current_exception());
      pending.push_back(failed.get_future());
    }
  }

  return collect_results(std::move(pending), first);
}

FetchBatch FetchOrchestrator::fetch_batch(const std::vector<FetchRequest> &requests,
                                          std::size_t concurrency) {
  const auto start = Clock::now();
  const std::size_t group = std::max<std::size_t>(1, concurrency);
  std::vector<FetchResult> all;
  all.reserve(requests.size());
  for (std::size_t i = 0; i < requests.size(); i += group) {
    auto part = run_all(requests, i, std::min(requests.size(), i + group));
    std::move(part.begin(), part.end(), std::back_inserter(all));
  }
  return summarize(std::move(all), start);
}

FetchBatch FetchOrchestrator::fetch_batch(const std::vector<FetchRequest> &requests) {
  return fetch_batch(requests, cfg_.max_concurrency);
}

FetchBatch
FetchOrchestrator::fetch_parallel(const std::vector<FetchRequest> &requests) {
  const auto start = Clock::now();
  return summarize(run_all(requests, 0, requests.size()), start);
}

FetchBatch
FetchOrchestrator::fetch_customers(const std::vector<std::string> &customer_ids) {
  std::vector<FetchRequest> reqs;
  reqs.reserve(customer_ids.size());
  for (const auto &id : customer_ids)
    reqs.push_back({EntityType::Customer, id, {}});
  return fetch_batch(reqs);
}

CustomerCompleteData
FetchOrchestrator::fetch_customer_complete(const std::string &customer_id) {
  const auto start = Clock::now();
  auto batch = fetch_parallel({{EntityType::Customer, customer_id, {}},
                               {EntityType::Appointments, customer_id, {}},
                               {EntityType::TreatmentHistory, customer_id, {}},
                               {EntityType::Satisfaction, customer_id, {}}});
  CustomerCompleteData out;
  out.customer = std::move(batch.results[0]);
  out.appointments = std::move(batch.results[1]);
  out.treatment_history = std::move(batch.results[2]);
  out.satisfaction = std::move(batch.results[3]);
  out.cache_hit_rate = batch.cache_hit_rate;
  out.elapsed_ms = elapsed_ms(start);
  return out;
}

FetchBatch FetchOrchestrator::fetch_treatment_recommendations(
    const std::vector<std::string> &concerns,
    const std::vector<std::string> &skin_types) {
  std::vector<FetchRequest> reqs;
  reqs.reserve(concerns.size() + skin_types.size());
  for (const auto &c : concerns)
    reqs.push_back({EntityType::TreatmentsByConcern, c, {}});
  for (const auto &s : skin_types)
    reqs.push_back({EntityType::TreatmentsBySkinType, s, {}});
  return fetch_parallel(reqs);
}

FetchBatch FetchOrchestrator::fetch_time_slots_parallel(
    const std::vector<std::string> &dates,
    const std::vector<std::string> &treatment_ids) {
  std::vector<FetchRequest> reqs;
  reqs.reserve(dates.size() * treatment_ids.size());
  for (const auto &date : dates)
    for (const auto &id : treatment_ids)
      reqs.push_back({EntityType::TimeSlots, id, date});
  return fetch_parallel(reqs);
}

ReviewsAndRatings FetchOrchestrator::fetch_reviews_and_ratings(
    const std::vector<std::string> &treatment_ids) {
  const auto start = Clock::now();
  std::vector<FetchRequest> reviews;
  std::vector<FetchRequest> ratings;
  reviews.reserve(treatment_ids.size());
  ratings.reserve(treatment_ids.size());
  for (const auto &id : treatment_ids) {
    reviews.push_back({EntityType::Reviews, id, {}});
    ratings.push_back({EntityType::AverageRating, id, {}});
  }

  std::future<FetchBatch> rating_batch;
  try {
    rating_batch = std::async(std::launch::async,
                              [this, &ratings] { return fetch_parallel(ratings); });
  } catch (const std::system_error &) {
    // No thread to spare; the ratings run after the reviews instead.
  }
  ReviewsAndRatings out;
  out.reviews = fetch_parallel(reviews);
  out.average_ratings =
      rating_batch.valid() ? rating_batch.get() : fetch_parallel(ratings);
  out.elapsed_ms = elapsed_ms(start);
  return out;
}

} // namespace fetch_cache
