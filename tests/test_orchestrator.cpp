#include "fetch_cache/orchestrator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <map>
#include <stdexcept>
#include <thread>

using namespace fetch_cache;
using namespace std::chrono_literals;

namespace {
FetchConfig test_config() {
  FetchConfig cfg;
  cfg.max_concurrency = 4;
  cfg.operation_timeout_ms = 2000;
  cfg.default_ttl_ms = 5000;
  cfg.max_cache_entries = 100;
  cfg.sweep_interval_ms = 0;
  return cfg;
}

// Echoes the discriminator back as the payload and counts calls.
FetchFn echo(std::atomic<int> &calls, Millis delay = 0ms) {
  return [&calls, delay](const FetchRequest &req, std::stop_token) {
    ++calls;
    if (delay.count() > 0)
      std::this_thread::sleep_for(delay);
    return to_payload(req.date.empty() ? req.id : req.date + "|" + req.id);
  };
}

DataSources echo_all(std::atomic<int> &calls) {
  DataSources ds;
  for (std::size_t i = 0; i < kEntityTypeCount; ++i)
    ds.bind(static_cast<EntityType>(i), echo(calls));
  return ds;
}

std::string value_of(const FetchResult &r) {
  return r.value.has_value() ? to_string(*r.value) : std::string{};
}
} // namespace

TEST_CASE("Second identical fetch is served from cache", "[orchestrator][cache]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  auto first = o.fetch_customer("c1");
  REQUIRE(first.success);
  CHECK_FALSE(first.from_cache);
  CHECK(value_of(first) == "c1");
  const double rate_after_first = o.stats().hit_rate;

  auto second = o.fetch_customer("c1");
  REQUIRE(second.success);
  CHECK(second.from_cache);
  CHECK(second.elapsed_ms == 0);
  CHECK(value_of(second) == "c1");
  CHECK(calls == 1);
  CHECK(o.stats().hit_rate > rate_after_first);
  CHECK(o.stats().hits == 1);
  CHECK(o.stats().misses == 1);
}

TEST_CASE("Expired entry is fetched again", "[orchestrator][ttl]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  cfg.default_ttl_ms = 80;
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  CHECK_FALSE(o.fetch_customer("c1").from_cache);
  CHECK(o.fetch_customer("c1").from_cache);
  std::this_thread::sleep_for(120ms);
  auto third = o.fetch_customer("c1");
  CHECK(third.success);
  CHECK_FALSE(third.from_cache);
  CHECK(calls == 2);
}

TEST_CASE("Customer TTL scenario at full scale", "[orchestrator][ttl][.slow]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  cfg.default_ttl_ms = 5000;
  cfg.max_cache_entries = 100;
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  auto a = o.fetch_customer("c1");
  CHECK((a.success && !a.from_cache));
  auto b = o.fetch_customer("c1");
  CHECK((b.success && b.from_cache && b.elapsed_ms == 0));
  std::this_thread::sleep_for(6000ms);
  auto c = o.fetch_customer("c1");
  CHECK((c.success && !c.from_cache));
}

TEST_CASE("Per-entity TTLs come from the table, customers use the default",
          "[orchestrator][ttl]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  cfg.default_ttl_ms = 1234;
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  CHECK(o.ttl_for(EntityType::Customer) == 1234ms);
  CHECK(o.ttl_for(EntityType::Appointments) == 1min);
  CHECK(o.ttl_for(EntityType::TreatmentHistory) == 10min);
  CHECK(o.ttl_for(EntityType::Satisfaction) == 10min);
  CHECK(o.ttl_for(EntityType::TreatmentsByConcern) == 30min);
  CHECK(o.ttl_for(EntityType::TreatmentsBySkinType) == 30min);
  CHECK(o.ttl_for(EntityType::AverageRating) == 10min);
  CHECK(o.ttl_for(EntityType::Reviews) == 10min);
  CHECK(o.ttl_for(EntityType::TimeSlots) == 30s);

  REQUIRE(o.fetch_time_slots("2024-07-29", "t1").success);
  const auto entry = store.peek("time-slots:2024-07-29:t1");
  REQUIRE(entry.has_value());
  CHECK(entry->ttl == 30s);
}

TEST_CASE("Failures are returned, never cached", "[orchestrator][errors]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  DataSources ds;
  ds.bind(EntityType::Customer, [&calls](const FetchRequest &, std::stop_token) -> Payload {
    ++calls;
    throw std::runtime_error("customer service down");
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  auto r = o.fetch_customer("c1");
  CHECK_FALSE(r.success);
  CHECK_FALSE(r.from_cache);
  CHECK(r.error == ErrorKind::Failure);
  CHECK(*r.error_message == "customer service down");
  CHECK(store.size() == 0);

  CHECK_FALSE(o.fetch_customer("c1").success);
  CHECK(calls == 2);

  auto unbound = o.fetch_reviews("t1");
  CHECK_FALSE(unbound.success);
  CHECK(unbound.error_message->find("reviews") != std::string::npos);
}

TEST_CASE("Timed out fetch is a failure and cancels the source",
          "[orchestrator][timeout]") {
  std::atomic<bool> cancelled{false};
  auto cfg = test_config();
  cfg.operation_timeout_ms = 50;
  CacheStore store(store_config_for(cfg));
  DataSources ds;
  ds.bind(EntityType::Appointments, [&cancelled](const FetchRequest &req, std::stop_token stop) {
    while (!stop.stop_requested())
      std::this_thread::sleep_for(1ms);
    cancelled = true;
    return to_payload(req.id);
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  CHECK(o.config().operation_timeout_ms == 50);

  auto r = o.fetch_appointments("c1");
  CHECK_FALSE(r.success);
  CHECK(r.error == ErrorKind::Timeout);
  CHECK(*r.error_message == "Operation timeout");
  CHECK(o.parked_operations() == 1);
  for (int i = 0; i < 200 && !cancelled; ++i)
    std::this_thread::sleep_for(5ms);
  CHECK(cancelled);
  CHECK_FALSE(store.contains("appointments:c1"));
}

TEST_CASE("Batch keeps input order whatever the completion order",
          "[orchestrator][batch]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  const std::map<std::string, Millis> delays{{"a", 80ms}, {"b", 0ms}, {"c", 30ms}};
  DataSources ds;
  ds.bind(EntityType::Customer, [&](const FetchRequest &req, std::stop_token) {
    ++calls;
    std::this_thread::sleep_for(delays.at(req.id));
    return to_payload(req.id);
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  auto b = o.fetch_batch({{EntityType::Customer, "a", {}},
                          {EntityType::Customer, "b", {}},
                          {EntityType::Customer, "c", {}}},
                         3);
  REQUIRE(b.results.size() == 3);
  CHECK(value_of(b.results[0]) == "a");
  CHECK(value_of(b.results[1]) == "b");
  CHECK(value_of(b.results[2]) == "c");
  CHECK(b.success_count == 3);
  CHECK(b.error_count == 0);
  CHECK(b.cache_hit_rate == 0.0);
}

TEST_CASE("Batch runs groups of at most the concurrency bound in sequence",
          "[orchestrator][batch][concurrency]") {
  std::atomic<int> in_flight{0};
  std::atomic<int> max_seen{0};
  auto cfg = test_config();
  cfg.max_concurrency = 2;
  CacheStore store(store_config_for(cfg));
  DataSources ds;
  ds.bind(EntityType::Customer, [&](const FetchRequest &req, std::stop_token) {
    const int now = ++in_flight;
    int prev = max_seen.load();
    while (now > prev && !max_seen.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(40ms);
    --in_flight;
    return to_payload(req.id);
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  auto b = o.fetch_customers({"c1", "c2", "c3", "c4", "c5"});
  REQUIRE(b.results.size() == 5);
  for (std::size_t i = 0; i < 5; ++i)
    CHECK(value_of(b.results[i]) == "c" + std::to_string(i + 1));
  CHECK(b.success_count == 5);
  CHECK(max_seen <= 2);
  // Three groups of 40ms each.
  CHECK(b.total_elapsed_ms >= 110);

  auto again = o.fetch_customers({"c1", "c2", "c3", "c4", "c5"});
  CHECK(again.cache_hit_rate == 1.0);
  CHECK(again.success_count == 5);
}

TEST_CASE("A failing group does not stop later groups",
          "[orchestrator][batch][errors]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  DataSources ds;
  ds.bind(EntityType::Customer, [&calls](const FetchRequest &req, std::stop_token) {
    ++calls;
    if (req.id == "bad1" || req.id == "bad2")
      throw std::runtime_error("no such customer " + req.id);
    return to_payload(req.id);
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  auto b = o.fetch_batch({{EntityType::Customer, "bad1", {}},
                          {EntityType::Customer, "bad2", {}},
                          {EntityType::Customer, "ok1", {}},
                          {EntityType::Customer, "ok2", {}}},
                         2);
  REQUIRE(b.results.size() == 4);
  CHECK(b.error_count == 2);
  CHECK(b.success_count == 2);
  CHECK(*b.results[1].error_message == "no such customer bad2");
  CHECK(value_of(b.results[3]) == "ok2");
  CHECK(calls == 4);
}

TEST_CASE("Composite fetch isolates a single failure", "[orchestrator][composite]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  DataSources ds = echo_all(calls);
  ds.bind(EntityType::Satisfaction, [](const FetchRequest &, std::stop_token) -> Payload {
    throw std::runtime_error("survey backend offline");
  });
  FetchOrchestrator o(cfg, store, std::move(ds));

  auto b = o.fetch_parallel({{EntityType::Customer, "c1", {}},
                             {EntityType::Appointments, "c1", {}},
                             {EntityType::Satisfaction, "c1", {}},
                             {EntityType::TreatmentsByConcern, "wrinkles", {}},
                             {EntityType::AverageRating, "t1", {}}});
  REQUIRE(b.results.size() == 5);
  CHECK(b.success_count == 4);
  CHECK(b.error_count == 1);
  CHECK_FALSE(b.results[2].success);
  CHECK(b.results[4].success);
}

TEST_CASE("Customer complete data reports per-field results and hit rate",
          "[orchestrator][composite]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  auto first = o.fetch_customer_complete("c9");
  CHECK(first.customer.success);
  CHECK(first.appointments.success);
  CHECK(first.treatment_history.success);
  CHECK(first.satisfaction.success);
  CHECK(first.cache_hit_rate == 0.0);
  CHECK(calls == 4);
  CHECK(store.contains("customer:c9"));
  CHECK(store.contains("appointments:c9"));
  CHECK(store.contains("treatment-history:c9"));
  CHECK(store.contains("satisfaction:c9"));

  auto second = o.fetch_customer_complete("c9");
  CHECK(second.cache_hit_rate == 1.0);
  CHECK(second.customer.from_cache);
  CHECK(calls == 4);
}

TEST_CASE("Recommendations, time slots and reviews keep their layouts",
          "[orchestrator][composite]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  auto rec = o.fetch_treatment_recommendations({"wrinkles", "pigment"}, {"dry"});
  REQUIRE(rec.results.size() == 3);
  CHECK(store.contains("treatments:concern:wrinkles"));
  CHECK(store.contains("treatments:concern:pigment"));
  CHECK(store.contains("treatments:skin-type:dry"));
  CHECK(value_of(rec.results[2]) == "dry");

  auto slots = o.fetch_time_slots_parallel({"d1", "d2"}, {"t1", "t2"});
  REQUIRE(slots.results.size() == 4);
  CHECK(value_of(slots.results[0]) == "d1|t1");
  CHECK(value_of(slots.results[1]) == "d1|t2");
  CHECK(value_of(slots.results[2]) == "d2|t1");
  CHECK(value_of(slots.results[3]) == "d2|t2");

  auto rr = o.fetch_reviews_and_ratings({"t1", "t2"});
  CHECK(rr.reviews.success_count == 2);
  CHECK(rr.average_ratings.success_count == 2);
  CHECK(store.contains("reviews:t1"));
  CHECK(store.contains("rating:t2"));
}

TEST_CASE("Clearing the cache resets statistics", "[orchestrator][stats]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  CacheStore store(store_config_for(cfg));
  FetchOrchestrator o(cfg, store, echo_all(calls));

  o.fetch_customer("c1");
  o.fetch_customer("c1");
  CHECK(o.stats().total_size == 1);
  CHECK(o.stats().memory_usage_bytes ==
        std::string("customer:c1").size() + 2 + kEntryOverheadBytes);

  o.clear_cache();
  const auto s = o.stats();
  CHECK(s.total_size == 0);
  CHECK(s.hits == 0);
  CHECK(s.misses == 0);
  CHECK_FALSE(o.fetch_customer("c1").from_cache);
}

TEST_CASE("Invalid configuration is rejected at construction",
          "[orchestrator][config]") {
  std::atomic<int> calls{0};
  auto cfg = test_config();
  cfg.max_concurrency = 0;
  CacheStore store(store_config_for(test_config()));
  CHECK_THROWS_AS((FetchOrchestrator(cfg, store, echo_all(calls))),
                  std::invalid_argument);
}

TEST_CASE("A slot that fails to resolve is reported with its query index",
          "[orchestrator][composite][errors]") {
  std::vector<std::future<FetchResult>> pending;
  std::promise<FetchResult> ok;
  ok.set_value(FetchResult::ok(to_payload("a"), 3));
  pending.push_back(ok.get_future());
  std::promise<FetchResult> broken;
  broken.set_exception(std::make_exception_ptr(std::runtime_error("thread limit")));
  pending.push_back(broken.get_future());

  auto results = collect_results(std::move(pending), 4);
  REQUIRE(results.size() == 2);
  CHECK(results[0].success);
  CHECK(value_of(results[0]) == "a");
  CHECK_FALSE(results[1].success);
  CHECK(results[1].error == ErrorKind::Failure);
  REQUIRE(results[1].error_message.has_value());
  CHECK(*results[1].error_message == "Query 5: thread limit");
}
