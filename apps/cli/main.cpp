#include "fetch_cache/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fetch_cache;

namespace {

struct CliOptions {
  std::string config_path;
  std::uint64_t wait_ms{6000};
};

// Stand-in backend: answers after a random delay and stops early when the
// runner gives up on it.
class SimulatedBackend {
public:
  explicit SimulatedBackend(std::uint64_t seed) : rng_(seed) {}

  FetchFn source(Millis max_delay) {
    return [this, max_delay](const FetchRequest &req, std::stop_token stop) {
      auto remaining = Millis(pick(max_delay.count()));
      while (remaining.count() > 0) {
        if (stop.stop_requested())
          throw std::runtime_error("cancelled");
        const auto slice = std::min<Millis>(remaining, Millis(5));
        std::this_thread::sleep_for(slice);
        remaining -= slice;
      }
      return to_payload("{\"entity\":\"" + entity_name(req.type) + "\",\"id\":\"" +
                        req.id + "\",\"date\":\"" + req.date + "\"}");
    };
  }

private:
  std::int64_t pick(std::int64_t max) {
    std::lock_guard<std::mutex> lock(mu_);
    return std::uniform_int_distribution<std::int64_t>(0, max)(rng_);
  }

  std::mutex mu_;
  std::mt19937_64 rng_;
};

void print_field(const char *name, const FetchResult &r) {
  std::cout << "  " << name << ": success=" << r.success
            << " from_cache=" << r.from_cache << " elapsed_ms=" << r.elapsed_ms;
  if (r.error_message)
    std::cout << " error=" << *r.error_message;
  std::cout << "\n";
}

void print_complete(const CustomerCompleteData &d) {
  print_field("customer", d.customer);
  print_field("appointments", d.appointments);
  print_field("treatment_history", d.treatment_history);
  print_field("satisfaction", d.satisfaction);
  std::cout << "  elapsed_ms=" << d.elapsed_ms
            << " cache_hit_rate=" << d.cache_hit_rate << "\n";
}

} // namespace

int main(int argc, char **argv) {
  FetchConfig cfg;
  cfg.max_concurrency = 5;
  cfg.operation_timeout_ms = 10000;
  cfg.default_ttl_ms = 5000;
  cfg.max_cache_entries = 100;
  CliOptions opts;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc)
        opts.config_path = argv[++i];
    }
    std::string err;
    if (!opts.config_path.empty() && !load_config(opts.config_path, cfg, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 2;
    }
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--concurrency" && i + 1 < argc)
        cfg.max_concurrency = std::stoull(argv[++i]);
      else if (a == "--timeout-ms" && i + 1 < argc)
        cfg.operation_timeout_ms = std::stoull(argv[++i]);
      else if (a == "--ttl-ms" && i + 1 < argc)
        cfg.default_ttl_ms = std::stoull(argv[++i]);
      else if (a == "--max-entries" && i + 1 < argc)
        cfg.max_cache_entries = std::stoull(argv[++i]);
      else if (a == "--sweep-ms" && i + 1 < argc)
        cfg.sweep_interval_ms = std::stoull(argv[++i]);
      else if (a == "--wait-ms" && i + 1 < argc)
        opts.wait_ms = std::stoull(argv[++i]);
      else if (a == "--config" && i + 1 < argc)
        ++i;
    }
  } catch (const std::exception &e) {
    std::cerr << "invalid numeric argument: " << e.what() << "\n";
    return 2;
  }

  std::string err;
  if (!validate_config(cfg, &err)) {
    std::cerr << "config error: " << err << "\n";
    return 2;
  }

  SimulatedBackend backend(42);
  DataSources sources;
  sources.bind(EntityType::Customer, backend.source(Millis(1000)))
      .bind(EntityType::Appointments, backend.source(Millis(800)))
      .bind(EntityType::TreatmentHistory, backend.source(Millis(600)))
      .bind(EntityType::Satisfaction, backend.source(Millis(500)))
      .bind(EntityType::TreatmentsByConcern, backend.source(Millis(400)))
      .bind(EntityType::TreatmentsBySkinType, backend.source(Millis(400)))
      .bind(EntityType::TimeSlots, backend.source(Millis(300)))
      .bind(EntityType::Reviews, backend.source(Millis(200)))
      .bind(EntityType::AverageRating, backend.source(Millis(150)));

  CacheStore store(store_config_for(cfg));
  FetchOrchestrator orchestrator(cfg, store, std::move(sources));
  const std::string customer = "debug-customer-123";

  std::cout << "== first composite fetch (expect misses)\n";
  auto first = orchestrator.fetch_customer_complete(customer);
  print_complete(first);

  std::cout << "== second composite fetch (expect hits)\n";
  auto second = orchestrator.fetch_customer_complete(customer);
  print_complete(second);

  std::cout << "== waiting " << opts.wait_ms << "ms for the customer TTL\n";
  std::this_thread::sleep_for(Millis(opts.wait_ms));
  auto third = orchestrator.fetch_customer_complete(customer);
  print_complete(third);

  std::cout << "== customer batch, twice\n";
  const std::vector<std::string> ids{"c1", "c2", "c3", "c4", "c5", "c6", "c7"};
  std::cout << "  " << describe(orchestrator.fetch_customers(ids)) << "\n";
  std::cout << "  " << describe(orchestrator.fetch_customers(ids)) << "\n";

  std::cout << "== recommendations\n";
  std::cout << "  "
            << describe(orchestrator.fetch_treatment_recommendations(
                   {"wrinkles", "pigmentation"}, {"combination"}))
            << "\n";

  std::cout << "== cache\n" << store.info();

  if (second.cache_hit_rate <= 0.5) {
    std::cerr << "cache is not serving repeated composite fetches\n";
    return 1;
  }
  return 0;
}
