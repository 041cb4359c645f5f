#pragma once

#include "fetch_cache/types.hpp"

#include <array>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace fetch_cache {

enum class EntityType {
  Customer,
  Appointments,
  TreatmentHistory,
  Satisfaction,
  TreatmentsByConcern,
  TreatmentsBySkinType,
  TimeSlots,
  Reviews,
  AverageRating,
};

inline constexpr std::size_t kEntityTypeCount = 9;

// `date` is only meaningful for TimeSlots, where `id` is the treatment.
struct FetchRequest {
  EntityType type{EntityType::Customer};
  std::string id;
  std::string date;
};

std::string entity_name(EntityType type);
std::optional<EntityType> entity_from_name(const std::string &name);

std::string canonical_customer_key(const std::string &customer_id);
std::string canonical_appointments_key(const std::string &customer_id);
std::string canonical_treatment_history_key(const std::string &customer_id);
std::string canonical_satisfaction_key(const std::string &customer_id);
std::string canonical_concern_key(const std::string &concern);
std::string canonical_skin_type_key(const std::string &skin_type);
std::string canonical_time_slots_key(const std::string &date,
                                     const std::string &treatment_id);
std::string canonical_reviews_key(const std::string &treatment_id);
std::string canonical_rating_key(const std::string &treatment_id);
std::string canonical_key(const FetchRequest &req);

// Per-entity time to live, chosen by how quickly each kind of data changes.
// An entity without an entry uses the configured default TTL; customer
// profiles have none out of the box.
class TtlTable {
public:
  TtlTable();

  std::optional<Millis> ttl_for(EntityType type) const {
    return ttls_[static_cast<std::size_t>(type)];
  }
  void set(EntityType type, Millis ttl) {
    ttls_[static_cast<std::size_t>(type)] = ttl;
  }
  void reset(EntityType type) { ttls_[static_cast<std::size_t>(type)].reset(); }

private:
  std::array<std::optional<Millis>, kEntityTypeCount> ttls_{};
};

using FetchFn = std::function<Payload(const FetchRequest &, std::stop_token)>;

// One data-producing function per entity type. The functions may block and
// should return early once their stop token is triggered.
class DataSources {
public:
  DataSources &bind(EntityType type, FetchFn fn);
  const FetchFn *find(EntityType type) const;

private:
  std::array<FetchFn, kEntityTypeCount> fns_{};
};

} // namespace fetch_cache
