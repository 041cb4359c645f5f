#include "fetch_cache/entity.hpp"

#include <chrono>

namespace fetch_cache {
namespace {
using namespace std::chrono_literals;

constexpr std::array<const char *, kEntityTypeCount> kNames = {
    "customer",   "appointments", "treatment_history",
    "satisfaction", "treatments_by_concern", "treatments_by_skin_type",
    "time_slots", "reviews",      "average_rating",
};
} // namespace

std::string entity_name(EntityType type) {
  return kNames[static_cast<std::size_t>(type)];
}

std::optional<EntityType> entity_from_name(const std::string &name) {
  for (std::size_t i = 0; i < kNames.size(); ++i) {
    if (name == kNames[i])
      return static_cast<EntityType>(i);
  }
  return std::nullopt;
}

std::string canonical_customer_key(const std::string &customer_id) {
  return "customer:" + customer_id;
}
std::string canonical_appointments_key(const std::string &customer_id) {
  return "appointments:" + customer_id;
}
std::string canonical_treatment_history_key(const std::string &customer_id) {
  return "treatment-history:" + customer_id;
}
std::string canonical_satisfaction_key(const std::string &customer_id) {
  return "satisfaction:" + customer_id;
}
std::string canonical_concern_key(const std::string &concern) {
  return "treatments:concern:" + concern;
}
std::string canonical_skin_type_key(const std::string &skin_type) {
  return "treatments:skin-type:" + skin_type;
}
std::string canonical_time_slots_key(const std::string &date,
                                     const std::string &treatment_id) {
  return "time-slots:" + date + ":" + treatment_id;
}
std::string canonical_reviews_key(const std::string &treatment_id) {
  return "reviews:" + treatment_id;
}
std::string canonical_rating_key(const std::string &treatment_id) {
  return "rating:" + treatment_id;
}

std::string canonical_key(const FetchRequest &req) {
  switch (req.type) {
  case EntityType::Customer:
    return canonical_customer_key(req.id);
  case EntityType::Appointments:
    return canonical_appointments_key(req.id);
  case EntityType::TreatmentHistory:
    return canonical_treatment_history_key(req.id);
  case EntityType::Satisfaction:
    return canonical_satisfaction_key(req.id);
  case EntityType::TreatmentsByConcern:
    return canonical_concern_key(req.id);
  case EntityType::TreatmentsBySkinType:
    return canonical_skin_type_key(req.id);
  case EntityType::TimeSlots:
    return canonical_time_slots_key(req.date, req.id);
  case EntityType::Reviews:
    return canonical_reviews_key(req.id);
  case EntityType::AverageRating:
    return canonical_rating_key(req.id);
  }
  return entity_name(req.type) + ":" + req.id;
}

TtlTable::TtlTable() {
  set(EntityType::Appointments, 1min);
  set(EntityType::TreatmentHistory, 10min);
  set(EntityType::Satisfaction, 10min);
  set(EntityType::TreatmentsByConcern, 30min);
  set(EntityType::TreatmentsBySkinType, 30min);
  set(EntityType::TimeSlots, 30s);
  set(EntityType::Reviews, 10min);
  set(EntityType::AverageRating, 10min);
}

DataSources &DataSources::bind(EntityType type, FetchFn fn) {
  fns_[static_cast<std::size_t>(type)] = std::move(fn);
  return *this;
}

const FetchFn *DataSources::find(EntityType type) const {
  const auto &fn = fns_[static_cast<std::size_t>(type)];
  return fn ? &fn : nullptr;
}

} // namespace fetch_cache
