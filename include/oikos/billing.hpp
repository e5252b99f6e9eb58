#pragma once

// oikos/billing.hpp — Priced snapshot of one home's day so far.
//
// compute(home, now):
//   1. breakdown of [local midnight, now] from the home's accumulator
//   2. month-to-date kWh before today from the durable reading store
//   3. each bucket priced in order, split across tiers at the running total
//   4. projected_month = cost_today / day_of_month * days_in_month
//   5. co2_today = energy_today * tariff co2 factor
//   6. current_rate = rate at `now` for the running month-to-date total
//
// Any failure (unknown home, no active tariff, invalid tariff, store error)
// aborts with dependency_error whose cause is the original code. No partial
// snapshot is produced. On success the snapshot becomes the home's latest.

#include <cstdint>
#include <optional>
#include <string>

#include "oikos/home.hpp"
#include "oikos/store.hpp"
#include "oikos/tariff.hpp"
#include "oikos/types.hpp"

namespace oikos {

class BillingCalculator {
 public:
  BillingCalculator(const HomeRegistry& homes, const TariffRegistry& tariffs, IReadingStore& readings);

  std::optional<BillingSnapshot> compute(const std::string& home_id, int64_t now_ms,
                                         std::optional<Error>* error);

  std::optional<BillingSnapshot> latest(const std::string& home_id) const;

 private:
  const HomeRegistry& homes_;
  const TariffRegistry& tariffs_;
  IReadingStore& readings_;
};

}  // namespace oikos
