#pragma once

// oikos/tariff.hpp — Seasonal, time-of-use, tiered rate structures.
//
// A TariffDefinition is parsed from JSON once, validated, and never mutated.
// Edits to a tariff are new effective-dated rows sharing the same name.
//
// INVARIANTS (enforced by validate_tariff):
//   - Tiers are strictly ascending by limit; at most one unbounded tier, last.
//   - peak, partial_peak and off_peak hour sets partition {0..23}.
//   - Every rate is present, finite and non-negative.
//
// Tier limits are cumulative month-to-date kWh thresholds: a tier with
// limit 400 covers the first 400 kWh consumed in the local calendar month.

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "oikos/types.hpp"

namespace oikos {

constexpr std::size_t kHoursPerDay = 24;

struct Tier {
  std::optional<double> limit_kwh;  // nullopt = unbounded
  // rates[season][period], $/kWh
  std::array<std::array<double, kPeriodCount>, kSeasonCount> rates{};

  double rate(Season s, TouPeriod p) const {
    return rates[static_cast<std::size_t>(s)][static_cast<std::size_t>(p)];
  }
};

struct TouSchedule {
  std::bitset<13> summer_months;                // bit m set for month m (1..12)
  std::bitset<kHoursPerDay> peak_hours;
  std::bitset<kHoursPerDay> partial_peak_hours;
  std::optional<std::bitset<kHoursPerDay>> off_peak_hours;  // only when listed

  Season season_for_month(unsigned month) const;
  TouPeriod period_for_hour(unsigned hour) const;
};

struct TariffDefinition {
  int64_t     id{0};
  std::string name;
  std::string utility;
  double      fixed_charge_monthly{0.0};
  std::vector<Tier> tiers;
  TouSchedule schedule;
  double      co2_factor_kg_per_kwh{0.0};
  int64_t     effective_day{0};            // local calendar day index, inclusive
  std::optional<int64_t> end_day;          // exclusive; nullopt = open

  bool active_on(int64_t local_day) const {
    return effective_day <= local_day && (!end_day || local_day < *end_day);
  }
};

std::optional<Error> validate_schedule(const TouSchedule& schedule);
std::optional<Error> validate_tariff(const TariffDefinition& tariff);

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------
struct Resolution {
  double      rate{0.0};
  std::size_t tier_index{0};
  TouPeriod   period{TouPeriod::off_peak};
  Season      season{Season::winter};
};

// Index of the tier that prices the next kWh after month_to_date_kwh. When
// every tier is bounded and exhausted, the last tier applies.
std::size_t tier_for(const TariffDefinition& tariff, double month_to_date_kwh);

// Rate in effect at ts_ms for a home at the given UTC offset. Sets *error to a
// config_error (and returns {}) when the tariff violates its invariants.
Resolution resolve(int64_t ts_ms, int utc_offset_minutes, const TariffDefinition& tariff,
                   double month_to_date_kwh, std::optional<Error>* error);

// ---------------------------------------------------------------------------
// Proration
// ---------------------------------------------------------------------------
struct TierPortion {
  std::size_t tier_index{0};
  double      kwh{0.0};
};

// Splits kwh consumed after mtd_before_kwh at every tier limit it crosses.
// Portions are in tier order and sum to kwh. Empty for kwh <= 0.
std::vector<TierPortion> split_across_tiers(const TariffDefinition& tariff,
                                            double mtd_before_kwh, double kwh);

// Cost of kwh consumed in one (season, period) after mtd_before_kwh, each
// tier portion at its own rate.
double price_energy(const TariffDefinition& tariff, Season season, TouPeriod period,
                    double mtd_before_kwh, double kwh);

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

// Parses {"tariffs":[...]} into validated definitions. Any malformed row fails
// the whole file with config_error; nothing partial is returned.
std::vector<TariffDefinition> parse_tariff_file(const std::string& text, std::optional<Error>* error);
std::vector<TariffDefinition> load_tariff_file(const std::string& path, std::optional<Error>* error);

std::string tariff_to_json(const TariffDefinition& tariff);

// ---------------------------------------------------------------------------
// TariffRegistry — effective-dated rows grouped by tariff name.
// Immutable after build(); returned pointers live as long as the registry.
// ---------------------------------------------------------------------------
class TariffRegistry {
 public:
  TariffRegistry() = default;

  // Fails with config_error on duplicate ids or overlapping effective ranges
  // for the same name.
  static TariffRegistry build(std::vector<TariffDefinition> rows, std::optional<Error>* error);

  // Row of `name` active on the given local calendar day, or nullptr with a
  // lookup_error.
  const TariffDefinition* active_for(const std::string& name, int64_t local_day,
                                     std::optional<Error>* error) const;

  bool has_name(const std::string& name) const { return by_name_.contains(name); }
  std::size_t size() const { return rows_.size(); }

 private:
  std::vector<TariffDefinition> rows_;
  std::map<std::string, std::vector<std::size_t>> by_name_;  // sorted by effective_day
};

}  // namespace oikos
