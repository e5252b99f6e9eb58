#include "oikos/billing.hpp"

#include "oikos/timeutil.hpp"

namespace oikos {

BillingCalculator::BillingCalculator(const HomeRegistry& homes, const TariffRegistry& tariffs,
                                     IReadingStore& readings)
    : homes_(homes), tariffs_(tariffs), readings_(readings) {}

std::optional<BillingSnapshot> BillingCalculator::compute(const std::string& home_id, int64_t now_ms,
                                                          std::optional<Error>* error) {
  auto fail = [&](const std::string& context, const Error& inner) -> std::optional<BillingSnapshot> {
    *error = wrap_error(ErrorCode::dependency_error, context, inner);
    return std::nullopt;
  };

  std::optional<Error> e;
  HomeContext* home = homes_.find(home_id, &e);
  if (!home) return fail("compute " + home_id, *e);
  const int offset = home->config().utc_offset_minutes;

  const int64_t local_day = timeutil::local_day_index(now_ms, offset);
  const TariffDefinition* tariff = tariffs_.active_for(home->config().tariff_name, local_day, &e);
  if (!tariff) return fail("tariff lookup for " + home_id, *e);
  if (auto invalid = validate_tariff(*tariff)) {
    return fail("tariff " + std::to_string(tariff->id), *invalid);
  }

  const int64_t day_start = timeutil::start_of_local_day(now_ms, offset);
  const int64_t month_start = timeutil::start_of_local_month(now_ms, offset);
  const double mtd_before_today = readings_.energy_kwh_between(home_id, month_start, day_start, &e);
  if (e) return fail("month-to-date for " + home_id, *e);

  const WindowBreakdown breakdown = home->accumulator().window_breakdown(day_start, now_ms + 1, tariff->schedule);

  double running_mtd = mtd_before_today;
  double cost_today = 0.0;
  for (const auto& bucket : breakdown.buckets) {
    cost_today += price_energy(*tariff, bucket.season, bucket.period, running_mtd, bucket.kwh);
    running_mtd += bucket.kwh;
  }

  const Resolution now_rate = resolve(now_ms, offset, *tariff, running_mtd, &e);
  if (e) return fail("rate at now for " + home_id, *e);

  const timeutil::LocalTime local = timeutil::to_local(now_ms, offset);
  const double days_elapsed = static_cast<double>(local.day);
  const double days_in_month = static_cast<double>(timeutil::days_in_local_month(now_ms, offset));

  BillingSnapshot s;
  s.timestamp_ms     = now_ms;
  s.home_id          = home_id;
  s.cost_today       = cost_today;
  s.energy_today_kwh = breakdown.total_kwh();
  s.projected_month  = cost_today / days_elapsed * days_in_month;
  s.co2_today_kg     = s.energy_today_kwh * tariff->co2_factor_kg_per_kwh;
  s.current_rate     = now_rate.rate;
  s.tariff_id        = tariff->id;
  s.tariff_name      = tariff->name;

  home->set_latest(s);
  return s;
}

std::optional<BillingSnapshot> BillingCalculator::latest(const std::string& home_id) const {
  const HomeContext* home = homes_.find(home_id);
  if (!home) return std::nullopt;
  return home->latest();
}

}  // namespace oikos
