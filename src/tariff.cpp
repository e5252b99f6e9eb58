#include "oikos/tariff.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include "oikos/jsonlite.hpp"
#include "oikos/timeutil.hpp"

namespace oikos {

namespace {

constexpr const char* kPeriodKeys[kPeriodCount] = {"off_peak", "partial_peak", "peak"};

std::optional<Error> config_error(std::string message) {
  return make_error(ErrorCode::config_error, std::move(message));
}

std::string hours_to_json(const std::bitset<kHoursPerDay>& hours) {
  std::string out = "[";
  bool first = true;
  for (std::size_t h = 0; h < kHoursPerDay; ++h) {
    if (!hours.test(h)) continue;
    if (!first) out += ",";
    first = false;
    out += std::to_string(h);
  }
  out += "]";
  return out;
}

// Reads an array of integral hours (0..23) into a bitset. Duplicates inside
// one set are an error: they usually hide a typo for another hour.
std::optional<Error> read_hours(const jsonlite::Object& obj, const std::string& key, bool required,
                                std::bitset<kHoursPerDay>* out, bool* present) {
  *present = false;
  const jsonlite::Array* arr = jsonlite::get_array(obj, key);
  if (!arr) {
    if (jsonlite::find(obj, key) && !jsonlite::is_null(*jsonlite::find(obj, key))) {
      return config_error("tou_schedule." + key + " must be an array");
    }
    if (required) return config_error("tou_schedule." + key + " is required");
    return std::nullopt;
  }
  *present = true;
  for (const auto& v : *arr) {
    auto h = jsonlite::as_u64(v);
    if (!h || *h >= kHoursPerDay) {
      return config_error("tou_schedule." + key + " contains an hour outside 0..23");
    }
    if (out->test(*h)) {
      return config_error("tou_schedule." + key + " lists hour " + std::to_string(*h) + " twice");
    }
    out->set(*h);
  }
  return std::nullopt;
}

std::optional<Error> read_rates(const jsonlite::Object& charge, const std::string& season_key,
                                std::size_t tier_pos, std::array<double, kPeriodCount>* out) {
  const std::string where = "energy_charges[" + std::to_string(tier_pos) + "]." + season_key;
  const jsonlite::Object* season = jsonlite::get_object(charge, season_key);
  if (!season) return config_error(where + " is missing");
  for (std::size_t p = 0; p < kPeriodCount; ++p) {
    const jsonlite::Value* v = jsonlite::find(*season, kPeriodKeys[p]);
    if (!v) return config_error(where + "." + kPeriodKeys[p] + " is missing");
    auto d = jsonlite::as_double(*v);
    if (!d) return config_error(where + "." + kPeriodKeys[p] + " must be a number");
    (*out)[p] = *d;
  }
  return std::nullopt;
}

std::optional<Error> read_day(const jsonlite::Object& obj, const std::string& key, bool required,
                              std::optional<int64_t>* out) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || jsonlite::is_null(*v)) {
    if (required) return config_error(key + " is required");
    *out = std::nullopt;
    return std::nullopt;
  }
  const auto* s = std::get_if<std::string>(&v->v);
  if (!s) return config_error(key + " must be a YYYY-MM-DD string");
  auto day = timeutil::parse_date(*s);
  if (!day) return config_error(key + " is not a valid date: " + *s);
  *out = *day;
  return std::nullopt;
}

TariffDefinition parse_tariff_row(const jsonlite::Object& row, std::optional<Error>* error) {
  TariffDefinition t;

  const jsonlite::Value* id = jsonlite::find(row, "id");
  auto id_num = id ? jsonlite::as_u64(*id) : std::nullopt;
  if (!id_num || *id_num == 0 || *id_num > static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) {
    *error = config_error("tariff id must be a positive integer");
    return {};
  }
  t.id = static_cast<int64_t>(*id_num);
  const std::string ctx = "tariff " + std::to_string(t.id) + ": ";

  t.name = jsonlite::get_string(row, "name");
  if (t.name.empty()) {
    *error = config_error(ctx + "name is required");
    return {};
  }
  t.utility = jsonlite::get_string(row, "utility");
  t.co2_factor_kg_per_kwh = jsonlite::get_double(row, "co2_factor_kg_per_kwh", -1.0);

  std::optional<int64_t> eff;
  if (auto e = read_day(row, "effective_date", true, &eff)) {
    *error = config_error(ctx + e->message);
    return {};
  }
  t.effective_day = *eff;
  if (auto e = read_day(row, "end_date", false, &t.end_day)) {
    *error = config_error(ctx + e->message);
    return {};
  }

  const jsonlite::Object* structure = jsonlite::get_object(row, "structure");
  if (!structure) {
    *error = config_error(ctx + "structure is required");
    return {};
  }
  t.fixed_charge_monthly = jsonlite::get_double(*structure, "fixed_charge_monthly", 0.0);

  const jsonlite::Array* charges = jsonlite::get_array(*structure, "energy_charges");
  if (!charges || charges->empty()) {
    *error = config_error(ctx + "structure.energy_charges must be a non-empty array");
    return {};
  }
  for (std::size_t i = 0; i < charges->size(); ++i) {
    const auto* charge = std::get_if<jsonlite::Object>(&(*charges)[i].v);
    if (!charge) {
      *error = config_error(ctx + "energy_charges[" + std::to_string(i) + "] must be an object");
      return {};
    }
    // "tier" is optional but, when present, must match the position.
    if (const jsonlite::Value* tier_no = jsonlite::find(*charge, "tier")) {
      auto n = jsonlite::as_u64(*tier_no);
      if (!n || *n != i + 1) {
        *error = config_error(ctx + "energy_charges[" + std::to_string(i) + "].tier must be " +
                              std::to_string(i + 1));
        return {};
      }
    }
    Tier tier;
    const jsonlite::Value* limit = jsonlite::find(*charge, "limit_kwh");
    if (limit && !jsonlite::is_null(*limit)) {
      auto d = jsonlite::as_double(*limit);
      if (!d) {
        *error = config_error(ctx + "energy_charges[" + std::to_string(i) + "].limit_kwh must be a number or null");
        return {};
      }
      tier.limit_kwh = *d;
    }
    if (auto e = read_rates(*charge, "summer", i, &tier.rates[static_cast<std::size_t>(Season::summer)])) {
      *error = config_error(ctx + e->message);
      return {};
    }
    if (auto e = read_rates(*charge, "winter", i, &tier.rates[static_cast<std::size_t>(Season::winter)])) {
      *error = config_error(ctx + e->message);
      return {};
    }
    t.tiers.push_back(tier);
  }

  const jsonlite::Object* tou = jsonlite::get_object(*structure, "tou_schedule");
  if (!tou) {
    *error = config_error(ctx + "structure.tou_schedule is required");
    return {};
  }
  const jsonlite::Array* months = jsonlite::get_array(*tou, "summer_months");
  if (!months) {
    *error = config_error(ctx + "tou_schedule.summer_months must be an array");
    return {};
  }
  for (const auto& v : *months) {
    auto m = jsonlite::as_u64(v);
    if (!m || *m < 1 || *m > 12) {
      *error = config_error(ctx + "tou_schedule.summer_months contains a month outside 1..12");
      return {};
    }
    t.schedule.summer_months.set(*m);
  }

  bool present = false;
  if (auto e = read_hours(*tou, "peak_hours", true, &t.schedule.peak_hours, &present)) {
    *error = config_error(ctx + e->message);
    return {};
  }
  if (auto e = read_hours(*tou, "partial_peak_hours", true, &t.schedule.partial_peak_hours, &present)) {
    *error = config_error(ctx + e->message);
    return {};
  }
  std::bitset<kHoursPerDay> off;
  if (auto e = read_hours(*tou, "off_peak_hours", false, &off, &present)) {
    *error = config_error(ctx + e->message);
    return {};
  }
  if (present) t.schedule.off_peak_hours = off;

  if (auto e = validate_tariff(t)) {
    *error = config_error(ctx + e->message);
    return {};
  }
  return t;
}

}  // namespace

// ---------------------------------------------------------------------------
// Schedule
// ---------------------------------------------------------------------------

Season TouSchedule::season_for_month(unsigned month) const {
  return (month >= 1 && month <= 12 && summer_months.test(month)) ? Season::summer : Season::winter;
}

TouPeriod TouSchedule::period_for_hour(unsigned hour) const {
  if (hour < kHoursPerDay && peak_hours.test(hour)) return TouPeriod::peak;
  if (hour < kHoursPerDay && partial_peak_hours.test(hour)) return TouPeriod::partial_peak;
  return TouPeriod::off_peak;
}

std::optional<Error> validate_schedule(const TouSchedule& schedule) {
  const auto overlap = schedule.peak_hours & schedule.partial_peak_hours;
  if (overlap.any()) {
    return config_error("tou_schedule: peak and partial_peak overlap (" + hours_to_json(overlap) + ")");
  }
  const auto complement = ~(schedule.peak_hours | schedule.partial_peak_hours);
  if (schedule.off_peak_hours && *schedule.off_peak_hours != complement) {
    const auto listed = *schedule.off_peak_hours;
    if ((listed & ~complement).any()) {
      return config_error("tou_schedule: off_peak overlaps peak/partial_peak (" +
                          hours_to_json(listed & ~complement) + ")");
    }
    return config_error("tou_schedule: hours not covered by any period (" +
                        hours_to_json(complement & ~listed) + ")");
  }
  if (schedule.summer_months.test(0)) {
    return config_error("tou_schedule: summer_months contains month 0");
  }
  return std::nullopt;
}

std::optional<Error> validate_tariff(const TariffDefinition& tariff) {
  if (tariff.tiers.empty()) return config_error("tariff has no tiers");
  for (std::size_t i = 0; i < tariff.tiers.size(); ++i) {
    const Tier& tier = tariff.tiers[i];
    if (!tier.limit_kwh) {
      if (i + 1 != tariff.tiers.size()) {
        return config_error("unbounded tier " + std::to_string(i + 1) + " must be the last tier");
      }
    } else {
      if (!std::isfinite(*tier.limit_kwh) || *tier.limit_kwh <= 0.0) {
        return config_error("tier " + std::to_string(i + 1) + " limit must be positive");
      }
      if (i > 0 && tariff.tiers[i - 1].limit_kwh && *tier.limit_kwh <= *tariff.tiers[i - 1].limit_kwh) {
        return config_error("tier limits must be strictly ascending (tier " + std::to_string(i + 1) + ")");
      }
    }
    for (std::size_t s = 0; s < kSeasonCount; ++s) {
      for (std::size_t p = 0; p < kPeriodCount; ++p) {
        const double r = tier.rates[s][p];
        if (!std::isfinite(r) || r < 0.0) {
          return config_error("tier " + std::to_string(i + 1) + " " +
                              to_string(static_cast<Season>(s)) + "." + kPeriodKeys[p] +
                              " rate must be a non-negative number");
        }
      }
    }
  }
  if (!std::isfinite(tariff.fixed_charge_monthly) || tariff.fixed_charge_monthly < 0.0) {
    return config_error("fixed_charge_monthly must be non-negative");
  }
  if (!std::isfinite(tariff.co2_factor_kg_per_kwh) || tariff.co2_factor_kg_per_kwh < 0.0) {
    return config_error("co2_factor_kg_per_kwh must be a non-negative number");
  }
  if (tariff.end_day && *tariff.end_day <= tariff.effective_day) {
    return config_error("end_date must be after effective_date");
  }
  return validate_schedule(tariff.schedule);
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

std::size_t tier_for(const TariffDefinition& tariff, double month_to_date_kwh) {
  for (std::size_t i = 0; i < tariff.tiers.size(); ++i) {
    const Tier& tier = tariff.tiers[i];
    if (!tier.limit_kwh || *tier.limit_kwh > month_to_date_kwh) return i;
  }
  return tariff.tiers.empty() ? 0 : tariff.tiers.size() - 1;
}

Resolution resolve(int64_t ts_ms, int utc_offset_minutes, const TariffDefinition& tariff,
                   double month_to_date_kwh, std::optional<Error>* error) {
  if (auto e = validate_tariff(tariff)) {
    if (error) *error = e;
    return {};
  }
  const timeutil::LocalTime local = timeutil::to_local(ts_ms, utc_offset_minutes);
  Resolution r;
  r.season     = tariff.schedule.season_for_month(local.month);
  r.period     = tariff.schedule.period_for_hour(local.hour);
  r.tier_index = tier_for(tariff, month_to_date_kwh);
  r.rate       = tariff.tiers[r.tier_index].rate(r.season, r.period);
  return r;
}

// ---------------------------------------------------------------------------
// Proration
// ---------------------------------------------------------------------------

std::vector<TierPortion> split_across_tiers(const TariffDefinition& tariff,
                                            double mtd_before_kwh, double kwh) {
  std::vector<TierPortion> out;
  if (!(kwh > 0.0) || tariff.tiers.empty()) return out;

  double running = std::max(0.0, mtd_before_kwh);
  double remaining = kwh;
  const std::size_t last = tariff.tiers.size() - 1;
  for (std::size_t i = tier_for(tariff, running); i <= last && remaining > 0.0; ++i) {
    const Tier& tier = tariff.tiers[i];
    double take = remaining;
    if (i != last && tier.limit_kwh) {
      take = std::min(remaining, *tier.limit_kwh - running);
      if (take <= 0.0) continue;
    }
    out.push_back(TierPortion{i, take});
    running += take;
    remaining -= take;
  }
  return out;
}

double price_energy(const TariffDefinition& tariff, Season season, TouPeriod period,
                    double mtd_before_kwh, double kwh) {
  double cost = 0.0;
  for (const auto& portion : split_across_tiers(tariff, mtd_before_kwh, kwh)) {
    cost += portion.kwh * tariff.tiers[portion.tier_index].rate(season, period);
  }
  return cost;
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

std::vector<TariffDefinition> parse_tariff_file(const std::string& text, std::optional<Error>* error) {
  std::optional<jsonlite::JsonError> json_err;
  auto root = jsonlite::parse(text, &json_err);
  if (json_err) {
    *error = config_error("tariff file: " + json_err->code + ": " + json_err->message);
    return {};
  }
  const jsonlite::Array* rows = jsonlite::get_array(root, "tariffs");
  if (!rows) {
    *error = config_error("tariff file: \"tariffs\" array is required");
    return {};
  }
  std::vector<TariffDefinition> out;
  out.reserve(rows->size());
  for (std::size_t i = 0; i < rows->size(); ++i) {
    const auto* row = std::get_if<jsonlite::Object>(&(*rows)[i].v);
    if (!row) {
      *error = config_error("tariff file: tariffs[" + std::to_string(i) + "] must be an object");
      return {};
    }
    std::optional<Error> row_err;
    auto t = parse_tariff_row(*row, &row_err);
    if (row_err) {
      *error = row_err;
      return {};
    }
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<TariffDefinition> load_tariff_file(const std::string& path, std::optional<Error>* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    *error = config_error("cannot open tariff file: " + path);
    return {};
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_tariff_file(ss.str(), error);
}

std::string tariff_to_json(const TariffDefinition& t) {
  std::ostringstream o;
  o << "{\"id\":" << t.id
    << ",\"name\":\"" << jsonlite::escape(t.name) << "\""
    << ",\"utility\":\"" << jsonlite::escape(t.utility) << "\""
    << ",\"effective_date\":\"" << timeutil::format_date(t.effective_day) << "\""
    << ",\"end_date\":";
  if (t.end_day) {
    o << "\"" << timeutil::format_date(*t.end_day) << "\"";
  } else {
    o << "null";
  }
  o << ",\"co2_factor_kg_per_kwh\":" << jsonlite::format_double(t.co2_factor_kg_per_kwh)
    << ",\"fixed_charge_monthly\":" << jsonlite::format_double(t.fixed_charge_monthly)
    << ",\"tiers\":[";
  for (std::size_t i = 0; i < t.tiers.size(); ++i) {
    if (i) o << ",";
    const Tier& tier = t.tiers[i];
    o << "{\"limit_kwh\":";
    if (tier.limit_kwh) {
      o << jsonlite::format_double(*tier.limit_kwh);
    } else {
      o << "null";
    }
    for (std::size_t s = 0; s < kSeasonCount; ++s) {
      o << ",\"" << to_string(static_cast<Season>(s)) << "\":{";
      for (std::size_t p = 0; p < kPeriodCount; ++p) {
        if (p) o << ",";
        o << "\"" << kPeriodKeys[p] << "\":" << jsonlite::format_double(tier.rates[s][p]);
      }
      o << "}";
    }
    o << "}";
  }
  o << "],\"peak_hours\":" << hours_to_json(t.schedule.peak_hours)
    << ",\"partial_peak_hours\":" << hours_to_json(t.schedule.partial_peak_hours)
    << ",\"off_peak_hours\":" << hours_to_json(~(t.schedule.peak_hours | t.schedule.partial_peak_hours))
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// TariffRegistry
// ---------------------------------------------------------------------------

TariffRegistry TariffRegistry::build(std::vector<TariffDefinition> rows, std::optional<Error>* error) {
  TariffRegistry reg;
  std::set<int64_t> seen_ids;
  for (const auto& row : rows) {
    if (seen_ids.contains(row.id)) {
      *error = config_error("duplicate tariff id " + std::to_string(row.id));
      return {};
    }
    seen_ids.insert(row.id);
    if (auto e = validate_tariff(row)) {
      *error = config_error("tariff " + std::to_string(row.id) + ": " + e->message);
      return {};
    }
  }

  reg.rows_ = std::move(rows);
  for (std::size_t i = 0; i < reg.rows_.size(); ++i) {
    reg.by_name_[reg.rows_[i].name].push_back(i);
  }
  for (auto& [name, idx] : reg.by_name_) {
    std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
      return reg.rows_[a].effective_day < reg.rows_[b].effective_day;
    });
    for (std::size_t k = 1; k < idx.size(); ++k) {
      const TariffDefinition& prev = reg.rows_[idx[k - 1]];
      const TariffDefinition& cur  = reg.rows_[idx[k]];
      if (!prev.end_day || *prev.end_day > cur.effective_day) {
        *error = config_error("tariff \"" + name + "\": rows " + std::to_string(prev.id) + " and " +
                              std::to_string(cur.id) + " have overlapping effective ranges");
        return {};
      }
    }
  }
  return reg;
}

const TariffDefinition* TariffRegistry::active_for(const std::string& name, int64_t local_day,
                                                   std::optional<Error>* error) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    if (error) *error = make_error(ErrorCode::lookup_error, "unknown tariff \"" + name + "\"");
    return nullptr;
  }
  for (std::size_t idx : it->second) {
    if (rows_[idx].active_on(local_day)) return &rows_[idx];
  }
  if (error) {
    *error = make_error(ErrorCode::lookup_error, "no row of tariff \"" + name + "\" is active on " +
                                                     timeutil::format_date(local_day));
  }
  return nullptr;
}

}  // namespace oikos
