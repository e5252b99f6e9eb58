#include "oikos/home.hpp"

namespace oikos {

namespace {

constexpr int kMaxOffsetMinutes = 14 * 60;
const std::string kEmpty;
const CategorySet kNoCategories;

}  // namespace

HomeContext::HomeContext(HomeConfig config, std::shared_ptr<const CategorySet> categories,
                         int64_t future_skew_ms, timeutil::Clock clock, EngineStats* stats)
    : config_(std::move(config)),
      accumulator_(config_.id, config_.utc_offset_minutes, std::move(categories), future_skew_ms,
                   std::move(clock), stats) {}

std::optional<BillingSnapshot> HomeContext::latest() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_;
}

void HomeContext::set_latest(BillingSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mu_);
  // A slow computation for an older tick never replaces a newer result.
  if (latest_ && latest_->timestamp_ms > snapshot.timestamp_ms) return;
  latest_ = std::move(snapshot);
}

std::optional<int64_t> HomeContext::exchange_tick_day(int64_t local_day) {
  std::lock_guard<std::mutex> lock(mu_);
  auto prev = last_tick_day_;
  last_tick_day_ = local_day;
  return prev;
}

std::optional<Error> validate_home_config(const HomeConfig& home) {
  if (!valid_identifier(home.id)) {
    return make_error(ErrorCode::config_error,
                      "home id \"" + home.id + "\" must be 1..64 chars of [A-Za-z0-9_-]");
  }
  if (home.tariff_name.empty()) {
    return make_error(ErrorCode::config_error, "home " + home.id + ": tariff is required");
  }
  if (home.utc_offset_minutes % 15 != 0 || home.utc_offset_minutes < -kMaxOffsetMinutes ||
      home.utc_offset_minutes > kMaxOffsetMinutes) {
    return make_error(ErrorCode::config_error,
                      "home " + home.id + ": utc_offset_minutes must be a multiple of 15 within +/-840");
  }
  return std::nullopt;
}

HomeRegistry HomeRegistry::build(const std::vector<HomeConfig>& homes, CategorySet categories,
                                 int64_t future_skew_ms, timeutil::Clock clock, EngineStats* stats,
                                 std::optional<Error>* error) {
  HomeRegistry reg;
  if (categories.empty()) {
    *error = make_error(ErrorCode::config_error, "device category set is empty");
    return {};
  }
  for (const auto& c : categories) {
    if (!valid_identifier(c)) {
      *error = make_error(ErrorCode::config_error, "device category \"" + c + "\" is not a valid identifier");
      return {};
    }
  }
  reg.categories_ = std::make_shared<const CategorySet>(std::move(categories));

  for (const auto& home : homes) {
    if (auto e = validate_home_config(home)) {
      *error = e;
      return {};
    }
    if (reg.by_id_.contains(home.id)) {
      *error = make_error(ErrorCode::config_error, "duplicate home id " + home.id);
      return {};
    }
    auto ctx = std::make_unique<HomeContext>(home, reg.categories_, future_skew_ms, clock, stats);
    reg.order_.push_back(ctx.get());
    reg.by_id_.emplace(home.id, std::move(ctx));
  }
  return reg;
}

HomeContext* HomeRegistry::find(const std::string& home_id, std::optional<Error>* error) const {
  auto it = by_id_.find(home_id);
  if (it == by_id_.end()) {
    if (error) *error = make_error(ErrorCode::lookup_error, "unknown home \"" + home_id + "\"");
    return nullptr;
  }
  return it->second.get();
}

const std::string& HomeRegistry::default_home_id() const {
  return order_.empty() ? kEmpty : order_.front()->id();
}

const CategorySet& HomeRegistry::categories() const {
  return categories_ ? *categories_ : kNoCategories;
}

}  // namespace oikos
