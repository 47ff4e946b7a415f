// (c) 2024, Interance GmbH & Co KG.

#include "shortage_predictor.hpp"

#include <ratio>

namespace {

using fractional_days = std::chrono::duration<double, std::ratio<86'400>>;

// Saturates at the largest representable timestamp for slow movers.
caf::timestamp advance(caf::timestamp now, double days) {
  auto limit = caf::timestamp::max();
  auto headroom = std::chrono::duration_cast<fractional_days>(limit - now);
  if (days >= headroom.count())
    return limit;
  return now
         + std::chrono::duration_cast<caf::timespan>(fractional_days{days});
}

} // namespace

caf::timestamp lookback_start(caf::timestamp now, int32_t lookback_days) {
  return now - std::chrono::hours{24} * lookback_days;
}

double average_daily_usage(const std::vector<movement>& history,
                           caf::timestamp now, int32_t lookback_days) {
  auto since = lookback_start(now, lookback_days);
  auto total = 0.0;
  for (const auto& x : history) {
    if (x.kind == movement_kind::out && x.timestamp >= since
        && x.timestamp <= now)
      total += x.quantity;
  }
  return total / lookback_days;
}

shortage_prediction predict_shortage(const item& subject,
                                     double avg_daily_usage,
                                     caf::timestamp now) {
  shortage_prediction result;
  result.item_id = subject.id;
  result.item_name = subject.name;
  result.current_quantity = subject.current_quantity;
  result.avg_daily_usage = avg_daily_usage;
  // Note: also catches NaN.
  if (!(avg_daily_usage > 0)) {
    result.shortage_date = now + no_usage_horizon;
    return result;
  }
  result.reliable = true;
  if (subject.current_quantity <= 0) {
    result.shortage_date = now;
    return result;
  }
  result.shortage_date = advance(now,
                                 subject.current_quantity / avg_daily_usage);
  return result;
}
