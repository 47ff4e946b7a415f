// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "item.hpp"
#include "movement.hpp"

#include <caf/timespan.hpp>
#include <caf/timestamp.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/// Default length of the trailing window for computing the daily usage.
constexpr int32_t default_lookback_days = 30;

/// Upper bound for lookback windows.
constexpr int32_t max_lookback_days = 36'500;

/// Distance of the fallback date for items without measurable consumption.
constexpr auto no_usage_horizon = std::chrono::hours{24 * 30};

/// Estimated depletion date for an item.
struct shortage_prediction {
  int32_t item_id = 0;
  std::string item_name;
  double current_quantity = 0;
  double avg_daily_usage = 0;
  caf::timestamp shortage_date;
  /// False if the item had no consumption. The date is then only a sentinel
  /// that is `no_usage_horizon` ahead of the time of the prediction.
  bool reliable = false;
};

template <class Inspector>
bool inspect(Inspector& f, shortage_prediction& x) {
  auto get_date = [&x] { return to_iso8601(x.shortage_date); };
  auto set_date = [&x](std::string str) {
    return from_iso8601(str, x.shortage_date);
  };
  return f.object(x).fields(f.field("item_id", x.item_id),
                            f.field("item_name", x.item_name),
                            f.field("current_quantity", x.current_quantity),
                            f.field("avg_daily_usage", x.avg_daily_usage),
                            f.field("predicted_shortage_date", get_date, set_date),
                            f.field("reliable", x.reliable));
}

/// Computes the average daily consumption, i.e., the sum of all outgoing
/// quantities in the window `[now - lookback_days, now]` divided by
/// `lookback_days`.
/// @pre `0 < lookback_days <= max_lookback_days`
double average_daily_usage(const std::vector<movement>& history,
                           caf::timestamp now, int32_t lookback_days);

/// Returns the start of the lookback window that ends at `now`.
caf::timestamp lookback_start(caf::timestamp now, int32_t lookback_days);

/// Extrapolates when `subject` runs out of stock if it keeps being consumed at
/// `avg_daily_usage` units per day. Never returns a date before `now`.
shortage_prediction predict_shortage(const item& subject,
                                     double avg_daily_usage,
                                     caf::timestamp now);
