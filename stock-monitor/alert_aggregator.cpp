// (c) 2024, Interance GmbH & Co KG.

#include "alert_aggregator.hpp"

namespace {

bool matches(const std::optional<std::string>& filter,
             const std::optional<std::string>& value) {
  return !filter || filter == value;
}

} // namespace

std::vector<stock_alert> collect_alerts(const std::vector<item>& items,
                                        const alert_filter& filter,
                                        double warning_factor) {
  std::vector<stock_alert> result;
  for (const auto& x : items) {
    if (!matches(filter.supplier, x.supplier)
        || !matches(filter.warehouse, x.warehouse))
      continue;
    auto status = classify(x.current_quantity, x.min_quantity, warning_factor);
    auto selected = filter.status ? status == *filter.status
                                  : status != stock_status::normal;
    if (selected)
      result.push_back(stock_alert{x, status});
  }
  return result;
}
