// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "item.hpp"
#include "stock_status.hpp"

#include <optional>
#include <string>
#include <vector>

/// Restricts the set of alerts. All present filters must match.
struct alert_filter {
  /// Selects items with exactly this status. Without this filter, only items
  /// with a non-normal status are selected.
  std::optional<stock_status> status;
  std::optional<std::string> supplier;
  std::optional<std::string> warehouse;
};

template <class Inspector>
bool inspect(Inspector& f, alert_filter& x) {
  return f.object(x).fields(f.field("status", x.status),
                            f.field("supplier", x.supplier),
                            f.field("warehouse", x.warehouse));
}

/// An item together with its current status.
struct stock_alert {
  item subject;
  stock_status status = stock_status::normal;
};

template <class Inspector>
bool inspect(Inspector& f, stock_alert& x) {
  return f.object(x).fields(f.field("item", x.subject),
                            f.field("status", x.status));
}

/// Classifies all `items` and returns the ones selected by `filter`, keeping
/// the order of `items`.
std::vector<stock_alert>
collect_alerts(const std::vector<item>& items, const alert_filter& filter,
               double warning_factor = default_warning_factor);
