// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "alert_aggregator.hpp"
#include "item.hpp"
#include "movement.hpp"
#include "shortage_predictor.hpp"
#include "stock_status.hpp"
#include "storage.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timestamp.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/// Policy settings for the ledger and the values it derives.
struct ledger_config {
  /// Multiplier for `min_quantity` that marks the upper bound of the warning
  /// range.
  double warning_factor = default_warning_factor;
  /// Trailing window for computing the average daily usage.
  int32_t lookback_days = default_lookback_days;
  /// Rejects outgoing movements that exceed the current quantity instead of
  /// clamping the quantity to zero.
  bool reject_overdraw = false;
};

/// The single writer for item quantities. Each applied movement updates the
/// quantity of its item and lands in the append-only movement log within one
/// storage transaction. Movements for the same item are serialized, while
/// movements for different items may run in parallel.
class ledger {
public:
  /// Returns the current time.
  using clock_fn = std::function<caf::timestamp()>;

  explicit ledger(storage_ptr store, ledger_config cfg = {},
                  clock_fn clock = caf::make_timestamp);

  ledger(const ledger&) = delete;

  ledger& operator=(const ledger&) = delete;

  /// Reads the append position from the storage. Must be called once before
  /// applying any movement.
  [[nodiscard]] caf::error init();

  /// Adds an item to the catalog. A positive `current_quantity` becomes the
  /// opening stock of the item and is recorded as an adjustment. Either both
  /// the item and its opening stock are stored or neither.
  /// @returns the registered item with its assigned ID.
  caf::expected<item> register_item(item new_item,
                                    std::optional<int32_t> actor_id
                                    = std::nullopt);

  /// Applies a movement to its item.
  /// @returns the appended movement or one of `ec::invalid_quantity`,
  ///          `ec::no_such_item`, `ec::insufficient_stock` or
  ///          `ec::storage_unavailable`.
  caf::expected<movement> apply(const movement_request& req);

  /// @copydoc apply
  caf::expected<movement> apply(int32_t item_id, movement_kind kind,
                                double quantity,
                                std::optional<int32_t> actor_id = std::nullopt,
                                std::optional<std::string> note
                                = std::nullopt);

  /// Retrieves an item.
  caf::expected<item> find(int32_t item_id);

  /// Retrieves all items in ascending order of their ID.
  caf::expected<std::vector<item>> items();

  /// Retrieves all movements for an item, oldest first.
  caf::expected<std::vector<movement>> history(int32_t item_id);

  /// Retrieves all movements for an item since the given point in time,
  /// oldest first.
  caf::expected<std::vector<movement>> list_recent(int32_t item_id,
                                                   caf::timestamp since);

  /// Classifies the current quantity of an item.
  caf::expected<stock_status> get_status(int32_t item_id);

  /// Classifies all items and selects the ones matching `filter`.
  caf::expected<std::vector<stock_alert>>
  list_alerts(const alert_filter& filter = {});

  /// Predicts the shortage date of an item based on the outgoing movements in
  /// the configured lookback window.
  caf::expected<shortage_prediction> predict_shortage(int32_t item_id);

  /// Predicts the shortage date of an item based on the outgoing movements in
  /// the last `lookback_days` days.
  caf::expected<shortage_prediction> predict_shortage(int32_t item_id,
                                                      int32_t lookback_days);

  /// Predicts the shortage date of an item for a caller-provided consumption
  /// rate.
  caf::expected<shortage_prediction> estimate_shortage(int32_t item_id,
                                                       double avg_daily_usage);

  /// Predicts the shortage dates for all items.
  caf::expected<std::vector<shortage_prediction>>
  predict_all(int32_t lookback_days);

  /// Recomputes the quantity of an item from its movement history.
  caf::expected<double> replay(int32_t item_id);

  const ledger_config& config() const noexcept {
    return cfg_;
  }

private:
  /// Returns the mutex that serializes all movements for an item.
  std::mutex& item_mutex(int32_t item_id);

  /// Assigns ID and timestamp to the next movement.
  void stamp(movement& x);

  caf::expected<shortage_prediction> predict(int32_t item_id,
                                             int32_t lookback_days,
                                             caf::timestamp now);

  storage_ptr store_;
  ledger_config cfg_;
  clock_fn clock_;

  /// Serializes movements per item. Items share a mutex if their IDs map to
  /// the same stripe.
  std::array<std::mutex, 64> item_mutexes_;

  /// Guards the append position.
  std::mutex position_mtx_;
  ledger_position position_;
};

/// A smart pointer to a ledger.
using ledger_ptr = std::shared_ptr<ledger>;
