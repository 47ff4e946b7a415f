// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "ec.hpp"
#include "item.hpp"
#include "movement.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/timestamp.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

/// The append position of a ledger: the ID and time of its latest movement.
struct ledger_position {
  int64_t last_id = 0;
  caf::timestamp last_timestamp;
};

/// An item together with (a subset of) its movements, read in one step.
struct item_snapshot {
  item subject;
  std::vector<movement> movements;
};

/// Durable storage for the catalog and the movement log. Implementations must
/// be safe to call from multiple threads and must make each `commit` visible
/// to readers either completely or not at all.
class storage {
public:
  virtual ~storage();

  /// Prepares the storage for use, e.g., by creating missing tables.
  /// @returns `caf::error{}` on success, an error otherwise.
  [[nodiscard]] virtual caf::error open() = 0;

  /// Retrieves the append position of the movement log.
  [[nodiscard]] virtual caf::expected<ledger_position> position() = 0;

  /// Retrieves an item.
  /// @returns the item or `ec::no_such_item` if the ID is unknown.
  [[nodiscard]] virtual caf::expected<item> get(int32_t id) = 0;

  /// Retrieves all items in ascending order of their ID.
  [[nodiscard]] virtual caf::expected<std::vector<item>> items() = 0;

  /// Adds a new item to the catalog. Assigns a fresh ID if `new_item.id` is 0.
  /// When present, `opening` is appended to the movement log for the new item
  /// in the same transaction, with its `item_id` set to the assigned ID.
  /// @returns the ID of the new item or `ec::key_already_exists` if the ID or
  ///          the SKU are already taken.
  [[nodiscard]] virtual caf::expected<int32_t>
  insert(const item& new_item, const std::optional<movement>& opening) = 0;

  /// Stores the new quantity of `updated` and appends `appended` to the
  /// movement log in a single transaction.
  /// @returns `ec::nil` on success, an error code otherwise.
  [[nodiscard]] virtual ec commit(const item& updated,
                                  const movement& appended) = 0;

  /// Retrieves an item together with all of its movements that have a
  /// timestamp of at least `since`, in ascending order of their ID. The
  /// result never contains a movement without its quantity update or vice
  /// versa.
  /// @returns the snapshot or `ec::no_such_item` if the ID is unknown.
  [[nodiscard]] virtual caf::expected<item_snapshot>
  snapshot(int32_t item_id, caf::timestamp since) = 0;
};

/// A smart pointer to a storage.
using storage_ptr = std::shared_ptr<storage>;
