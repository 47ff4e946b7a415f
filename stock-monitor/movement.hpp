// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "iso8601.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/timestamp.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Selects how a movement changes the quantity of an item.
enum class movement_kind : uint8_t {
  /// Adds the quantity of the movement.
  in,
  /// Removes the quantity of the movement, never going below zero.
  out,
  /// Sets the quantity to an absolute value (stocktake correction).
  adjustment,
};

/// @relates movement_kind
std::string to_string(movement_kind);

/// Parses a movement kind. Also accepts "adjust" as written by the desktop
/// tool.
/// @relates movement_kind
bool from_string(std::string_view, movement_kind&);

/// @relates movement_kind
bool from_integer(uint8_t, movement_kind&);

/// @relates movement_kind
template <class Inspector>
bool inspect(Inspector& f, movement_kind& x) {
  return caf::default_enum_inspect(f, x);
}

/// An immutable record in the ledger. The ledger assigns `id` and `timestamp`
/// when appending the movement.
struct movement {
  int64_t id = 0;
  int32_t item_id = 0;
  movement_kind kind = movement_kind::in;
  double quantity = 0;
  std::optional<int32_t> actor_id;
  std::optional<std::string> note;
  caf::timestamp timestamp;
};

/// Timestamps use the ISO 8601 format of the desktop tool, which omits the
/// fraction for full seconds and may come without offset.
template <class Inspector>
bool inspect(Inspector& f, movement& x) {
  auto get_timestamp = [&x] { return to_iso8601(x.timestamp); };
  auto set_timestamp = [&x](std::string str) {
    return from_iso8601(str, x.timestamp);
  };
  return f.object(x).fields(f.field("id", x.id),
                            f.field("item_id", x.item_id),
                            f.field("quantity", x.quantity),
                            f.field("movement_type", x.kind),
                            f.field("user_id", x.actor_id),
                            f.field("notes", x.note),
                            f.field("timestamp", get_timestamp, set_timestamp));
}

/// A request for applying a movement, as submitted by a caller.
struct movement_request {
  int32_t item_id = 0;
  movement_kind kind = movement_kind::in;
  double quantity = 0;
  std::optional<int32_t> actor_id;
  std::optional<std::string> note;
};

template <class Inspector>
bool inspect(Inspector& f, movement_request& x) {
  return f.object(x).fields(f.field("item_id", x.item_id),
                            f.field("movement_type", x.kind),
                            f.field("quantity", x.quantity),
                            f.field("user_id", x.actor_id),
                            f.field("notes", x.note));
}

/// Checks whether `quantity` is acceptable for a movement of given kind:
/// strictly positive for `in` and `out`, non-negative for `adjustment`.
bool valid_quantity(movement_kind kind, double quantity) noexcept;

/// Computes the quantity after applying a movement to `current`.
/// @pre `valid_quantity(kind, quantity)`
double apply_movement(double current, movement_kind kind,
                      double quantity) noexcept;

/// Recomputes a quantity by applying all movements in order.
double replay(const std::vector<movement>& history, double initial = 0);
