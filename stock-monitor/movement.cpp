// (c) 2024, Interance GmbH & Co KG.

#include "movement.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace {

constexpr std::string_view kind_names[] = {
  "in",
  "out",
  "adjustment",
};

} // namespace

std::string to_string(movement_kind x) {
  return std::string{kind_names[static_cast<uint8_t>(x)]};
}

bool from_string(std::string_view name, movement_kind& x) {
  for (size_t i = 0; i < std::size(kind_names); ++i) {
    if (name == kind_names[i]) {
      x = static_cast<movement_kind>(i);
      return true;
    }
  }
  if (name == "adjust") {
    x = movement_kind::adjustment;
    return true;
  }
  return false;
}

bool from_integer(uint8_t value, movement_kind& x) {
  if (value < std::size(kind_names)) {
    x = static_cast<movement_kind>(value);
    return true;
  }
  return false;
}

bool valid_quantity(movement_kind kind, double quantity) noexcept {
  if (!std::isfinite(quantity))
    return false;
  if (kind == movement_kind::adjustment)
    return quantity >= 0;
  return quantity > 0;
}

double apply_movement(double current, movement_kind kind,
                      double quantity) noexcept {
  switch (kind) {
    case movement_kind::in:
      return current + quantity;
    case movement_kind::out:
      return std::max(0.0, current - quantity);
    default: // adjustment
      return quantity;
  }
}

double replay(const std::vector<movement>& history, double initial) {
  auto result = initial;
  for (const auto& x : history)
    result = apply_movement(result, x.kind, x.quantity);
  return result;
}
