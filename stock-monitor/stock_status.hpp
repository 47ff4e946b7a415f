// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/default_enum_inspect.hpp>

#include <cstdint>
#include <string>
#include <string_view>

/// Traffic-light status of an item. Serialized as "green", "yellow" and
/// "red".
enum class stock_status : uint8_t {
  normal,
  warning,
  critical,
};

/// @relates stock_status
std::string to_string(stock_status);

/// @relates stock_status
bool from_string(std::string_view, stock_status&);

/// @relates stock_status
bool from_integer(uint8_t, stock_status&);

/// @relates stock_status
template <class Inspector>
bool inspect(Inspector& f, stock_status& x) {
  return caf::default_enum_inspect(f, x);
}

/// Items at or below `min_quantity * default_warning_factor` are in `warning`
/// state.
constexpr double default_warning_factor = 1.5;

/// Derives the status for the given quantities.
stock_status classify(double current_quantity, double min_quantity,
                      double warning_factor = default_warning_factor) noexcept;
