// (c) 2024, Interance GmbH & Co KG.

#include "stock_status.hpp"

#include <iterator>

namespace {

constexpr std::string_view status_names[] = {
  "green",
  "yellow",
  "red",
};

} // namespace

std::string to_string(stock_status x) {
  return std::string{status_names[static_cast<uint8_t>(x)]};
}

bool from_string(std::string_view name, stock_status& x) {
  for (size_t i = 0; i < std::size(status_names); ++i) {
    if (name == status_names[i]) {
      x = static_cast<stock_status>(i);
      return true;
    }
  }
  return false;
}

bool from_integer(uint8_t value, stock_status& x) {
  if (value < std::size(status_names)) {
    x = static_cast<stock_status>(value);
    return true;
  }
  return false;
}

stock_status classify(double current_quantity, double min_quantity,
                      double warning_factor) noexcept {
  if (current_quantity <= 0)
    return stock_status::critical;
  if (current_quantity <= min_quantity * warning_factor)
    return stock_status::warning;
  return stock_status::normal;
}
