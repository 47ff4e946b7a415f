// (c) 2024, Interance GmbH & Co KG.

#include "item.hpp"

#include <cmath>
#include <iterator>

namespace {

constexpr std::string_view category_names[] = {
  "raw_material", "packaging", "chemical", "component", "other",
};

template <class Enum, size_t N>
bool parse_enum(const std::string_view (&names)[N], std::string_view name,
                Enum& x) {
  for (size_t i = 0; i < N; ++i) {
    if (name == names[i]) {
      x = static_cast<Enum>(i);
      return true;
    }
  }
  return false;
}

template <class Enum, size_t N>
bool enum_from_integer(const std::string_view (&)[N], uint8_t value,
                       Enum& x) {
  if (value < N) {
    x = static_cast<Enum>(value);
    return true;
  }
  return false;
}

bool valid_quantity(double x) noexcept {
  return std::isfinite(x) && x >= 0;
}

} // namespace

std::string to_string(material_category x) {
  return std::string{category_names[static_cast<uint8_t>(x)]};
}

bool from_string(std::string_view name, material_category& x) {
  return parse_enum(category_names, name, x);
}

bool from_integer(uint8_t value, material_category& x) {
  return enum_from_integer(category_names, value, x);
}

bool valid(const item& x) noexcept {
  return x.id >= 0 && !x.name.empty() && !x.sku.empty()
         && valid_quantity(x.current_quantity)
         && valid_quantity(x.min_quantity);
}
