// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/default_enum_inspect.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// Classifies catalog entries. Informational only.
enum class material_category : uint8_t {
  raw_material,
  packaging,
  chemical,
  component,
  other,
};

/// @relates material_category
std::string to_string(material_category);

/// @relates material_category
bool from_string(std::string_view, material_category&);

/// @relates material_category
bool from_integer(uint8_t, material_category&);

/// @relates material_category
template <class Inspector>
bool inspect(Inspector& f, material_category& x) {
  return caf::default_enum_inspect(f, x);
}

/// A catalog entry for a raw material. Only the ledger may change
/// `current_quantity` after registering the item.
struct item {
  int32_t id = 0;
  std::string name;
  std::string sku;
  material_category category = material_category::raw_material;
  /// Unit symbol such as "kg", "L" or "pc". Not restricted to a fixed set.
  std::string unit = "pc";
  double current_quantity = 0;
  double min_quantity = 0;
  /// Opaque reference to the supplier of this item.
  std::optional<std::string> supplier;
  /// Opaque reference to the warehouse that stores this item.
  std::optional<std::string> warehouse;
};

/// Checks whether `x` is a well-formed catalog entry.
bool valid(const item& x) noexcept;

template <class Inspector>
bool inspect(Inspector& f, item& x) {
  return f.object(x).fields(
    f.field("id", x.id).fallback(int32_t{0}), f.field("name", x.name),
    f.field("sku", x.sku),
    f.field("category", x.category).fallback(material_category::raw_material),
    f.field("unit", x.unit), f.field("current_quantity", x.current_quantity),
    f.field("min_quantity", x.min_quantity), f.field("supplier", x.supplier),
    f.field("warehouse", x.warehouse));
}
