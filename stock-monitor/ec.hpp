// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/default_enum_inspect.hpp>
#include <caf/is_error_code_enum.hpp>

#include <cstdint>
#include <string>
#include <string_view>

/// Application-specific error codes.
enum class ec : uint8_t {
  /// No error occurred.
  nil = 0,
  /// Indicates that an operation referenced an unknown item.
  no_such_item,
  /// Indicates that a key (item ID or SKU) already exists in the catalog.
  key_already_exists,
  /// Indicates that the storage back end failed to read or commit data.
  storage_unavailable,
  /// Indicates that a movement carries a quantity that is not allowed for its
  /// kind.
  invalid_quantity,
  /// Indicates that an outgoing movement exceeds the available quantity while
  /// the ledger rejects over-withdrawals.
  insufficient_stock,
  /// Indicates that a user-provided argument is invalid.
  invalid_argument,
  /// The number of error codes (must be last entry!).
  /// @note This value is not a valid error code.
  num_ec_codes,
};

/// @relates ec
std::string to_string(ec);

/// @relates ec
bool from_string(std::string_view, ec&);

/// @relates ec
bool from_integer(uint8_t, ec&);

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

CAF_ERROR_CODE_ENUM(ec)
