// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include <caf/timestamp.hpp>

#include <string>
#include <string_view>

/// Renders `x` as UTC date and time with microsecond precision, e.g.,
/// "2024-03-01T08:15:00.250000". This is the format `datetime.isoformat()`
/// produces, which keeps the files of the desktop tool readable for both
/// sides.
std::string to_iso8601(caf::timestamp x);

/// Parses a date and time in the form `YYYY-MM-DDTHH:MM:SS[.fraction][offset]`
/// with up to nine fractional digits and an optional offset `Z`, `+HH:MM` or
/// `-HH:MM`. Values without offset count as UTC.
/// @returns `true` on success, `false` if `str` is malformed or out of range.
bool from_iso8601(std::string_view str, caf::timestamp& x);
