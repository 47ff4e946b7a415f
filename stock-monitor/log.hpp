// (c) 2024, Interance GmbH & Co KG.

// Convenience header for logging with a custom component name.

#pragma once

#include <caf/detail/build_config.hpp>
#include <caf/log/level.hpp>
#include <caf/logger.hpp>

#include <string_view>

namespace log {

/// The name of this component in log events.
constexpr std::string_view component = "stock";

/// Logs a message with `debug` severity.
/// @param fmt_str The format string (with source location) for the message.
/// @param args Arguments for the format string.
template <class... Ts>
void debug(caf::format_string_with_location fmt_str, Ts&&... args) {
  caf::logger::log(caf::log::level::debug, component, fmt_str,
                   std::forward<Ts>(args)...);
}

/// Logs a message with `info` severity.
/// @param fmt_str The format string (with source location) for the message.
/// @param args Arguments for the format string.
template <class... Ts>
void info(caf::format_string_with_location fmt_str, Ts&&... args) {
  caf::logger::log(caf::log::level::info, component, fmt_str,
                   std::forward<Ts>(args)...);
}

/// Logs a message with `warning` severity.
/// @param fmt_str The format string (with source location) for the message.
/// @param args Arguments for the format string.
template <class... Ts>
void warning(caf::format_string_with_location fmt_str, Ts&&... args) {
  caf::logger::log(caf::log::level::warning, component, fmt_str,
                   std::forward<Ts>(args)...);
}

/// Logs a message with `error` severity.
/// @param fmt_str The format string (with source location) for the message.
/// @param args Arguments for the format string.
template <class... Ts>
void error(caf::format_string_with_location fmt_str, Ts&&... args) {
  caf::logger::log(caf::log::level::error, component, fmt_str,
                   std::forward<Ts>(args)...);
}

} // namespace log
