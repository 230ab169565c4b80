// (c) 2024, Interance GmbH & Co KG.

// Logging helpers that tag every event with the stockpile component name.

#pragma once

#include <caf/detail/build_config.hpp>
#include <caf/log/level.hpp>
#include <caf/logger.hpp>

#include <string_view>
#include <utility>

namespace stockpile::log {

/// The name of this component in log events.
constexpr std::string_view component = "stockpile";

/// Logs a message with the given severity.
template <class... Ts>
void emit(unsigned level, caf::format_string_with_location fmt_str,
          Ts&&... args) {
  caf::logger::log(level, component, fmt_str, std::forward<Ts>(args)...);
}

/// Logs a message with `debug` severity, e.g., individual stock movements.
template <class... Ts>
void debug(caf::format_string_with_location fmt_str, Ts&&... args) {
  emit(caf::log::level::debug, fmt_str, std::forward<Ts>(args)...);
}

/// Logs a message with `info` severity, e.g., sweep results.
template <class... Ts>
void info(caf::format_string_with_location fmt_str, Ts&&... args) {
  emit(caf::log::level::info, fmt_str, std::forward<Ts>(args)...);
}

/// Logs a message with `warning` severity, e.g., optimistic lock conflicts.
template <class... Ts>
void warning(caf::format_string_with_location fmt_str, Ts&&... args) {
  emit(caf::log::level::warning, fmt_str, std::forward<Ts>(args)...);
}

/// Logs a message with `error` severity, e.g., database failures.
template <class... Ts>
void error(caf::format_string_with_location fmt_str, Ts&&... args) {
  emit(caf::log::level::error, fmt_str, std::forward<Ts>(args)...);
}

} // namespace stockpile::log
