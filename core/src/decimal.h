#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace munsell::decimal {

/// One-decimal numbers are held as an exact count of tenths (4.5 -> 45).
using Tenths = std::int64_t;

// 10.0 and 100.0 expressed in tenths.
constexpr Tenths kTen = 100;
constexpr Tenths kHundred = 1000;

/// Checks the unsigned decimal grammar `\d+` or `\d+\.\d+` without converting.
bool is_unsigned_decimal(std::string_view text);

/// Parses the unsigned decimal grammar `\d+` or `\d+\.\d+` into tenths.
/// MUST round half-up on the hundredths digit and MUST reject signs, exponents,
/// bare dots and numbers too large for Tenths.
/// Inputs are raw text; outputs are tenths or nullopt with no side effects.
std::optional<Tenths> parse_tenths(std::string_view text);

/// Renders tenths with exactly one decimal place ("10.0").
std::string format_fixed(Tenths tenths);

/// Renders tenths without a trailing ".0" ("9", "5.5").
std::string format_minimal(Tenths tenths);

/// Renders a number the way a general-format print does (15 significant digits).
/// MUST use the classic locale so the output can be fed back to parse_tenths.
std::string format_number(double number);

inline double to_double(Tenths tenths) {
  return static_cast<double>(tenths) / 10.0;
}

}  // namespace munsell::decimal
