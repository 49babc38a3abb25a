#include "decimal.h"

#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace munsell::decimal {

namespace {

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

bool is_unsigned_decimal(std::string_view text) {
  size_t pos = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    ++pos;
  }
  if (pos == 0) return false;
  if (pos == text.size()) return true;
  if (text[pos] != '.') return false;
  size_t frac_start = ++pos;
  while (pos < text.size() && is_digit(text[pos])) {
    ++pos;
  }
  return pos > frac_start && pos == text.size();
}

std::optional<Tenths> parse_tenths(std::string_view text) {
  constexpr Tenths kMax = std::numeric_limits<Tenths>::max();

  size_t pos = 0;
  Tenths whole = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    if (whole > (kMax - 9) / 10) return std::nullopt;
    whole = whole * 10 + (text[pos] - '0');
    ++pos;
  }
  if (pos == 0) return std::nullopt;

  int tenth_digit = 0;
  bool round_up = false;
  if (pos < text.size()) {
    if (text[pos] != '.') return std::nullopt;
    ++pos;
    size_t frac_start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
    if (pos == frac_start || pos != text.size()) return std::nullopt;
    tenth_digit = text[frac_start] - '0';
    if (pos - frac_start > 1) {
      round_up = text[frac_start + 1] >= '5';
    }
  }

  // Room for whole * 10 + 9 + 1.
  if (whole > (kMax - 10) / 10) return std::nullopt;
  return whole * 10 + tenth_digit + (round_up ? 1 : 0);
}

std::string format_fixed(Tenths tenths) {
  return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10);
}

std::string format_minimal(Tenths tenths) {
  if (tenths % 10 == 0) {
    return std::to_string(tenths / 10);
  }
  return format_fixed(tenths);
}

std::string format_number(double number) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(15) << number;
  return oss.str();
}

}  // namespace munsell::decimal
