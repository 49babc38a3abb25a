#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace munsell::util {

/// Converts a string to uppercase for case-insensitive hue matching.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are uppercase strings with no side effects.
std::string to_upper(std::string_view s);
/// Splits a combined Munsell spec on runs of spaces and '/'.
/// MUST keep an empty leading token when the input starts with a delimiter
/// and MUST drop empty trailing tokens.
/// Inputs are spec strings; outputs are token lists with no side effects.
std::vector<std::string> split_spec(std::string_view s);

}  // namespace munsell::util
