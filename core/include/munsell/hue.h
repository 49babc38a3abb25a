#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace munsell {

/// The ten chromatic hue families in circular order; RP wraps back to R.
enum class HueFamily { R, YR, Y, GY, G, BG, B, PB, P, RP };

constexpr std::array<HueFamily, 10> kHueOrder = {
    HueFamily::R,  HueFamily::YR, HueFamily::Y, HueFamily::GY, HueFamily::G,
    HueFamily::BG, HueFamily::B,  HueFamily::PB, HueFamily::P, HueFamily::RP};

/// Position of a family on the hue circle, 0 (R) through 9 (RP).
constexpr int hue_index(HueFamily family) {
  return static_cast<int>(family);
}

/// Family at a circle position.
/// MUST receive an index in [0, 9]; other values throw std::out_of_range.
HueFamily family_at(int index);

/// Circular predecessor; the predecessor of R is RP.
HueFamily previous_family(HueFamily family);

/// Family code as written in Munsell notation ("YR").
std::string_view to_string(HueFamily family);

/// Parses an upper-case family code.
/// MUST match the whole input exactly; "yr" or "YRX" yield nullopt.
std::optional<HueFamily> parse_hue_family(std::string_view code);

/// Family code to circle index, for consumers that work with raw codes.
/// Inputs are none; outputs are an immutable map shared by all callers.
const std::unordered_map<std::string, int>& hue_number();

}  // namespace munsell
