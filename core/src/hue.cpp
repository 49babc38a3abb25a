#include "munsell/hue.h"

#include <stdexcept>

namespace munsell {

namespace {

constexpr std::array<std::string_view, 10> kFamilyCodes = {
    "R", "YR", "Y", "GY", "G", "BG", "B", "PB", "P", "RP"};

}  // namespace

HueFamily family_at(int index) {
  if (index < 0 || index >= static_cast<int>(kHueOrder.size())) {
    throw std::out_of_range("Hue index " + std::to_string(index) + " is out of range.");
  }
  return kHueOrder[static_cast<size_t>(index)];
}

HueFamily previous_family(HueFamily family) {
  int index = hue_index(family);
  return index == 0 ? HueFamily::RP : kHueOrder[static_cast<size_t>(index - 1)];
}

std::string_view to_string(HueFamily family) {
  return kFamilyCodes[static_cast<size_t>(hue_index(family))];
}

std::optional<HueFamily> parse_hue_family(std::string_view code) {
  for (size_t i = 0; i < kFamilyCodes.size(); ++i) {
    if (kFamilyCodes[i] == code) {
      return kHueOrder[i];
    }
  }
  return std::nullopt;
}

const std::unordered_map<std::string, int>& hue_number() {
  static const std::unordered_map<std::string, int> map = []() {
    std::unordered_map<std::string, int> values;
    for (HueFamily family : kHueOrder) {
      values.emplace(std::string(to_string(family)), hue_index(family));
    }
    return values;
  }();
  return map;
}

}  // namespace munsell
