#pragma once

#include <nlohmann/json.hpp>

#include "munsell/munsell.h"

namespace munsell {

/// Serializes a color as {"code", "hue", "value", "chroma"}; chroma is null for neutrals.
nlohmann::json color_to_json(const Color& color);

/// Builds a color from JSON without throwing.
/// Accepts a code string ("9R 5.5/14"), a [hue, value, chroma] array, or an
/// object with "hue", "value" and optional "chroma"; numbers and strings are
/// both accepted for value and chroma and go through the usual validation.
Result<Color> color_from_json(const nlohmann::json& j);

}  // namespace munsell

namespace nlohmann {

/// Lets json::get<munsell::Color>() work although Color has no default constructor.
/// from_json MUST throw std::invalid_argument with the validation message on bad input.
template <>
struct adl_serializer<munsell::Color> {
  static munsell::Color from_json(const json& j);
  static void to_json(json& j, const munsell::Color& color);
};

}  // namespace nlohmann
