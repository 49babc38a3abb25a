#include "munsell/json.h"

#include <cstdint>
#include <stdexcept>
#include <string>

#include "decimal.h"

namespace munsell {

namespace {

using nlohmann::json;

/// Renders a JSON scalar as the text the validator expects.
/// MUST map null to nullopt so a missing field reports "... is undefined".
std::optional<std::string> field_text(const json& j) {
  if (j.is_null()) return std::nullopt;
  if (j.is_string()) return j.get<std::string>();
  if (j.is_number_unsigned()) return std::to_string(j.get<std::uint64_t>());
  if (j.is_number_integer()) return std::to_string(j.get<std::int64_t>());
  if (j.is_number_float()) return decimal::format_number(j.get<double>());
  return j.dump();
}

std::optional<std::string> member_text(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) return std::nullopt;
  return field_text(*it);
}

std::optional<std::string> element_text(const json& j, size_t index) {
  if (index >= j.size()) return std::nullopt;
  return field_text(j[index]);
}

std::optional<std::string_view> view(const std::optional<std::string>& text) {
  if (!text.has_value()) return std::nullopt;
  return std::string_view(*text);
}

}  // namespace

nlohmann::json color_to_json(const Color& color) {
  json out = json::object();
  out["code"] = color.code();
  out["hue"] = color.hue();
  out["value"] = color.value();
  std::optional<double> chroma = color.chroma();
  out["chroma"] = chroma.has_value() ? json(*chroma) : json(nullptr);
  return out;
}

Result<Color> color_from_json(const nlohmann::json& j) {
  if (j.is_string()) {
    return Color::parse(j.get<std::string>());
  }
  std::optional<std::string> hue;
  std::optional<std::string> value;
  std::optional<std::string> chroma;
  if (j.is_object()) {
    hue = member_text(j, "hue");
    value = member_text(j, "value");
    chroma = member_text(j, "chroma");
  } else if (j.is_array()) {
    hue = element_text(j, 0);
    value = element_text(j, 1);
    chroma = element_text(j, 2);
  }
  return Color::from_parts(view(hue), view(value), view(chroma));
}

}  // namespace munsell

namespace nlohmann {

munsell::Color adl_serializer<munsell::Color>::from_json(const json& j) {
  munsell::Result<munsell::Color> result = munsell::color_from_json(j);
  if (!result.ok) {
    throw std::invalid_argument(result.error.message);
  }
  return *result.value;
}

void adl_serializer<munsell::Color>::to_json(json& j, const munsell::Color& color) {
  j = munsell::color_to_json(color);
}

}  // namespace nlohmann
