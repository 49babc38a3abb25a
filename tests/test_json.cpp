#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "test_harness.h"

#include "munsell/json.h"

namespace {

using munsell::Color;
using nlohmann::json;

void test_json_chromatic_shape() {
  auto color = Color::parse("9R 5.5/14");
  expect_true(color.ok, "color parses");
  if (!color.ok) return;
  json j = *color.value;
  expect_eq(j.at("code").get<std::string>(), "9R 5.5/14", "code field");
  expect_eq(j.at("hue").get<std::string>(), "9R", "hue field");
  expect_near(j.at("value").get<double>(), 5.5, "value field");
  expect_near(j.at("chroma").get<double>(), 14.0, "chroma field");
}

void test_json_neutral_shape() {
  json j = munsell::color_to_json(Color::real_white());
  expect_eq(j.at("code").get<std::string>(), "N 9.5", "neutral code");
  expect_eq(j.at("hue").get<std::string>(), "N", "neutral hue");
  expect_true(j.at("chroma").is_null(), "neutral chroma is null");
}

void test_json_round_trip() {
  for (const char* spec : {"9R 5.5/14", "0YR 4/2", "N 4.5", "7PB 4/10"}) {
    auto color = Color::parse(spec);
    expect_true(color.ok, std::string("parse ") + spec);
    if (!color.ok) continue;
    json j = *color.value;
    Color back = j.get<Color>();
    expect_true(back == *color.value, std::string("round trip ") + spec);
  }
}

void test_json_input_forms() {
  auto from_string = munsell::color_from_json(json("7PB 4/10"));
  expect_true(from_string.ok && from_string.value->code() == "7PB 4/10", "code string");

  auto from_object = munsell::color_from_json(json{{"hue", "7PB"}, {"value", 4}, {"chroma", "10"}});
  expect_true(from_object.ok && from_object.value->code() == "7PB 4/10", "object mixes types");

  auto from_array = munsell::color_from_json(json::array({"7PB", 4.0, 10}));
  expect_true(from_array.ok && from_array.value->code() == "7PB 4/10", "array triple");

  auto neutral = munsell::color_from_json(json{{"hue", "N"}, {"value", 9.5}});
  expect_true(neutral.ok && neutral.value->code() == "N 9.5", "neutral without chroma");
}

void test_json_validation_errors() {
  auto missing_hue = munsell::color_from_json(json{{"value", 4}});
  expect_true(missing_hue.error.code == munsell::ErrorCode::HueUndefined, "missing hue");
  auto null_chroma = munsell::color_from_json(json{{"hue", "5R"}, {"value", 4}, {"chroma", nullptr}});
  expect_true(null_chroma.error.code == munsell::ErrorCode::ChromaUndefined, "null chroma");
  auto negative = munsell::color_from_json(json{{"hue", "5R"}, {"value", -4}, {"chroma", 2}});
  expect_true(negative.error.code == munsell::ErrorCode::ValueFormat, "negative value");
  auto not_color = munsell::color_from_json(json(42));
  expect_true(not_color.error.code == munsell::ErrorCode::HueUndefined, "scalar is not a color");

  bool threw = false;
  try {
    Color unused = json{{"hue", "5Z"}, {"value", 4}, {"chroma", 2}}.get<Color>();
    expect_true(false, "accepted " + unused.code());
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()) == "Hue, \"5Z\" is not valid format.";
  }
  expect_true(threw, "get<Color> throws with the validation message");
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
      {"json_chromatic_shape", test_json_chromatic_shape},
      {"json_neutral_shape", test_json_neutral_shape},
      {"json_round_trip", test_json_round_trip},
      {"json_input_forms", test_json_input_forms},
      {"json_validation_errors", test_json_validation_errors},
  };
  return run_tests(tests, argc, argv);
}
