#include <stdexcept>
#include <string>

#include "test_harness.h"

#include "munsell/hue.h"

namespace {

void test_hue_order_is_circular() {
  expect_eq(munsell::kHueOrder.size(), 10, "ten hue families");
  expect_true(munsell::kHueOrder.front() == munsell::HueFamily::R, "circle starts at R");
  expect_true(munsell::kHueOrder.back() == munsell::HueFamily::RP, "circle ends at RP");
  for (size_t i = 0; i < munsell::kHueOrder.size(); ++i) {
    expect_eq(static_cast<size_t>(munsell::hue_index(munsell::kHueOrder[i])), i,
              "hue_index matches order position");
    expect_true(munsell::family_at(static_cast<int>(i)) == munsell::kHueOrder[i],
                "family_at inverts hue_index");
  }
}

void test_previous_family_wraps() {
  expect_true(munsell::previous_family(munsell::HueFamily::R) == munsell::HueFamily::RP,
              "R wraps back to RP");
  expect_true(munsell::previous_family(munsell::HueFamily::YR) == munsell::HueFamily::R,
              "YR preceded by R");
  expect_true(munsell::previous_family(munsell::HueFamily::RP) == munsell::HueFamily::P,
              "RP preceded by P");
}

void test_family_codes() {
  expect_eq(std::string(munsell::to_string(munsell::HueFamily::PB)), "PB", "PB code");
  expect_eq(std::string(munsell::to_string(munsell::HueFamily::Y)), "Y", "Y code");
  auto gy = munsell::parse_hue_family("GY");
  expect_true(gy.has_value() && *gy == munsell::HueFamily::GY, "GY parses");
  expect_true(!munsell::parse_hue_family("gy").has_value(), "lowercase codes are not families");
  expect_true(!munsell::parse_hue_family("Z").has_value(), "unknown family");
  expect_true(!munsell::parse_hue_family("RPX").has_value(), "trailing characters rejected");
  expect_true(!munsell::parse_hue_family("").has_value(), "empty code rejected");
}

void test_hue_number_map() {
  const auto& numbers = munsell::hue_number();
  expect_eq(numbers.size(), 10, "hue_number has every family");
  expect_eq(static_cast<size_t>(numbers.at("R")), 0, "R is 0");
  expect_eq(static_cast<size_t>(numbers.at("BG")), 5, "BG is 5");
  expect_eq(static_cast<size_t>(numbers.at("RP")), 9, "RP is 9");
}

void test_family_at_out_of_range_throws() {
  bool threw = false;
  try {
    munsell::family_at(10);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  expect_true(threw, "family_at(10) throws");
}

}  // namespace

void register_hue_tests(std::vector<TestCase>& tests) {
  tests.push_back({"hue_order_is_circular", test_hue_order_is_circular});
  tests.push_back({"previous_family_wraps", test_previous_family_wraps});
  tests.push_back({"family_codes", test_family_codes});
  tests.push_back({"hue_number_map", test_hue_number_map});
  tests.push_back({"family_at_out_of_range_throws", test_family_at_out_of_range_throws});
}
