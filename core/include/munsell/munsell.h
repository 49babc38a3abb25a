#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "munsell/hue.h"
#include "munsell/result.h"

namespace munsell {

/// A validated color in Munsell notation, either a neutral gray or a chromatic color.
/// MUST only be created through the validating factories and MUST stay immutable.
/// Numbers are held as exact tenths; accessors convert them to double on read.
class Color {
 public:
  /// A gray with lightness only ("N 4.5").
  struct Neutral {
    std::int64_t value_tenths = 0;
  };

  /// A color with hue and chroma ("9R 5.5/14").
  /// MUST keep step in (0, 100] tenths, value in (0, 100) and chroma above 0.
  struct Chromatic {
    HueFamily family = HueFamily::R;
    std::int64_t step_tenths = 0;
    std::int64_t value_tenths = 0;
    std::int64_t chroma_tenths = 0;
  };

  using Variant = std::variant<Neutral, Chromatic>;

  /// Parses a combined spec such as "9R 5.5/14", "7PB 4 10" or "N 4.5".
  /// MUST split on runs of spaces and '/' and MUST ignore chroma for neutrals.
  /// Inputs are spec text; outputs are a color or the first validation failure.
  static Result<Color> parse(std::string_view spec);

  /// Builds a color from discrete text fields; nullopt marks a missing field.
  /// MUST validate hue, then value, then chroma, and stop at the first failure.
  /// Chroma is only required while the color is still chromatic after the value check.
  static Result<Color> from_parts(std::optional<std::string_view> hue,
                                  std::optional<std::string_view> value,
                                  std::optional<std::string_view> chroma = std::nullopt);

  /// Builds a color from a hue code and numeric value/chroma.
  /// Numbers are printed in general format first and validated as text, so
  /// negative, non-finite and exponent-sized numbers are rejected.
  static Result<Color> from_parts(std::optional<std::string_view> hue,
                                  double value,
                                  std::optional<double> chroma = std::nullopt);

  /// "N 10.0".
  static Color pure_white();
  /// "N 0.0".
  static Color pure_black();
  /// "N 9.5", the lightest value a real surface reaches.
  static Color real_white();
  /// "N 1.0", the darkest value a real surface reaches.
  static Color real_black();

  bool is_chromatic() const;
  bool is_neutral() const;

  /// Normalized hue text ("10R", "N").
  std::string hue() const;
  std::optional<HueFamily> hue_family() const;
  /// Family code, or "N" for a neutral color.
  std::string hue_col() const;
  std::optional<double> hue_step() const;
  double value() const;
  double lightness() const { return value(); }
  std::optional<double> chroma() const;
  std::optional<double> saturation() const { return chroma(); }

  /// True when value <= 1.0, whether or not the color is chromatic.
  bool is_near_black() const;
  /// True when value >= 9.5, whether or not the color is chromatic.
  bool is_near_white() const;

  /// Canonical notation: "N 4.5" for neutrals, "9R 5.5/14" for chromatic colors.
  std::string code() const;

  /// Position on the 0-100 hue circle; see munsell::degree.
  double degree() const;

  const Variant& variant() const { return data_; }

  friend bool operator==(const Color& a, const Color& b);
  friend bool operator!=(const Color& a, const Color& b) { return !(a == b); }

 private:
  explicit Color(Variant data) : data_(std::move(data)) {}

  std::int64_t value_tenths() const;

  Variant data_;
};

std::string to_string(const Color& color);
std::ostream& operator<<(std::ostream& os, const Color& color);

/// Maps a chromatic color to its serial hue position: family index * 10 + step.
/// MUST map 10RP to 0 so the circle closes at the origin rather than at 100.
/// Neutral colors have no hue and throw std::invalid_argument.
double degree(const Color& color);

/// Maps a hue code ("5YR") to its serial hue position.
/// MUST receive a well-formed chromatic hue code; malformed or neutral codes
/// throw std::invalid_argument with the validation message.
double degree(std::string_view hue_code);

/// Maps a serial hue position in [0, 100] back to a hue code (step + family).
/// MUST return "10RP" for 0 and 100; other multiples of 10 give step 0 ("0YR").
/// Negative or malformed input throws std::invalid_argument and input above 100
/// throws std::out_of_range.
std::string undegree(double degree);
std::string undegree(std::string_view degree);

}  // namespace munsell
