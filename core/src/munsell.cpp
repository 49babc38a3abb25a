#include "munsell/munsell.h"

#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "decimal.h"
#include "util/string_util.h"

namespace munsell {

namespace {

using decimal::Tenths;

constexpr Tenths kNearBlackTenths = 10;
constexpr Tenths kNearWhiteTenths = 95;

/// Runs the full hue -> value -> chroma validation chain.
/// MUST stop at the first failure and MUST apply the neutral overrides
/// (value 0 or 10, chroma 0) and the step 0 rollback before building the color.
/// Inputs are optional text fields; outputs are the failure or nullopt with `out` filled.
std::optional<ValidationError> validate(std::optional<std::string_view> hue,
                                        std::optional<std::string_view> value,
                                        std::optional<std::string_view> chroma,
                                        Color::Variant& out) {
  if (!hue.has_value()) {
    return ValidationError{ErrorCode::HueUndefined, "Hue is undefined."};
  }

  std::string hue_text = util::to_upper(*hue);
  bool chromatic = false;
  HueFamily family = HueFamily::R;
  Tenths step = 0;
  if (hue_text != "N") {
    size_t split = hue_text.find_first_not_of("0123456789.");
    std::string_view number = std::string_view(hue_text).substr(0, split);
    std::optional<HueFamily> parsed_family;
    if (split != std::string::npos && split > 0) {
      parsed_family = parse_hue_family(std::string_view(hue_text).substr(split));
    }
    if (!parsed_family.has_value() || !decimal::is_unsigned_decimal(number)) {
      return ValidationError{ErrorCode::HueFormat,
                             "Hue, \"" + hue_text + "\" is not valid format."};
    }
    std::optional<Tenths> parsed_step = decimal::parse_tenths(number);
    if (!parsed_step.has_value() || *parsed_step > decimal::kTen) {
      return ValidationError{ErrorCode::HueRange,
                             "Number of hue, \"" + hue_text + "\", is greater than 10.0."};
    }
    family = *parsed_family;
    step = *parsed_step;
    if (step == 0) {
      step = decimal::kTen;
      family = previous_family(family);
    }
    chromatic = true;
  }

  if (!value.has_value()) {
    return ValidationError{ErrorCode::ValueUndefined, "Value is undefined."};
  }
  if (!decimal::is_unsigned_decimal(*value)) {
    return ValidationError{ErrorCode::ValueFormat, "Value is not a valid number."};
  }
  std::optional<Tenths> parsed_value = decimal::parse_tenths(*value);
  if (!parsed_value.has_value() || *parsed_value > decimal::kTen) {
    std::string shown = parsed_value.has_value() ? decimal::format_fixed(*parsed_value)
                                                 : std::string(*value);
    return ValidationError{ErrorCode::ValueRange, "Value (" + shown + ") is out of range."};
  }
  Tenths value_tenths = *parsed_value;
  if (value_tenths == 0 || value_tenths == decimal::kTen) {
    chromatic = false;
  }

  Tenths chroma_tenths = 0;
  if (chromatic) {
    if (!chroma.has_value()) {
      return ValidationError{ErrorCode::ChromaUndefined, "Chroma is undefined."};
    }
    std::optional<Tenths> parsed_chroma;
    if (decimal::is_unsigned_decimal(*chroma)) {
      parsed_chroma = decimal::parse_tenths(*chroma);
    }
    if (!parsed_chroma.has_value()) {
      return ValidationError{ErrorCode::ChromaFormat, "Chroma is not a valid number."};
    }
    chroma_tenths = *parsed_chroma;
    if (chroma_tenths == 0) {
      chromatic = false;
    }
  }

  if (chromatic) {
    out = Color::Chromatic{family, step, value_tenths, chroma_tenths};
  } else {
    out = Color::Neutral{value_tenths};
  }
  return std::nullopt;
}

Color make_constant(std::string_view spec) {
  Result<Color> result = Color::parse(spec);
  if (!result.ok) {
    throw std::logic_error("Invalid built-in color \"" + std::string(spec) +
                           "\": " + result.error.message);
  }
  return *result.value;
}

}  // namespace

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None: return "none";
    case ErrorCode::HueUndefined: return "hue_undefined";
    case ErrorCode::HueFormat: return "hue_format";
    case ErrorCode::HueRange: return "hue_range";
    case ErrorCode::ValueUndefined: return "value_undefined";
    case ErrorCode::ValueFormat: return "value_format";
    case ErrorCode::ValueRange: return "value_range";
    case ErrorCode::ChromaUndefined: return "chroma_undefined";
    case ErrorCode::ChromaFormat: return "chroma_format";
  }
  return "unknown";
}

Result<Color> Color::parse(std::string_view spec) {
  std::vector<std::string> tokens = util::split_spec(spec);
  auto field = [&tokens](size_t i) -> std::optional<std::string_view> {
    if (i < tokens.size()) return std::string_view(tokens[i]);
    return std::nullopt;
  };
  return from_parts(field(0), field(1), field(2));
}

Result<Color> Color::from_parts(std::optional<std::string_view> hue,
                                std::optional<std::string_view> value,
                                std::optional<std::string_view> chroma) {
  Variant data = Neutral{};
  std::optional<ValidationError> error = validate(hue, value, chroma, data);
  if (error.has_value()) {
    return Result<Color>::failure(error->code, std::move(error->message));
  }
  return Result<Color>::success(Color(std::move(data)));
}

Result<Color> Color::from_parts(std::optional<std::string_view> hue,
                                double value,
                                std::optional<double> chroma) {
  std::string value_text = decimal::format_number(value);
  std::optional<std::string> chroma_text;
  if (chroma.has_value()) {
    chroma_text = decimal::format_number(*chroma);
  }
  std::optional<std::string_view> chroma_view;
  if (chroma_text.has_value()) {
    chroma_view = *chroma_text;
  }
  return from_parts(hue, std::optional<std::string_view>(value_text), chroma_view);
}

Color Color::pure_white() {
  return make_constant("N 10.0");
}

Color Color::pure_black() {
  return make_constant("N 0.0");
}

Color Color::real_white() {
  return make_constant("N 9.5");
}

Color Color::real_black() {
  return make_constant("N 1.0");
}

bool Color::is_chromatic() const {
  return std::holds_alternative<Chromatic>(data_);
}

bool Color::is_neutral() const {
  return std::holds_alternative<Neutral>(data_);
}

std::string Color::hue() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return decimal::format_minimal(c->step_tenths) + std::string(to_string(c->family));
  }
  return "N";
}

std::optional<HueFamily> Color::hue_family() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return c->family;
  }
  return std::nullopt;
}

std::string Color::hue_col() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return std::string(to_string(c->family));
  }
  return "N";
}

std::optional<double> Color::hue_step() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return decimal::to_double(c->step_tenths);
  }
  return std::nullopt;
}

double Color::value() const {
  return decimal::to_double(value_tenths());
}

std::optional<double> Color::chroma() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return decimal::to_double(c->chroma_tenths);
  }
  return std::nullopt;
}

bool Color::is_near_black() const {
  return value_tenths() <= kNearBlackTenths;
}

bool Color::is_near_white() const {
  return value_tenths() >= kNearWhiteTenths;
}

std::string Color::code() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return hue() + " " + decimal::format_minimal(c->value_tenths) + "/" +
           decimal::format_minimal(c->chroma_tenths);
  }
  return "N " + decimal::format_fixed(value_tenths());
}

double Color::degree() const {
  return munsell::degree(*this);
}

std::int64_t Color::value_tenths() const {
  if (const auto* c = std::get_if<Chromatic>(&data_)) {
    return c->value_tenths;
  }
  return std::get<Neutral>(data_).value_tenths;
}

bool operator==(const Color& a, const Color& b) {
  const auto* ca = std::get_if<Color::Chromatic>(&a.data_);
  const auto* cb = std::get_if<Color::Chromatic>(&b.data_);
  if (ca != nullptr && cb != nullptr) {
    return ca->family == cb->family && ca->step_tenths == cb->step_tenths &&
           ca->value_tenths == cb->value_tenths && ca->chroma_tenths == cb->chroma_tenths;
  }
  if (ca == nullptr && cb == nullptr) {
    return a.value_tenths() == b.value_tenths();
  }
  return false;
}

std::string to_string(const Color& color) {
  return color.code();
}

std::ostream& operator<<(std::ostream& os, const Color& color) {
  return os << color.code();
}

double degree(const Color& color) {
  const auto* c = std::get_if<Color::Chromatic>(&color.variant());
  if (c == nullptr) {
    throw std::invalid_argument("Neutral color \"" + color.code() + "\" has no hue degree.");
  }
  if (c->family == HueFamily::RP && c->step_tenths == decimal::kTen) {
    return 0.0;
  }
  return decimal::to_double(hue_index(c->family) * decimal::kTen + c->step_tenths);
}

double degree(std::string_view hue_code) {
  Result<Color> color = Color::from_parts(hue_code, std::string_view("1"), std::string_view("1"));
  if (!color.ok) {
    throw std::invalid_argument(color.error.message);
  }
  return degree(*color.value);
}

std::string undegree(double degree) {
  std::string text = decimal::format_number(degree);
  return undegree(std::string_view(text));
}

std::string undegree(std::string_view degree) {
  if (!decimal::is_unsigned_decimal(degree)) {
    throw std::invalid_argument("Argument is not a valid number.");
  }
  // The limit applies before rounding: 100.04 is rejected even though it rounds to 100.0.
  std::string_view whole = degree.substr(0, degree.find('.'));
  std::optional<Tenths> whole_tenths = decimal::parse_tenths(whole);
  std::optional<Tenths> tenths = decimal::parse_tenths(degree);
  bool above = !whole_tenths.has_value() || !tenths.has_value() ||
               *whole_tenths > decimal::kHundred ||
               (*whole_tenths == decimal::kHundred &&
                degree.find_first_of("123456789", whole.size()) != std::string_view::npos);
  if (above) {
    throw std::out_of_range("Given number is out of range(<=100).");
  }

  if (*tenths == 0 || *tenths == decimal::kHundred) {
    return "10RP";
  }
  HueFamily family = family_at(static_cast<int>(*tenths / decimal::kTen));
  Tenths step = *tenths % decimal::kTen;
  return decimal::format_minimal(step) + std::string(to_string(family));
}

}  // namespace munsell
