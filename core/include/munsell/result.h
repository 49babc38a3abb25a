#pragma once

#include <optional>
#include <string>
#include <utility>

namespace munsell {

/// Identifies which validation step rejected a color spec.
/// MUST stay one code per failure cause so callers can branch without parsing messages.
enum class ErrorCode {
  None,
  HueUndefined,
  HueFormat,
  HueRange,
  ValueUndefined,
  ValueFormat,
  ValueRange,
  ChromaUndefined,
  ChromaFormat,
};

/// Describes a rejected color spec for diagnostics.
/// MUST carry a human-readable message naming the failing field.
struct ValidationError {
  ErrorCode code = ErrorCode::None;
  std::string message;
};

/// Carries either a validated value or the reason validation failed.
/// MUST hold a value exactly when ok is true; no partial values are returned.
template <typename T>
struct Result {
  std::optional<T> value;
  ValidationError error;
  bool ok = false;

  static Result success(T value) {
    return {std::move(value), {}, true};
  }

  static Result failure(ErrorCode code, std::string message) {
    return {std::nullopt, {code, std::move(message)}, false};
  }
};

/// Returns a stable identifier for an error code, e.g. "hue_format".
const char* to_string(ErrorCode code);

}  // namespace munsell
