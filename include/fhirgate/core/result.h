#pragma once

#include <string>
#include <utility>
#include <variant>

namespace fhirgate::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// ConfigErrorKind discriminates the ways a rule definition (or an input document
// carrying rule-set / schema / question-set data) can be rejected before evaluation.
enum class ConfigErrorKind {
  kMalformedPath,
  kMissingParam,
  kInvalidParam,
  kUngovernedErrorCode,
  kMalformedScope,
  kMalformedExpression,
  kInvalidDocument,
};

// ConfigError is the typed "invalid configuration" failure.
// rule_id is empty when the error is not attributable to a single rule.
struct ConfigError {
  ConfigErrorKind kind{ConfigErrorKind::kInvalidDocument};  // NOLINT(readability-identifier-naming)
  std::string rule_id;                                      // NOLINT(readability-identifier-naming)
  std::string reason;                                       // NOLINT(readability-identifier-naming)
};

[[nodiscard]] inline std::string config_error_kind_to_string(const ConfigErrorKind kind) {
  switch (kind) {
    case ConfigErrorKind::kMalformedPath:
      return "malformed_path";
    case ConfigErrorKind::kMissingParam:
      return "missing_param";
    case ConfigErrorKind::kInvalidParam:
      return "invalid_param";
    case ConfigErrorKind::kUngovernedErrorCode:
      return "ungoverned_error_code";
    case ConfigErrorKind::kMalformedScope:
      return "malformed_scope";
    case ConfigErrorKind::kMalformedExpression:
      return "malformed_expression";
    case ConfigErrorKind::kInvalidDocument:
      return "invalid_document";
  }
  return "invalid_document";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

  // Moves the success value out; only valid when has_value().
  [[nodiscard]] T take_value() { return std::move(std::get<0>(data_)); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace fhirgate::core
