#pragma once

#include "fhirgate/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fhirgate::domain {

enum class AnswerType {
  kCode,
  kQuantity,
  kInteger,
  kDecimal,
  kString,
  kBoolean,
};

[[nodiscard]] std::string answer_type_to_string(AnswerType type);
[[nodiscard]] std::optional<AnswerType> string_to_answer_type(const std::string& str);

// Question is identified by its coding (system + code).
struct Question {
  std::string system;                             // NOLINT(readability-identifier-naming)
  std::string code;                               // NOLINT(readability-identifier-naming)
  std::string display;                            // NOLINT(readability-identifier-naming)
  AnswerType answer_type{AnswerType::kString};    // NOLINT(readability-identifier-naming)
  bool required{false};                           // NOLINT(readability-identifier-naming)
  bool multiple_allowed{false};                   // NOLINT(readability-identifier-naming)
  std::optional<double> min;                      // NOLINT(readability-identifier-naming)
  std::optional<double> max;                      // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max_length;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> pattern;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> value_set_system;    // NOLINT(readability-identifier-naming)
  std::vector<std::string> allowed_codes;         // NOLINT(readability-identifier-naming)
};

struct QuestionSet {
  std::string id;                    // NOLINT(readability-identifier-naming)
  std::string title;                 // NOLINT(readability-identifier-naming)
  std::vector<Question> questions;   // NOLINT(readability-identifier-naming)

  // Returns nullptr when no question has this coding.
  [[nodiscard]] const Question* find(const std::string& system, const std::string& code) const;
};

// Question sets resolved by the caller, keyed by id.
using QuestionSetCatalog = std::map<std::string, QuestionSet>;

[[nodiscard]] core::Result<QuestionSet, core::ConfigError> question_set_from_json(
    const nlohmann::json& j);

// Accepts a single question set object or an array of them.
[[nodiscard]] core::Result<QuestionSetCatalog, core::ConfigError> question_set_catalog_from_json(
    const nlohmann::json& j);

}  // namespace fhirgate::domain
