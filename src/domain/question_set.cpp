#include "fhirgate/domain/question_set.h"

#include <cstdint>
#include <utility>

namespace fhirgate::domain {

namespace {

using nlohmann::json;
using QuestionResult = core::Result<Question, core::ConfigError>;

core::ConfigError document_error(const std::string& reason) {
  return core::ConfigError{core::ConfigErrorKind::kInvalidDocument, "", reason};
}

std::optional<double> optional_number(const json& j, const char* key) {
  if (j.contains(key) && j.at(key).is_number()) {
    return j.at(key).get<double>();
  }
  return std::nullopt;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (j.contains(key) && j.at(key).is_string()) {
    return j.at(key).get<std::string>();
  }
  return std::nullopt;
}

std::optional<bool> optional_bool(const json& j, const char* key) {
  if (j.contains(key) && j.at(key).is_boolean()) {
    return j.at(key).get<bool>();
  }
  return std::nullopt;
}

// A question coding is either flat ({system, code}) or nested ({code:{system, code}}).
QuestionResult question_from_json(const json& j, const std::string& set_id) {
  if (!j.is_object()) {
    return QuestionResult::err(document_error("question set '" + set_id +
                                              "': questions must be objects"));
  }

  Question question;
  if (j.contains("code") && j.at("code").is_object()) {
    const auto& coding = j.at("code");
    question.system = optional_string(coding, "system").value_or("");
    question.code = optional_string(coding, "code").value_or("");
    question.display = optional_string(coding, "display").value_or("");
  } else {
    question.system = optional_string(j, "system").value_or("");
    question.code = optional_string(j, "code").value_or("");
    question.display = optional_string(j, "display").value_or("");
  }
  if (question.code.empty()) {
    return QuestionResult::err(document_error("question set '" + set_id +
                                              "': every question needs a code"));
  }

  const std::string type_text = optional_string(j, "answerType").value_or("string");
  const auto answer_type = string_to_answer_type(type_text);
  if (!answer_type.has_value()) {
    return QuestionResult::err(document_error("question set '" + set_id + "': answerType '" +
                                              type_text + "' is not supported"));
  }
  question.answer_type = answer_type.value();
  question.required = optional_bool(j, "required").value_or(false);
  question.multiple_allowed = optional_bool(j, "multipleAllowed").value_or(false);
  question.min = optional_number(j, "min");
  question.max = optional_number(j, "max");
  if (j.contains("maxLength") && j.at("maxLength").is_number_integer() &&
      j.at("maxLength").get<std::int64_t>() >= 0) {
    question.max_length = j.at("maxLength").get<std::size_t>();
  }
  question.pattern = optional_string(j, "pattern");
  question.value_set_system = optional_string(j, "valueSetSystem");
  if (j.contains("allowedCodes") && j.at("allowedCodes").is_array()) {
    for (const auto& code : j.at("allowedCodes")) {
      if (code.is_string()) {
        question.allowed_codes.push_back(code.get<std::string>());
      }
    }
  }
  return QuestionResult::ok(std::move(question));
}

}  // namespace

std::string answer_type_to_string(const AnswerType type) {
  switch (type) {
    case AnswerType::kCode:
      return "code";
    case AnswerType::kQuantity:
      return "quantity";
    case AnswerType::kInteger:
      return "integer";
    case AnswerType::kDecimal:
      return "decimal";
    case AnswerType::kString:
      return "string";
    case AnswerType::kBoolean:
      return "boolean";
  }
  return "string";
}

std::optional<AnswerType> string_to_answer_type(const std::string& str) {
  if (str == "code") {
    return AnswerType::kCode;
  }
  if (str == "quantity") {
    return AnswerType::kQuantity;
  }
  if (str == "integer") {
    return AnswerType::kInteger;
  }
  if (str == "decimal") {
    return AnswerType::kDecimal;
  }
  if (str == "string") {
    return AnswerType::kString;
  }
  if (str == "boolean") {
    return AnswerType::kBoolean;
  }
  return std::nullopt;
}

const Question* QuestionSet::find(const std::string& system, const std::string& code) const {
  for (const auto& question : questions) {
    if (question.system == system && question.code == code) {
      return &question;
    }
  }
  return nullptr;
}

core::Result<QuestionSet, core::ConfigError> question_set_from_json(const nlohmann::json& j) {
  using R = core::Result<QuestionSet, core::ConfigError>;
  if (!j.is_object()) {
    return R::err(document_error("question set must be a JSON object"));
  }
  if (!j.contains("id") || !j.at("id").is_string() || j.at("id").get<std::string>().empty()) {
    return R::err(document_error("question set needs a string id"));
  }

  QuestionSet question_set;
  question_set.id = j.at("id").get<std::string>();
  question_set.title = optional_string(j, "title").value_or("");
  if (j.contains("questions")) {
    if (!j.at("questions").is_array()) {
      return R::err(document_error("question set '" + question_set.id +
                                   "': questions must be an array"));
    }
    for (const auto& question_json : j.at("questions")) {
      auto question = question_from_json(question_json, question_set.id);
      if (!question.has_value()) {
        return R::err(question.error());
      }
      question_set.questions.push_back(question.take_value());
    }
  }
  return R::ok(std::move(question_set));
}

core::Result<QuestionSetCatalog, core::ConfigError> question_set_catalog_from_json(
    const nlohmann::json& j) {
  using R = core::Result<QuestionSetCatalog, core::ConfigError>;
  QuestionSetCatalog catalog;

  const json sets = j.is_array() ? j : json::array({j});
  for (const auto& set_json : sets) {
    auto question_set = question_set_from_json(set_json);
    if (!question_set.has_value()) {
      return R::err(question_set.error());
    }
    const std::string id = question_set.value().id;
    if (catalog.contains(id)) {
      return R::err(document_error("question set '" + id + "' is defined twice"));
    }
    catalog.emplace(id, question_set.take_value());
  }
  return R::ok(std::move(catalog));
}

}  // namespace fhirgate::domain
