#include "fhirgate/evaluation/question_answer_evaluator.h"

#include "fhirgate/domain/error_codes.h"
#include "fhirgate/path/json_navigator.h"

#include <algorithm>
#include <array>
#include <regex>
#include <string_view>
#include <utility>

namespace fhirgate::evaluation {

namespace {

using nlohmann::json;
using domain::AnswerType;

struct SuffixType {
  std::string_view suffix;
  AnswerType type;
};

constexpr std::array<SuffixType, 7> kSuffixTypes{{
    {"CodeableConcept", AnswerType::kCode},
    {"Coding", AnswerType::kCode},
    {"Code", AnswerType::kCode},
    {"Quantity", AnswerType::kQuantity},
    {"Integer", AnswerType::kInteger},
    {"Decimal", AnswerType::kDecimal},
    {"String", AnswerType::kString},
}};

std::string string_member(const json& object, const char* key) {
  const auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

// "item[0].valueQuantity" -> "valueQuantity"
std::string last_property(const std::string& concrete_path) {
  const auto dot = concrete_path.rfind('.');
  std::string last = dot == std::string::npos ? concrete_path : concrete_path.substr(dot + 1);
  const auto bracket = last.find('[');
  if (bracket != std::string::npos) {
    last.erase(bracket);
  }
  return last;
}

bool is_coding(const json& value) {
  return value.is_object() && (value.contains("code") || value.contains("system"));
}

// Codings carried by an answer: a CodeableConcept's codings, a Coding, or a bare code.
std::vector<QuestionCoding> answer_codings(const json& answer) {
  std::vector<QuestionCoding> codings;
  if (answer.is_string()) {
    codings.push_back({"", answer.get<std::string>()});
  } else if (answer.is_object() && answer.contains("coding") && answer.at("coding").is_array()) {
    for (const auto& coding : answer.at("coding")) {
      if (coding.is_object()) {
        codings.push_back({string_member(coding, "system"), string_member(coding, "code")});
      }
    }
  } else if (is_coding(answer)) {
    codings.push_back({string_member(answer, "system"), string_member(answer, "code")});
  }
  return codings;
}

// Numeric value of an answer: a number, or a Quantity's value.
std::optional<double> numeric_value(const json& answer) {
  if (answer.is_number()) {
    return answer.get<double>();
  }
  if (answer.is_object() && answer.contains("value") && answer.at("value").is_number()) {
    return answer.at("value").get<double>();
  }
  return std::nullopt;
}

bool type_accepts(const AnswerType expected, const AnswerType actual) {
  return expected == actual || (expected == AnswerType::kDecimal && actual == AnswerType::kInteger);
}

}  // namespace

std::optional<QuestionCoding> extract_question_coding(
    const nlohmann::json& node, const std::vector<path::PathSegment>& question_path) {
  for (const auto& selected : path::select_nodes(node, question_path)) {
    const json& value = *selected.node;
    if (value.is_object() && value.contains("coding") && value.at("coding").is_array()) {
      for (const auto& coding : value.at("coding")) {
        if (coding.is_object() && !string_member(coding, "code").empty()) {
          return QuestionCoding{string_member(coding, "system"), string_member(coding, "code")};
        }
      }
    } else if (is_coding(value) && !string_member(value, "code").empty()) {
      return QuestionCoding{string_member(value, "system"), string_member(value, "code")};
    }
  }
  return std::nullopt;
}

std::optional<domain::AnswerType> infer_answer_type(const std::string& concrete_path,
                                                    const nlohmann::json& value) {
  const std::string property = last_property(concrete_path);
  if (property.starts_with("value") && property.size() > 5) {
    const std::string_view suffix = std::string_view(property).substr(5);
    if (suffix == "Boolean") {
      return AnswerType::kBoolean;
    }
    for (const auto& entry : kSuffixTypes) {
      if (suffix == entry.suffix) {
        return entry.type;
      }
    }
  }

  if (value.is_boolean()) {
    return AnswerType::kBoolean;
  }
  if (value.is_number_integer()) {
    return AnswerType::kInteger;
  }
  if (value.is_number()) {
    return AnswerType::kDecimal;
  }
  if (value.is_string()) {
    return AnswerType::kString;
  }
  if (value.is_object() && value.contains("value") && value.at("value").is_number()) {
    return AnswerType::kQuantity;
  }
  if (value.is_object() && (value.contains("coding") || is_coding(value))) {
    return AnswerType::kCode;
  }
  return std::nullopt;
}

FindingsResult evaluate_question_answer(const domain::Rule& rule,
                                        const domain::QuestionAnswerParams& params,
                                        const scope::Location& location,
                                        const std::vector<path::PathSegment>& iteration_path,
                                        const domain::QuestionSetCatalog& question_sets) {
  const std::string iteration_text = path::format_path(iteration_path);

  const auto set_it = question_sets.find(params.question_set_id);
  if (set_it == question_sets.end()) {
    auto finding = make_rule_finding(
        rule, location, iteration_text,
        "question set '" + params.question_set_id + "' is not available",
        {{"questionSetId", params.question_set_id}});
    finding.code = std::string(domain::codes::kQuestionSetDataMissing);
    return FindingsResult::ok({std::move(finding)});
  }
  const domain::QuestionSet& question_set = set_it->second;

  const auto question_path = path::parse_path(params.question_path);
  const auto answer_path = path::parse_path(params.answer_path);
  if (!question_path.has_value() || !answer_path.has_value()) {
    return FindingsResult::err({core::ConfigErrorKind::kMalformedPath, rule.id,
                                "questionPath and answerPath must be plain relative paths"});
  }

  std::vector<domain::Finding> findings;
  for (const auto& iteration : path::select_nodes(*location.resource, iteration_path)) {
    const auto coding = extract_question_coding(*iteration.node, question_path.value());
    if (!coding.has_value()) {
      continue;
    }

    const json question_facts = {{"questionSetId", params.question_set_id},
                                 {"system", coding->system},
                                 {"code", coding->code}};

    const domain::Question* question = question_set.find(coding->system, coding->code);
    if (question == nullptr) {
      auto finding = make_rule_finding(
          rule, location, iteration.path,
          "question " + coding->system + "|" + coding->code + " is not in question set '" +
              params.question_set_id + "'",
          question_facts);
      finding.code = std::string(domain::codes::kQuestionNotFound);
      finding.severity = domain::Severity::kWarning;
      findings.push_back(std::move(finding));
      continue;
    }

    const auto answers = path::select_nodes(*iteration.node, answer_path.value(), iteration.path);
    const std::string label = question->display.empty() ? coding->code : question->display;

    auto report = [&](const std::string& at, std::string message, json extra) {
      json details = question_facts;
      details.update(extra);
      findings.push_back(make_rule_finding(rule, location, at, std::move(message), std::move(details)));
    };

    switch (params.constraint) {
      case domain::AnswerConstraint::kRequired:
        if (question->required && answers.empty()) {
          report(iteration.path, "question '" + label + "' requires an answer", json::object());
        }
        break;

      case domain::AnswerConstraint::kAnswerType:
        for (const auto& answer : answers) {
          const auto actual = infer_answer_type(answer.path, *answer.node);
          if (!actual.has_value() || !type_accepts(question->answer_type, actual.value())) {
            report(answer.path,
                   "question '" + label + "' expects a " +
                       domain::answer_type_to_string(question->answer_type) + " answer",
                   {{"expectedType", domain::answer_type_to_string(question->answer_type)},
                    {"actualType",
                     actual.has_value() ? domain::answer_type_to_string(actual.value()) : "unknown"}});
            break;
          }
        }
        break;

      case domain::AnswerConstraint::kRange:
        for (const auto& answer : answers) {
          const auto number = numeric_value(*answer.node);
          if (!number.has_value()) {
            continue;
          }
          const bool below = question->min.has_value() && number.value() < question->min.value();
          const bool above = question->max.has_value() && number.value() > question->max.value();
          if (below || above) {
            json extra = {{"actual", number.value()}};
            if (question->min.has_value()) {
              extra["min"] = question->min.value();
            }
            if (question->max.has_value()) {
              extra["max"] = question->max.value();
            }
            report(answer.path, "answer to '" + label + "' is out of range", std::move(extra));
            break;
          }
        }
        break;

      case domain::AnswerConstraint::kValueSet: {
        bool reported = false;
        for (const auto& answer : answers) {
          for (const auto& answer_coding : answer_codings(*answer.node)) {
            const bool system_ok = !question->value_set_system.has_value() ||
                                   answer_coding.system.empty() ||
                                   answer_coding.system == question->value_set_system.value();
            const bool code_ok =
                question->allowed_codes.empty() ||
                std::find(question->allowed_codes.begin(), question->allowed_codes.end(),
                          answer_coding.code) != question->allowed_codes.end();
            if (!system_ok || !code_ok) {
              report(answer.path, "answer to '" + label + "' is not in its value set",
                     {{"answerSystem", answer_coding.system},
                      {"answerCode", answer_coding.code},
                      {"allowedCodes", question->allowed_codes},
                      {"valueSetSystem", question->value_set_system.value_or("")}});
              reported = true;
              break;
            }
          }
          if (reported) {
            break;
          }
        }
        break;
      }

      case domain::AnswerConstraint::kFormat:
        for (const auto& answer : answers) {
          if (!answer.node->is_string()) {
            continue;
          }
          const std::string text = answer.node->get<std::string>();
          if (question->max_length.has_value() && text.size() > question->max_length.value()) {
            report(answer.path, "answer to '" + label + "' is longer than allowed",
                   {{"maxLength", question->max_length.value()}, {"actualLength", text.size()}});
            break;
          }
          if (question->pattern.has_value()) {
            std::regex pattern;
            try {
              pattern = std::regex(question->pattern.value());
            } catch (const std::regex_error& e) {
              return FindingsResult::err({core::ConfigErrorKind::kInvalidDocument, rule.id,
                                          "question set '" + params.question_set_id +
                                              "': pattern does not compile: " + e.what()});
            }
            if (!std::regex_search(text, pattern)) {
              report(answer.path, "answer to '" + label + "' does not match its format",
                     {{"pattern", question->pattern.value()}, {"actual", text}});
              break;
            }
          }
        }
        break;

      case domain::AnswerConstraint::kSingleAnswer:
        if (!question->multiple_allowed && answers.size() > 1) {
          report(iteration.path, "question '" + label + "' allows a single answer",
                 {{"answerCount", answers.size()}});
        }
        break;
    }
  }
  return FindingsResult::ok(std::move(findings));
}

}  // namespace fhirgate::evaluation
