#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/path/path_expression.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::path {

enum class CompareOp {
  kEqual,
  kNotEqual,
  kGreater,
  kGreaterEqual,
  kLess,
  kLessEqual,
};

enum class PredicateKind {
  kTruthy,        // path            -> non-empty and every value is boolean true
  kExists,        // path.exists()
  kEmpty,         // path.empty()
  kCountCompare,  // path.count() <op> number
  kValueCompare,  // path <op> literal
};

struct Predicate {
  std::vector<PathSegment> path;                 // NOLINT(readability-identifier-naming)
  PredicateKind kind{PredicateKind::kTruthy};    // NOLINT(readability-identifier-naming)
  CompareOp op{CompareOp::kEqual};               // NOLINT(readability-identifier-naming)
  nlohmann::json literal;                        // NOLINT(readability-identifier-naming)
};

struct ConditionNode {
  enum class Kind {
    kPredicate,
    kAnd,
    kOr,
    kNot,
  };

  Kind kind{Kind::kPredicate};           // NOLINT(readability-identifier-naming)
  Predicate predicate;                   // NOLINT(readability-identifier-naming)
  std::vector<ConditionNode> children;   // NOLINT(readability-identifier-naming)
};

// Condition is a parsed boolean expression in the governed grammar:
//
//   expr      := and_expr ("or" and_expr)*
//   and_expr  := unary ("and" unary)*
//   unary     := "not" unary | "(" expr ")" | predicate
//   predicate := path [".exists()" | ".empty()" | ".count()" cmp number | cmp literal]
//   cmp       := "=" | "!=" | ">" | ">=" | "<" | "<="
//   literal   := 'string' | number | true | false
//
// Paths are relative to the node the condition is evaluated against.
class Condition {
 public:
  [[nodiscard]] static core::Result<Condition, std::string> parse(std::string_view text);

  // Con.2: evaluation never mutates the parsed tree.
  [[nodiscard]] bool evaluate(const nlohmann::json& context) const;

  [[nodiscard]] const ConditionNode& root() const { return root_; }
  [[nodiscard]] const std::string& text() const { return text_; }

 private:
  Condition(std::string text, ConditionNode root)
      : text_(std::move(text)), root_(std::move(root)) {}

  std::string text_;
  ConditionNode root_;
};

[[nodiscard]] bool evaluate_predicate(const Predicate& predicate, const nlohmann::json& context);

[[nodiscard]] std::string compare_op_to_string(CompareOp op);

}  // namespace fhirgate::path
