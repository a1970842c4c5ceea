#include "fhirgate/path/condition.h"

#include "fhirgate/core/normalization.h"
#include "fhirgate/path/json_navigator.h"

#include <algorithm>
#include <cstdlib>

namespace fhirgate::path {

namespace {

using nlohmann::json;

enum class TokenKind {
  kPath,
  kString,
  kNumber,
  kOperator,
  kOpenParen,
  kCloseParen,
  kEnd,
};

struct Token {
  TokenKind kind{TokenKind::kEnd};
  std::string text;
};

bool is_path_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || core::is_ascii_digit(ch) ||
         ch == '_' || ch == '.' || ch == '[' || ch == ']' || ch == '*';
}

core::Result<std::vector<Token>, std::string> tokenize(const std::string_view text) {
  using R = core::Result<std::vector<Token>, std::string>;
  std::vector<Token> tokens;
  std::size_t i = 0;

  while (i < text.size()) {
    const char ch = text[i];
    if (core::is_ascii_space(ch)) {
      ++i;
    } else if (ch == '(') {
      tokens.push_back({TokenKind::kOpenParen, "("});
      ++i;
    } else if (ch == ')') {
      tokens.push_back({TokenKind::kCloseParen, ")"});
      ++i;
    } else if (ch == '\'') {
      const auto close = text.find('\'', i + 1);
      if (close == std::string_view::npos) {
        return R::err("unterminated string literal");
      }
      tokens.push_back({TokenKind::kString, std::string(text.substr(i + 1, close - i - 1))});
      i = close + 1;
    } else if (ch == '=' || ch == '!' || ch == '<' || ch == '>') {
      std::string op(1, ch);
      if (i + 1 < text.size() && text[i + 1] == '=') {
        op.push_back('=');
      }
      if (op == "!") {
        return R::err("unexpected '!'");
      }
      tokens.push_back({TokenKind::kOperator, op});
      i += op.size();
    } else if (core::is_ascii_digit(ch) || (ch == '-' && i + 1 < text.size() &&
                                             core::is_ascii_digit(text[i + 1]))) {
      std::size_t end = i + 1;
      while (end < text.size() && (core::is_ascii_digit(text[end]) || text[end] == '.')) {
        ++end;
      }
      tokens.push_back({TokenKind::kNumber, std::string(text.substr(i, end - i))});
      i = end;
    } else if (is_path_char(ch)) {
      std::size_t end = i;
      while (end < text.size() && is_path_char(text[end])) {
        ++end;
      }
      tokens.push_back({TokenKind::kPath, std::string(text.substr(i, end - i))});
      i = end;
    } else {
      return R::err(std::string("unexpected character '") + ch + "'");
    }
  }

  tokens.push_back({TokenKind::kEnd, ""});
  return R::ok(std::move(tokens));
}

core::Result<CompareOp, std::string> to_compare_op(const std::string& text) {
  using R = core::Result<CompareOp, std::string>;
  if (text == "=") {
    return R::ok(CompareOp::kEqual);
  }
  if (text == "!=") {
    return R::ok(CompareOp::kNotEqual);
  }
  if (text == ">") {
    return R::ok(CompareOp::kGreater);
  }
  if (text == ">=") {
    return R::ok(CompareOp::kGreaterEqual);
  }
  if (text == "<") {
    return R::ok(CompareOp::kLess);
  }
  if (text == "<=") {
    return R::ok(CompareOp::kLessEqual);
  }
  return R::err("unknown operator '" + text + "'");
}

// Recursive-descent parser over the token list. Errors are sticky: the first one
// recorded wins and parsing unwinds.
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  core::Result<ConditionNode, std::string> parse() {
    using R = core::Result<ConditionNode, std::string>;
    ConditionNode root = parse_or();
    if (error_.empty() && peek().kind != TokenKind::kEnd) {
      fail("unexpected '" + peek().text + "'");
    }
    if (!error_.empty()) {
      return R::err(error_);
    }
    return R::ok(std::move(root));
  }

 private:
  const Token& peek() const { return tokens_[pos_]; }

  Token take() {
    Token token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
      ++pos_;
    }
    return token;
  }

  bool at_keyword(const std::string_view keyword) const {
    return peek().kind == TokenKind::kPath && peek().text == keyword;
  }

  void fail(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
    }
  }

  ConditionNode parse_or() {
    ConditionNode left = parse_and();
    if (!at_keyword("or")) {
      return left;
    }
    ConditionNode node;
    node.kind = ConditionNode::Kind::kOr;
    node.children.push_back(std::move(left));
    while (error_.empty() && at_keyword("or")) {
      take();
      node.children.push_back(parse_and());
    }
    return node;
  }

  ConditionNode parse_and() {
    ConditionNode left = parse_unary();
    if (!at_keyword("and")) {
      return left;
    }
    ConditionNode node;
    node.kind = ConditionNode::Kind::kAnd;
    node.children.push_back(std::move(left));
    while (error_.empty() && at_keyword("and")) {
      take();
      node.children.push_back(parse_unary());
    }
    return node;
  }

  ConditionNode parse_unary() {
    if (!error_.empty()) {
      return {};
    }
    if (at_keyword("not")) {
      take();
      ConditionNode node;
      node.kind = ConditionNode::Kind::kNot;
      node.children.push_back(parse_unary());
      return node;
    }
    if (peek().kind == TokenKind::kOpenParen) {
      take();
      ConditionNode inner = parse_or();
      if (peek().kind != TokenKind::kCloseParen) {
        fail("expected ')'");
      } else {
        take();
      }
      return inner;
    }
    return parse_predicate();
  }

  ConditionNode parse_predicate() {
    ConditionNode node;
    if (peek().kind != TokenKind::kPath) {
      fail(peek().kind == TokenKind::kEnd ? "unexpected end of expression"
                                          : "expected a path, got '" + peek().text + "'");
      return node;
    }

    std::string path_text = take().text;
    Predicate& predicate = node.predicate;

    // "name.exists()" lexes as path "name.exists" followed by "(" ")".
    if (peek().kind == TokenKind::kOpenParen) {
      take();
      if (peek().kind != TokenKind::kCloseParen) {
        fail("function arguments are not supported in '" + path_text + "'");
        return node;
      }
      take();
      const auto dot = path_text.rfind('.');
      const std::string function = dot == std::string::npos ? "" : path_text.substr(dot + 1);
      path_text = dot == std::string::npos ? "" : path_text.substr(0, dot);
      if (function == "exists") {
        predicate.kind = PredicateKind::kExists;
      } else if (function == "empty") {
        predicate.kind = PredicateKind::kEmpty;
      } else if (function == "count") {
        predicate.kind = PredicateKind::kCountCompare;
      } else {
        fail("unsupported function '" + function + "()'");
        return node;
      }
    }

    auto segments = parse_path(path_text);
    if (!segments.has_value()) {
      fail(segments.error());
      return node;
    }
    predicate.path = segments.value();

    if (predicate.kind == PredicateKind::kExists || predicate.kind == PredicateKind::kEmpty) {
      return node;
    }

    if (peek().kind != TokenKind::kOperator) {
      if (predicate.kind == PredicateKind::kCountCompare) {
        fail("count() must be compared with a number");
      }
      return node;
    }

    auto op = to_compare_op(take().text);
    if (!op.has_value()) {
      fail(op.error());
      return node;
    }
    predicate.op = op.value();

    const Token literal = take();
    switch (literal.kind) {
      case TokenKind::kString:
        predicate.literal = literal.text;
        break;
      case TokenKind::kNumber:
        predicate.literal = json::parse(literal.text, nullptr, false);
        if (predicate.literal.is_discarded()) {
          fail("invalid number '" + literal.text + "'");
        }
        break;
      case TokenKind::kPath:
        if (literal.text == "true" || literal.text == "false") {
          predicate.literal = literal.text == "true";
          break;
        }
        fail("expected a literal, got '" + literal.text + "'");
        break;
      default:
        fail("expected a literal after operator");
        break;
    }

    if (predicate.kind == PredicateKind::kCountCompare) {
      if (!predicate.literal.is_number_integer()) {
        fail("count() must be compared with an integer");
      }
    } else {
      predicate.kind = PredicateKind::kValueCompare;
    }
    return node;
  }

  std::vector<Token> tokens_;
  std::size_t pos_{0};
  std::string error_;
};

bool apply_order(const CompareOp op, const int ordering) {
  switch (op) {
    case CompareOp::kEqual:
      return ordering == 0;
    case CompareOp::kNotEqual:
      return ordering != 0;
    case CompareOp::kGreater:
      return ordering > 0;
    case CompareOp::kGreaterEqual:
      return ordering >= 0;
    case CompareOp::kLess:
      return ordering < 0;
    case CompareOp::kLessEqual:
      return ordering <= 0;
  }
  return false;
}

// Type-aware comparison of one record value with a literal. Mismatched kinds never compare.
bool compare_value(const json& value, const CompareOp op, const json& literal) {
  if (literal.is_number() && value.is_number()) {
    const double lhs = value.get<double>();
    const double rhs = literal.get<double>();
    return apply_order(op, lhs < rhs ? -1 : (lhs > rhs ? 1 : 0));
  }
  if (literal.is_string() && value.is_string()) {
    const int cmp = value.get_ref<const std::string&>().compare(literal.get_ref<const std::string&>());
    return apply_order(op, cmp < 0 ? -1 : (cmp > 0 ? 1 : 0));
  }
  if (literal.is_boolean() && value.is_boolean()) {
    if (op != CompareOp::kEqual && op != CompareOp::kNotEqual) {
      return false;
    }
    return apply_order(op, value.get<bool>() == literal.get<bool>() ? 0 : 1);
  }
  return false;
}

bool evaluate_node(const ConditionNode& node, const json& context) {
  switch (node.kind) {
    case ConditionNode::Kind::kPredicate:
      return evaluate_predicate(node.predicate, context);
    case ConditionNode::Kind::kAnd:
      return std::all_of(node.children.begin(), node.children.end(),
                         [&](const ConditionNode& child) { return evaluate_node(child, context); });
    case ConditionNode::Kind::kOr:
      return std::any_of(node.children.begin(), node.children.end(),
                         [&](const ConditionNode& child) { return evaluate_node(child, context); });
    case ConditionNode::Kind::kNot:
      return !evaluate_node(node.children.front(), context);
  }
  return false;
}

}  // namespace

core::Result<Condition, std::string> Condition::parse(const std::string_view text) {
  using R = core::Result<Condition, std::string>;

  const std::string trimmed = core::trim(text);
  if (trimmed.empty()) {
    return R::err("expression is empty");
  }

  auto tokens = tokenize(trimmed);
  if (!tokens.has_value()) {
    return R::err(tokens.error());
  }

  Parser parser(tokens.take_value());
  auto root = parser.parse();
  if (!root.has_value()) {
    return R::err(root.error());
  }
  return R::ok(Condition(trimmed, root.take_value()));
}

bool Condition::evaluate(const json& context) const {
  return evaluate_node(root_, context);
}

bool evaluate_predicate(const Predicate& predicate, const json& context) {
  const auto selected = select_nodes(context, predicate.path);

  switch (predicate.kind) {
    case PredicateKind::kTruthy:
      return !selected.empty() && std::all_of(selected.begin(), selected.end(), [](const auto& s) {
               return s.node->is_boolean() && s.node->template get<bool>();
             });
    case PredicateKind::kExists:
      return std::any_of(selected.begin(), selected.end(),
                         [](const auto& s) { return !is_empty_value(*s.node); });
    case PredicateKind::kEmpty:
      return std::none_of(selected.begin(), selected.end(),
                          [](const auto& s) { return !is_empty_value(*s.node); });
    case PredicateKind::kCountCompare:
      return compare_value(json(selected.size()), predicate.op, predicate.literal);
    case PredicateKind::kValueCompare:
      return std::any_of(selected.begin(), selected.end(), [&](const auto& s) {
        return compare_value(*s.node, predicate.op, predicate.literal);
      });
  }
  return false;
}

std::string compare_op_to_string(const CompareOp op) {
  switch (op) {
    case CompareOp::kEqual:
      return "=";
    case CompareOp::kNotEqual:
      return "!=";
    case CompareOp::kGreater:
      return ">";
    case CompareOp::kGreaterEqual:
      return ">=";
    case CompareOp::kLess:
      return "<";
    case CompareOp::kLessEqual:
      return "<=";
  }
  return "=";
}

}  // namespace fhirgate::path
