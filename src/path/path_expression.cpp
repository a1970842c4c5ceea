#include "fhirgate/path/path_expression.h"

#include "fhirgate/core/normalization.h"

#include <algorithm>

namespace fhirgate::path {

namespace {

using SegmentsResult = core::Result<std::vector<PathSegment>, std::string>;
using PiecesResult = core::Result<std::vector<std::string>, std::string>;

constexpr std::size_t kMaxIndexDigits = 9;

// Splits on '.' at parenthesis depth zero, outside quoted literals.
PiecesResult split_top_level(const std::string_view path) {
  std::vector<std::string> pieces;
  std::string current;
  int depth = 0;
  char quote = '\0';

  for (const char ch : path) {
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '\'' || ch == '"') {
      quote = ch;
      current.push_back(ch);
    } else if (ch == '(') {
      ++depth;
      current.push_back(ch);
    } else if (ch == ')') {
      if (--depth < 0) {
        return PiecesResult::err("unbalanced ')' in '" + std::string(path) + "'");
      }
      current.push_back(ch);
    } else if (ch == '.' && depth == 0) {
      pieces.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }

  if (quote != '\0') {
    return PiecesResult::err("unterminated string literal in '" + std::string(path) + "'");
  }
  if (depth != 0) {
    return PiecesResult::err("unbalanced '(' in '" + std::string(path) + "'");
  }
  pieces.push_back(std::move(current));
  return PiecesResult::ok(std::move(pieces));
}

core::Result<PathSegment, std::string> parse_segment(const std::string& piece,
                                                     const std::string_view path) {
  using R = core::Result<PathSegment, std::string>;

  if (piece.empty()) {
    return R::err("empty segment in '" + std::string(path) + "'");
  }

  const auto open = piece.find('[');
  PathSegment segment;
  segment.name = piece.substr(0, open);
  if (!is_identifier(segment.name)) {
    return R::err("invalid segment '" + piece + "' in '" + std::string(path) + "'");
  }
  if (open == std::string::npos) {
    return R::ok(std::move(segment));
  }

  if (piece.back() != ']' || piece.find('[', open + 1) != std::string::npos) {
    return R::err("invalid marker in segment '" + piece + "'");
  }

  const std::string inner = piece.substr(open + 1, piece.size() - open - 2);
  if (inner == "*") {
    segment.marker = SegmentMarker::kWildcard;
  } else if (inner == "x") {
    segment.marker = SegmentMarker::kChoice;
  } else if (!inner.empty() && inner.size() <= kMaxIndexDigits &&
             std::all_of(inner.begin(), inner.end(), core::is_ascii_digit)) {
    segment.marker = SegmentMarker::kIndex;
    segment.index = static_cast<std::size_t>(std::stoul(inner));
  } else {
    return R::err("invalid marker '[" + inner + "]' in '" + std::string(path) + "'");
  }
  return R::ok(std::move(segment));
}

bool is_where_clause(const std::string& piece) {
  constexpr std::string_view kPrefix = "where(";
  return piece.size() > kPrefix.size() + 1 && piece.starts_with(kPrefix) && piece.back() == ')';
}

}  // namespace

bool is_identifier(const std::string_view text) {
  if (text.empty()) {
    return false;
  }
  const auto is_alpha = [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
  };
  if (!is_alpha(text.front())) {
    return false;
  }
  return std::all_of(text.begin() + 1, text.end(),
                     [&](const char ch) { return is_alpha(ch) || core::is_ascii_digit(ch); });
}

core::Result<std::vector<PathSegment>, std::string> parse_path(const std::string_view path) {
  if (core::trim(path).empty()) {
    return SegmentsResult::err("path is empty");
  }

  auto pieces = split_top_level(path);
  if (!pieces.has_value()) {
    return SegmentsResult::err(pieces.error());
  }

  std::vector<PathSegment> segments;
  for (const auto& piece : pieces.value()) {
    auto segment = parse_segment(piece, path);
    if (!segment.has_value()) {
      return SegmentsResult::err(segment.error());
    }
    segments.push_back(segment.value());
  }
  return SegmentsResult::ok(std::move(segments));
}

core::Result<bool, std::string> check_authoring_syntax(const std::string_view path) {
  using R = core::Result<bool, std::string>;

  if (core::trim(path).empty()) {
    return R::err("path is empty");
  }

  auto pieces = split_top_level(core::trim(path));
  if (!pieces.has_value()) {
    return R::err(pieces.error());
  }

  const auto& list = pieces.value();
  for (std::size_t i = 0; i < list.size(); ++i) {
    const auto& piece = list[i];
    const bool is_function = piece == "exists()" || piece == "count()" || is_where_clause(piece);
    if (is_function) {
      if (i == 0) {
        return R::err("path cannot start with a function: '" + std::string(path) + "'");
      }
      continue;
    }
    auto segment = parse_segment(piece, path);
    if (!segment.has_value()) {
      return R::err(segment.error());
    }
  }
  return R::ok(true);
}

std::string format_path(const std::vector<PathSegment>& segments) {
  std::string out;
  for (const auto& segment : segments) {
    if (!out.empty()) {
      out.push_back('.');
    }
    out += segment.name;
    switch (segment.marker) {
      case SegmentMarker::kNone:
        break;
      case SegmentMarker::kIndex:
        out += "[" + std::to_string(segment.index) + "]";
        break;
      case SegmentMarker::kWildcard:
        out += "[*]";
        break;
      case SegmentMarker::kChoice:
        out += "[x]";
        break;
    }
  }
  return out;
}

}  // namespace fhirgate::path
