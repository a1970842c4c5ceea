#include "fhirgate/path/path_normalizer.h"

#include "fhirgate/core/normalization.h"

namespace fhirgate::path {

namespace {

void erase_all(std::string& text, const std::string_view needle) {
  for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos)) {
    text.erase(pos, needle.size());
  }
}

// Index of the ')' closing the '(' at open, honouring quoted literals; npos when unbalanced.
std::size_t find_closing_paren(const std::string& text, const std::size_t open) {
  int depth = 0;
  char quote = '\0';
  for (std::size_t i = open; i < text.size(); ++i) {
    const char ch = text[i];
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      }
    } else if (ch == '\'' || ch == '"') {
      quote = ch;
    } else if (ch == '(') {
      ++depth;
    } else if (ch == ')' && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// "a.where(p).b" -> "a.b", "a.where(p)" -> "a".
void remove_where_clauses(std::string& text) {
  constexpr std::string_view kWhere = ".where(";
  for (auto pos = text.find(kWhere); pos != std::string::npos; pos = text.find(kWhere, pos)) {
    const auto close = find_closing_paren(text, pos + kWhere.size() - 1);
    if (close == std::string::npos) {
      return;
    }
    text.erase(pos, close - pos + 1);
  }
}

void remove_concrete_indices(std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '[') {
      std::size_t j = i + 1;
      while (j < text.size() && core::is_ascii_digit(text[j])) {
        ++j;
      }
      if (j > i + 1 && j < text.size() && text[j] == ']') {
        i = j;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  text = std::move(out);
}

}  // namespace

std::string normalize_path(const std::string_view path,
                           const std::optional<std::string_view> resource_type) {
  std::string normalized = core::trim(path);

  if (resource_type.has_value() && !resource_type->empty()) {
    const std::string prefix = std::string(*resource_type) + ".";
    if (normalized.starts_with(prefix)) {
      normalized.erase(0, prefix.size());
    }
  }

  erase_all(normalized, ".count()");
  erase_all(normalized, ".exists()");
  remove_where_clauses(normalized);
  remove_concrete_indices(normalized);

  return normalized;
}

bool is_canonical_path(const std::string_view path) {
  const std::string trimmed = core::trim(path);
  return normalize_path(trimmed) == trimmed;
}

std::string strip_wildcards(const std::string_view path) {
  std::string stripped(path);
  erase_all(stripped, "[*]");
  return stripped;
}

bool is_exact_match(const std::string_view rule_path, const std::string_view target_path) {
  return normalize_path(rule_path) == normalize_path(target_path);
}

bool is_wildcard_match(const std::string_view rule_path, const std::string_view target_path) {
  const std::string rule = normalize_path(rule_path);
  const std::string target = normalize_path(target_path);

  if (rule.find("[*]") == std::string::npos || target.find("[*]") != std::string::npos) {
    return false;
  }
  return strip_wildcards(rule) == target;
}

bool is_parent_match(const std::string_view rule_path, const std::string_view target_path) {
  const std::string rule = normalize_path(rule_path);
  if (rule.empty()) {
    return false;
  }
  return normalize_path(target_path).starts_with(rule + ".");
}

}  // namespace fhirgate::path
