#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fhirgate::path {

// normalize_path canonicalizes a path expression for matching.
//   - trims surrounding whitespace
//   - removes a leading "<resource_type>." when resource_type is given
//   - removes ".count()" and ".exists()"
//   - collapses "a.where(p).b" to "a.b" and drops a trailing ".where(p)"
//   - removes concrete "[n]" markers, keeps "[*]"
// Pure and idempotent: normalize_path(normalize_path(p)) == normalize_path(p).
[[nodiscard]] std::string normalize_path(
    std::string_view path, std::optional<std::string_view> resource_type = std::nullopt);

// is_canonical_path: normalize_path would change nothing beyond trimming, so the
// path carries no function, filter or concrete index.
[[nodiscard]] bool is_canonical_path(std::string_view path);

// strip_wildcards removes every "[*]" marker.
[[nodiscard]] std::string strip_wildcards(std::string_view path);

// Match predicates. Both arguments are normalized before comparison.

// Normalized forms are string-equal.
[[nodiscard]] bool is_exact_match(std::string_view rule_path, std::string_view target_path);

// rule_path carries [*]; with the markers stripped it equals a non-wildcard target.
// Asymmetric: a plain rule never wildcard-matches a wildcard target.
[[nodiscard]] bool is_wildcard_match(std::string_view rule_path, std::string_view target_path);

// target_path is strictly below rule_path ("identifier" covers "identifier.system").
[[nodiscard]] bool is_parent_match(std::string_view rule_path, std::string_view target_path);

}  // namespace fhirgate::path
