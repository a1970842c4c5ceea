#include "fhirgate/path/path_expression.h"
#include "fhirgate/path/path_matcher.h"
#include "fhirgate/path/path_normalizer.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace fhirgate;

TEST_CASE("normalize_path strips resource prefix only when a type is given", "[path][normalize]") {
  CHECK(path::normalize_path("Patient.name.family", "Patient") == "name.family");
  CHECK(path::normalize_path("Patient.name.family") == "Patient.name.family");
  CHECK(path::normalize_path("Observation.code", "Patient") == "Observation.code");
  CHECK(path::normalize_path("  gender  ", "Patient") == "gender");
}

TEST_CASE("normalize_path removes functions, where clauses and concrete indices",
          "[path][normalize]") {
  SECTION("functions") {
    CHECK(path::normalize_path("identifier.count()") == "identifier");
    CHECK(path::normalize_path("telecom.exists()") == "telecom");
  }

  SECTION("where clauses") {
    CHECK(path::normalize_path("name.where(use='official').family") == "name.family");
    CHECK(path::normalize_path("identifier.where(system='urn:a')") == "identifier");
    CHECK(path::normalize_path("a.where(b.where(c='x').exists()).d") == "a.d");
  }

  SECTION("indices") {
    CHECK(path::normalize_path("name[0].given[12]") == "name.given");
    CHECK(path::normalize_path("identifier[*].system") == "identifier[*].system");
    CHECK(path::normalize_path("value[x]") == "value[x]");
  }
}

TEST_CASE("normalize_path is idempotent", "[path][normalize]") {
  const std::vector<std::string> inputs = {
      "Patient.name[0].given",
      "Patient.identifier.where(system='urn:oid:1').value",
      "  Patient.telecom.count()  ",
      "identifier[*].system",
      "",
  };
  for (const auto& input : inputs) {
    const std::string once = path::normalize_path(input, "Patient");
    CHECK(path::normalize_path(once, "Patient") == once);
  }
}

TEST_CASE("strip_wildcards removes every [*]", "[path][normalize]") {
  CHECK(path::strip_wildcards("entry[*].resource.identifier[*].value") ==
        "entry.resource.identifier.value");
  CHECK(path::strip_wildcards("name.family") == "name.family");
}

TEST_CASE("exact match compares normalized forms", "[path][match]") {
  CHECK(path::is_exact_match("name[0].family", "name.family"));
  CHECK(path::is_exact_match("name.family", "name.family"));
  CHECK_FALSE(path::is_exact_match("name.given", "name.family"));
}

TEST_CASE("wildcard match is asymmetric", "[path][match]") {
  CHECK(path::is_wildcard_match("identifier[*].system", "identifier.system"));
  CHECK_FALSE(path::is_wildcard_match("identifier.system", "identifier[*].system"));
  CHECK_FALSE(path::is_wildcard_match("identifier[*].system", "identifier[*].system"));
  CHECK_FALSE(path::is_wildcard_match("identifier.system", "identifier.system"));
}

TEST_CASE("parent match requires a strict dotted prefix", "[path][match]") {
  CHECK(path::is_parent_match("identifier", "identifier.system"));
  CHECK(path::is_parent_match("name", "name.given"));
  CHECK_FALSE(path::is_parent_match("identifier", "identifier"));
  CHECK_FALSE(path::is_parent_match("ident", "identifier.system"));
  CHECK_FALSE(path::is_parent_match("", "identifier"));
  CHECK_FALSE(path::is_parent_match("identifier.system", "identifier"));
}

TEST_CASE("match_best_path prefers exact over wildcard over parent", "[path][match]") {
  SECTION("exact beats an earlier parent") {
    const std::vector<std::string> rules = {"identifier", "identifier.system"};
    const auto match = path::match_best_path(rules, "identifier.system");
    REQUIRE(match.has_value());
    CHECK(match->index == 1);
    CHECK(match->type == path::MatchType::kExact);
  }

  SECTION("wildcard beats an earlier parent") {
    const std::vector<std::string> rules = {"identifier", "identifier[*].system"};
    const auto match = path::match_best_path(rules, "identifier.system");
    REQUIRE(match.has_value());
    CHECK(match->index == 1);
    CHECK(match->type == path::MatchType::kWildcard);
  }

  SECTION("first candidate wins within a pass") {
    const std::vector<std::string> rules = {"name", "name"};
    const auto match = path::match_best_path(rules, "name.family");
    REQUIRE(match.has_value());
    CHECK(match->index == 0);
    CHECK(match->type == path::MatchType::kParent);
  }

  SECTION("no candidate") {
    const std::vector<std::string> rules = {"gender", "birthDate"};
    CHECK_FALSE(path::match_best_path(rules, "name.family").has_value());
    CHECK_FALSE(path::match_best_path({}, "name").has_value());
  }
}

TEST_CASE("match_type_to_string", "[path][match]") {
  CHECK(path::match_type_to_string(path::MatchType::kExact) == "exact");
  CHECK(path::match_type_to_string(path::MatchType::kWildcard) == "wildcard");
  CHECK(path::match_type_to_string(path::MatchType::kParent) == "parent");
}

TEST_CASE("parse_path reads segments and markers", "[path][parse]") {
  auto parsed = path::parse_path("name[1].given");
  REQUIRE(parsed.has_value());
  const auto& segments = parsed.value();
  REQUIRE(segments.size() == 2);
  CHECK(segments[0].name == "name");
  CHECK(segments[0].marker == path::SegmentMarker::kIndex);
  CHECK(segments[0].index == 1);
  CHECK(segments[1].name == "given");
  CHECK(segments[1].marker == path::SegmentMarker::kNone);

  auto choice = path::parse_path("value[x]");
  REQUIRE(choice.has_value());
  CHECK(choice.value()[0].marker == path::SegmentMarker::kChoice);

  auto wildcard = path::parse_path("identifier[*].value");
  REQUIRE(wildcard.has_value());
  CHECK(wildcard.value()[0].marker == path::SegmentMarker::kWildcard);
  CHECK(path::format_path(wildcard.value()) == "identifier[*].value");
}

TEST_CASE("parse_path rejects malformed paths", "[path][parse]") {
  CHECK_FALSE(path::parse_path("").has_value());
  CHECK_FALSE(path::parse_path("name..given").has_value());
  CHECK_FALSE(path::parse_path("name.").has_value());
  CHECK_FALSE(path::parse_path("name[").has_value());
  CHECK_FALSE(path::parse_path("name.where(use='official')").has_value());
}

TEST_CASE("check_authoring_syntax accepts the forms governance flags later", "[path][parse]") {
  CHECK(path::check_authoring_syntax("name.family").has_value());
  CHECK(path::check_authoring_syntax("name.where(use='official').family").has_value());
  CHECK(path::check_authoring_syntax("identifier.exists()").has_value());
  CHECK(path::check_authoring_syntax("identifier.count()").has_value());
  CHECK_FALSE(path::check_authoring_syntax("name.where(use='official'").has_value());
  CHECK_FALSE(path::check_authoring_syntax("").has_value());
}
