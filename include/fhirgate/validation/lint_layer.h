#pragma once

#include "fhirgate/validation/layer.h"

#include <string_view>

namespace fhirgate::validation {

namespace lint_codes {
// Record shape (error)
inline constexpr std::string_view kRootNotObject = "LINT_ROOT_NOT_OBJECT";
inline constexpr std::string_view kMissingResourceType = "LINT_MISSING_RESOURCE_TYPE";
inline constexpr std::string_view kEntryNotArray = "LINT_ENTRY_NOT_ARRAY";
inline constexpr std::string_view kEntryNotObject = "LINT_ENTRY_NOT_OBJECT";
inline constexpr std::string_view kEntryMissingResource = "LINT_ENTRY_MISSING_RESOURCE";
inline constexpr std::string_view kResourceNotObject = "LINT_RESOURCE_NOT_OBJECT";
inline constexpr std::string_view kResourceMissingType = "LINT_RESOURCE_MISSING_TYPE";
inline constexpr std::string_view kResourceTypeNotString = "LINT_RESOURCE_TYPE_NOT_STRING";
// Primitive formats
inline constexpr std::string_view kInvalidDate = "LINT_INVALID_DATE";          // warning
inline constexpr std::string_view kInvalidDateTime = "LINT_INVALID_DATETIME";  // warning
inline constexpr std::string_view kBooleanAsString = "LINT_BOOLEAN_AS_STRING";  // error
}  // namespace lint_codes

// LintLayer reports record shapes the rule engine would otherwise skip without a
// word: entries that are not objects, entries without a resource, and resources
// without a string resourceType. It also makes a best-effort check of primitives
// by property name:
//   *Date (not *DateTime)              YYYY, YYYY-MM or YYYY-MM-DD
//   *DateTime, issued, recorded        YYYY-MM-DDThh:mm:ss[.f][Z|+hh:mm]
//   active, *Boolean                   a JSON boolean, not a string
// Lint is advisory: its findings never block, whatever their severity.
class LintLayer final : public IValidationLayer {
 public:
  [[nodiscard]] domain::FindingSource source() const noexcept override {
    return domain::FindingSource::kLint;
  }
  [[nodiscard]] std::vector<domain::Finding> validate(
      const nlohmann::json& record) const override;
};

}  // namespace fhirgate::validation
