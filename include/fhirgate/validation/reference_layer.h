#pragma once

#include "fhirgate/validation/layer.h"

#include <optional>
#include <string>

namespace fhirgate::validation {

enum class ReferencePolicy {
  kInBundleOnly,
  kAllowExternal,
};

[[nodiscard]] std::string reference_policy_to_string(ReferencePolicy policy);
[[nodiscard]] std::optional<ReferencePolicy> string_to_reference_policy(const std::string& str);

// ReferenceIntegrityLayer checks that references between bundle entries resolve.
//
// Every "reference" string in an entry's resource is checked once per resource, in
// document order. A reference resolves through an entry fullUrl or a "Type/id" key.
// Contained references ("#id") are not checked.
//   unresolved         REFERENCE_NOT_FOUND (error; warning under kAllowExternal)
//   wrong target type  REFERENCE_TYPE_MISMATCH (error), when the reference declares
//                      a "type" or has the "Type/id" form
class ReferenceIntegrityLayer final : public IValidationLayer {
 public:
  explicit ReferenceIntegrityLayer(ReferencePolicy policy = ReferencePolicy::kInBundleOnly);

  [[nodiscard]] domain::FindingSource source() const noexcept override {
    return domain::FindingSource::kReference;
  }
  [[nodiscard]] std::vector<domain::Finding> validate(
      const nlohmann::json& record) const override;

 private:
  ReferencePolicy policy_;
};

}  // namespace fhirgate::validation
