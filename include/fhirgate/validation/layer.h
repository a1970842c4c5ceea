#pragma once

#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/rule_type.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace fhirgate::validation {

// LayerInfo is the fixed metadata of one validation layer.
struct LayerInfo {
  domain::FindingSource source;  // NOLINT(readability-identifier-naming)
  std::string_view name;         // NOLINT(readability-identifier-naming)
  bool blocking_capable;         // NOLINT(readability-identifier-naming)
};

inline constexpr std::size_t kLayerCount = 6;

// Indexed by FindingSource. lint and spec-hint are advisory and never block.
inline constexpr std::array<LayerInfo, kLayerCount> kLayerTable{{
    {domain::FindingSource::kStructural, "structural", true},
    {domain::FindingSource::kBusiness, "business", true},
    {domain::FindingSource::kTerminology, "terminology", true},
    {domain::FindingSource::kReference, "reference", true},
    {domain::FindingSource::kLint, "lint", false},
    {domain::FindingSource::kSpecHint, "spec-hint", false},
}};

static_assert(kLayerTable[static_cast<std::size_t>(domain::FindingSource::kSpecHint)].source ==
                  domain::FindingSource::kSpecHint,
              "kLayerTable must be indexed by FindingSource");

[[nodiscard]] constexpr const LayerInfo& layer_info(const domain::FindingSource source) {
  return kLayerTable[static_cast<std::size_t>(source)];
}

// A finding blocks when its layer can block and its own severity is not a warning.
// Advisory layers cannot escalate whatever severity they report.
[[nodiscard]] constexpr bool is_blocking(const domain::Severity severity,
                                         const domain::FindingSource source) {
  return severity != domain::Severity::kWarning && layer_info(source).blocking_capable;
}

// IValidationLayer is one independent source of findings over a whole record.
// The engine stamps every finding a layer returns with the layer's source.
class IValidationLayer {
 public:
  virtual ~IValidationLayer() = default;

  [[nodiscard]] virtual domain::FindingSource source() const noexcept = 0;

  // Con.2: layers do not change state while validating.
  [[nodiscard]] virtual std::vector<domain::Finding> validate(
      const nlohmann::json& record) const = 0;

 protected:
  IValidationLayer() = default;
  IValidationLayer(const IValidationLayer&) = default;
  IValidationLayer& operator=(const IValidationLayer&) = default;
  IValidationLayer(IValidationLayer&&) = default;
  IValidationLayer& operator=(IValidationLayer&&) = default;
};

// PrecomputedFindingsLayer replays findings an external collaborator already produced
// (structural conformance, terminology, lint) for the record being validated.
class PrecomputedFindingsLayer final : public IValidationLayer {
 public:
  PrecomputedFindingsLayer(domain::FindingSource source, std::vector<domain::Finding> findings);

  [[nodiscard]] domain::FindingSource source() const noexcept override { return source_; }
  [[nodiscard]] std::vector<domain::Finding> validate(
      const nlohmann::json& record) const override;

 private:
  domain::FindingSource source_;
  std::vector<domain::Finding> findings_;
};

}  // namespace fhirgate::validation
