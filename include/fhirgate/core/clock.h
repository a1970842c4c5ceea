#pragma once

#include <string>
#include <utility>

namespace fhirgate::core {

// IClock stamps audit events and rule-set revisions.
// Timestamps use the FHIR instant format: UTC, "Z" suffix, never empty.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Wall clock with millisecond precision, e.g. "2026-03-04T05:06:07.089Z".
class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Returns the same instant on every call; used by --deterministic runs and tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string instant) : instant_(std::move(instant)) {}

  std::string now_iso8601() override { return instant_; }

 private:
  std::string instant_;
};

}  // namespace fhirgate::core
