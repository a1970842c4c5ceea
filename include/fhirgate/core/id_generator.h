#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace fhirgate::core {

// Longest id the FHIR "id" datatype allows. Generated trace and event ids
// stay within it so they can be echoed into OperationOutcome resources.
inline constexpr std::size_t kMaxFhirIdLength = 64;

// IIdGenerator hands out trace and audit event identifiers.
// Contract: the result starts with prefix followed by '-', uses only
// [A-Za-z0-9-.] when prefix does, and is at most kMaxFhirIdLength long.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<base36 epoch micros>-<base36 counter>". Unique within the process.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-<n>" with one counter shared by all prefixes, starting at 0.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace fhirgate::core
