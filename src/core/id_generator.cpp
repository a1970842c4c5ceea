#include "fhirgate/core/id_generator.h"

#include <algorithm>
#include <chrono>

namespace fhirgate::core {

namespace {

std::string to_base36(unsigned long long value) {
  constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::string out;
  do {
    out.push_back(kDigits[value % 36]);
    value /= 36;
  } while (value != 0);
  std::reverse(out.begin(), out.end());
  return out;
}

// Long prefixes are cut so that the id never exceeds kMaxFhirIdLength.
std::string compose(std::string_view prefix, const std::string& suffix) {
  const std::size_t room = kMaxFhirIdLength - std::min(kMaxFhirIdLength - 1, suffix.size() + 1);
  std::string id(prefix.substr(0, room));
  id.push_back('-');
  id += suffix.substr(0, kMaxFhirIdLength - id.size());
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return compose(prefix, to_base36(static_cast<unsigned long long>(micros)) + "-" + to_base36(c));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return compose(prefix, std::to_string(c));
}

}  // namespace fhirgate::core
