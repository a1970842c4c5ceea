#pragma once

#include "fhirgate/core/id_generator.h"

#include <string>

namespace fhirgate::core {

// Strong ID types (C.11: make concrete types regular).

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& id_gen) {
  return TraceId{id_gen.next("trace")};
}

}  // namespace fhirgate::core
