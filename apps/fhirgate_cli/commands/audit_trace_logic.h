#pragma once

#include "fhirgate/core/services.h"

#include <string>

int execute_audit_trace(const std::string& trace_id, fhirgate::core::Services& services);
