#pragma once

#include "fhirgate/domain/rule.h"

#include <vector>

int execute_review(const std::vector<fhirgate::domain::Rule>& rules);
