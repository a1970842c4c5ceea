#pragma once

#include "fhirgate/app/app_service.h"
#include "fhirgate/core/clock.h"
#include "fhirgate/core/id_generator.h"
#include "fhirgate/core/services.h"

// Interface types only: no concrete storage header may be included in this TU.
int execute_save_rules(const fhirgate::app::RuleSetSaveRequest& request,
                       fhirgate::core::Services& services, fhirgate::core::IIdGenerator& id_gen,
                       fhirgate::core::IClock& clock);
