#pragma once

#include "fhirgate/app/app_service.h"
#include "fhirgate/core/clock.h"
#include "fhirgate/core/id_generator.h"
#include "fhirgate/core/services.h"

int execute_coverage(const fhirgate::app::CoveragePipelineRequest& request,
                     fhirgate::core::Services& services, fhirgate::core::IIdGenerator& id_gen,
                     fhirgate::core::IClock& clock);
