// config_io.h
#pragma once
#include <string>
#include <vector>

#include "constraints.h"
#include "engine.h"
#include "engine_options.h"
#include "utils.h"

namespace rostra
{

    // Upper-case keys with defaults, like every other tuning block.
    EngineOptions options_from_json(const json &j);

    // [{id, name, category, canEarly, canLate}]
    std::vector<Staff> roster_from_json(const json &j);

    // One constraint object; "type" selects the variant.
    Constraint constraint_from_json(const json &j);

    // Parses and checks a snapshot. Any malformed field surfaces as ConfigurationError
    // naming the constraint it belongs to.
    ConfigSnapshotPtr snapshot_from_json(const json &j);

    // {roster, dateRange, config | (constraints, calendarMandates, ...), predictorFeatures?, rngSeed?}
    // dateRange is either [start, end] or {start, end}.
    GenerationRequest request_from_json(const json &j);

    json options_to_json(const EngineOptions &opt);

} // namespace rostra
