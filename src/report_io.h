// report_io.h
#pragma once
#include <string>
#include <vector>

#include "engine.h"
#include "utils.h"

namespace rostra
{

    // {id, kind, tier, hard, severity, priority, cells:[{staffId, date}], magnitude, weight, message}
    json violation_to_json(const Violation &v, const std::vector<std::string> &staff_ids, const Horizon &horizon);

    // Deterministic rendering: no timings, object keys sorted by nlohmann::json,
    // arrays in schedule / report order. Same request and seed give the same dump.
    json report_to_json(const GenerationReport &report);

    // Writes report_to_json(report).dump(2) to path; throws std::runtime_error on I/O failure.
    void write_report(const GenerationReport &report, const std::string &path);

} // namespace rostra
