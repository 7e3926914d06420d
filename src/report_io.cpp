// report_io.cpp
#include "report_io.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace rostra
{

    namespace
    {

        json cells_to_json(const std::vector<CellRef> &cells, const std::vector<std::string> &staff_ids,
                           const Horizon &horizon)
        {
            json out = json::array();
            for (const auto &c : cells)
                out.push_back({{"staffId", staff_ids[c.staff]}, {"date", horizon.dates[c.day]}});
            return out;
        }

        json violations_to_json(const std::vector<Violation> &vs, const std::vector<std::string> &staff_ids,
                                const Horizon &horizon)
        {
            json out = json::array();
            for (const auto &v : vs)
                out.push_back(violation_to_json(v, staff_ids, horizon));
            return out;
        }

    } // namespace

    json violation_to_json(const Violation &v, const std::vector<std::string> &staff_ids, const Horizon &horizon)
    {
        json j;
        j["id"] = v.constraint_id;
        j["kind"] = PriorityRegistry::info(v.kind).id;
        j["tier"] = v.tier;
        j["hard"] = v.hard;
        j["severity"] = severity_name(v.severity);
        j["priority"] = v.priority;
        j["cells"] = cells_to_json(v.cells, staff_ids, horizon);
        j["magnitude"] = v.magnitude;
        j["weight"] = v.weight;
        j["message"] = v.message;
        return j;
    }

    json report_to_json(const GenerationReport &r)
    {
        json j;
        j["configVersion"] = r.config_version;
        j["dateRange"] = json::array();
        if (r.horizon.size() > 0)
            j["dateRange"] = {r.horizon.dates.front(), r.horizon.dates.back()};
        j["rngSeed"] = r.rng_seed;

        // Row per staff, one value per date.
        json rows = json::array();
        for (int s = 0; s < r.schedule.staff_count(); ++s)
        {
            json row = json::array();
            for (int d = 0; d < r.schedule.day_count(); ++d)
                row.push_back(shift_name(r.schedule.at(s, d)));
            rows.push_back({{"staffId", r.staff_ids[s]}, {"shifts", row}});
        }
        j["schedule"] = {{"dates", r.horizon.dates}, {"rows", rows}};

        j["method"] = method_name(r.method);
        j["confidenceBand"] = band_name(r.band);
        j["confidence"] = r.confidence;
        j["predictor"] = {{"status", predictor_status_name(r.predictor_status)}, {"reason", r.predictor_reason}};
        j["fallbackReason"] = r.fallback_reason;

        j["preRepairViolations"] = violations_to_json(r.pre_repair_violations, r.staff_ids, r.horizon);
        j["violations"] = violations_to_json(r.final_violations, r.staff_ids, r.horizon);

        json actions = json::array();
        for (const auto &a : r.repair.actions)
            actions.push_back({{"id", a.constraint_id},
                               {"kind", PriorityRegistry::info(a.kind).id},
                               {"staffId", r.staff_ids[a.cell.staff]},
                               {"date", r.horizon.dates[a.cell.day]},
                               {"from", shift_name(a.from)},
                               {"to", shift_name(a.to)},
                               {"pass", a.pass}});
        j["repair"] = {{"attempted", r.repair.attempted},
                       {"repaired", r.repair.repaired},
                       {"passes", r.repair.passes},
                       {"solverUsed", r.repair.solver_used},
                       {"solverImproved", r.repair.solver_improved},
                       {"solverStatus", r.repair.solver_status},
                       {"actions", actions},
                       {"unresolved", violations_to_json(r.repair.unresolved, r.staff_ids, r.horizon)}};

        j["metrics"] = {{"offDayMean", r.metrics.off_day_mean},
                        {"offDayVariance", r.metrics.off_day_variance},
                        {"offDayTarget", r.metrics.off_day_target},
                        {"offDaysPerStaff", r.metrics.off_days_per_staff},
                        {"preferredApplicable", r.metrics.preferred_applicable},
                        {"preferredHonored", r.metrics.preferred_honored},
                        {"preferredHonorRate", r.metrics.preferred_honor_rate},
                        {"penaltyScore", r.metrics.penalty_score}};

        j["locks"] = {{"total", r.lock_summary.total},
                      {"mustWorkCells", r.lock_summary.must_work_cells},
                      {"earlyCells", r.lock_summary.early_cells},
                      {"offCells", r.lock_summary.off_cells},
                      {"prefilledCells", r.lock_summary.prefilled_cells},
                      {"prefilledSkipped", r.lock_summary.prefilled_skipped},
                      {"mustWorkDates", r.lock_summary.must_work_dates},
                      {"mustOffDates", r.lock_summary.must_off_dates}};

        json stages = json::array();
        for (const auto &st : r.stages)
            stages.push_back({{"stage", st.stage}, {"pass", st.pass}, {"cellsChanged", st.cells_changed}});
        j["stages"] = stages;
        return j;
    }

    void write_report(const GenerationReport &report, const std::string &path)
    {
        const fs::path p(path);
        if (p.has_parent_path())
            fs::create_directories(p.parent_path());
        std::ofstream f(p);
        if (!f)
            throw std::runtime_error("Cannot open " + path + " for writing.");
        f << report_to_json(report).dump(2) << "\n";
    }

} // namespace rostra
