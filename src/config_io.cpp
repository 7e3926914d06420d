// config_io.cpp
#include "config_io.h"
#include "errors.h"

#include <stdexcept>
#include <utility>

namespace rostra
{

    namespace
    {

        ShiftValue shift_field(const json &j, const char *key, ShiftValue def)
        {
            if (!j.contains(key) || j[key].is_null())
                return def;
            return parse_shift(j.at(key).get<std::string>());
        }

        std::vector<ShiftValue> shift_list(const json &j, const char *key)
        {
            std::vector<ShiftValue> out;
            if (j.contains(key) && j[key].is_array())
                for (const auto &v : j[key])
                    out.push_back(parse_shift(v.get<std::string>()));
            return out;
        }

        std::vector<std::string> string_list(const json &j, const char *key)
        {
            std::vector<std::string> out;
            if (j.contains(key) && j[key].is_array())
                for (const auto &v : j[key])
                    out.push_back(v.get<std::string>());
            return out;
        }

        std::vector<int> int_list(const json &j, const char *key)
        {
            std::vector<int> out;
            if (j.contains(key) && j[key].is_array())
                for (const auto &v : j[key])
                    out.push_back(v.get<int>());
            return out;
        }

        ConstraintMeta meta_from_json(const json &j)
        {
            ConstraintMeta m;
            m.id = j.at("id").get<std::string>();
            m.tier = j.value("tier", 0);
            if (j.contains("isHardConstraint") && j["isHardConstraint"].is_boolean())
                m.hard = j["isHardConstraint"].get<bool>();
            m.penalty_weight = j.value("penaltyWeight", 0);
            return m;
        }

        Scope scope_from_json(const json &j)
        {
            Scope s;
            if (!j.contains("scope") || j["scope"].is_null())
                return s;
            const json &sj = j["scope"];
            const std::string kind = sj.value("kind", std::string("all"));
            if (kind == "all")
                s.kind = ScopeKind::All;
            else if (kind == "group")
            {
                s.kind = ScopeKind::Group;
                s.group_id = sj.at("groupId").get<std::string>();
            }
            else if (kind == "staff")
            {
                s.kind = ScopeKind::Staff;
                s.staff_ids = string_list(sj, "staffIds");
            }
            else if (kind == "category")
            {
                s.kind = ScopeKind::Category;
                s.category = sj.at("category").get<std::string>();
            }
            else
                throw std::invalid_argument("Unknown scope kind: " + kind);
            return s;
        }

        void limit_from_json(const json &j, LimitSpec &l)
        {
            l.meta = meta_from_json(j);
            l.shift = shift_field(j, "shift", ShiftValue::Off);
            l.min = j.value("min", -1);
            l.max = j.value("max", -1);
            l.scope = scope_from_json(j);
            l.days_of_week = int_list(j, "daysOfWeek");
        }

        StaffGroupRule group_from_json(const json &j)
        {
            StaffGroupRule g;
            g.meta = meta_from_json(j);
            g.name = j.value("name", g.meta.id);
            g.members = string_list(j, "members");
            if (j.contains("conflict") && j["conflict"].is_object())
            {
                ConflictRule c;
                c.max_concurrent_off = j["conflict"].value("maxConcurrentOff", 1);
                c.count_early = j["conflict"].value("countEarly", true);
                g.conflict = c;
            }
            if (j.contains("coverage") && j["coverage"].is_object())
            {
                CoverageRule c;
                c.backup_staff_id = j["coverage"].value("backupStaffId", std::string());
                c.required_shift = shift_field(j["coverage"], "requiredShift", ShiftValue::Normal);
                g.coverage = c;
            }
            if (j.contains("proximity") && j["proximity"].is_object())
            {
                ProximityPattern p;
                p.trigger_staff_id = j["proximity"].at("triggerStaffId").get<std::string>();
                p.target_staff_id = j["proximity"].at("targetStaffId").get<std::string>();
                p.within_days = j["proximity"].value("withinDays", 1);
                g.proximity = p;
            }
            return g;
        }

        PriorityRule priority_from_json(const json &j)
        {
            PriorityRule p;
            p.meta = meta_from_json(j);
            p.type = parse_priority_rule_type(j.at("ruleType").get<std::string>());
            p.staff_ids = string_list(j, "staffIds");
            p.days_of_week = int_list(j, "daysOfWeek");
            p.priority_level = j.value("priorityLevel", 2);
            switch (p.type)
            {
            case PriorityRuleType::AllowOnlyShifts:
                p.shifts = shift_list(j, "allowedShifts");
                break;
            case PriorityRuleType::AvoidShiftWithExceptions:
                p.shift = shift_field(j, "shiftType", ShiftValue::Off);
                p.shifts = shift_list(j, "exceptions");
                break;
            case PriorityRuleType::RequiredOff:
                p.shift = ShiftValue::Off;
                break;
            default:
                p.shift = parse_shift(j.at("shiftType").get<std::string>());
                break;
            }
            return p;
        }

        CalendarMandates mandates_from_json(const json &j)
        {
            CalendarMandates m;
            if (j.is_object())
            {
                m.must_work = string_list(j, "mustWork");
                m.must_off = string_list(j, "mustOff");
            }
            return m;
        }

        PredictorFeatures features_from_json(const json &j)
        {
            PredictorFeatures f;
            if (!j.contains("history") || !j["history"].is_array())
                return f;
            for (const auto &h : j["history"])
            {
                HistoricalSchedule hs;
                hs.label = h.value("label", std::string());
                if (h.contains("cells") && h["cells"].is_array())
                    for (const auto &c : h["cells"])
                    {
                        DateCell dc{c.at("staffId").get<std::string>(), c.at("date").get<std::string>()};
                        hs.cells[dc] = parse_shift(c.at("shift").get<std::string>());
                    }
                f.history.push_back(std::move(hs));
            }
            return f;
        }

        std::string id_hint(const json &j)
        {
            if (j.is_object() && j.contains("id") && j["id"].is_string())
                return j["id"].get<std::string>();
            return "snapshot";
        }

    } // namespace

    EngineOptions options_from_json(const json &j)
    {
        EngineOptions o;
        o.high_confidence = j.value("HIGH_CONFIDENCE", o.high_confidence);
        o.medium_confidence = j.value("MEDIUM_CONFIDENCE", o.medium_confidence);
        o.predictor_timeout_ms = j.value("PREDICTOR_TIMEOUT_MS", o.predictor_timeout_ms);
        o.max_fixed_point_iterations = j.value("MAX_FIXED_POINT_ITERATIONS", o.max_fixed_point_iterations);
        o.max_pipeline_passes = j.value("MAX_PIPELINE_PASSES", o.max_pipeline_passes);
        o.max_repair_passes = j.value("MAX_REPAIR_PASSES", o.max_repair_passes);
        o.use_solver_repair = j.value("USE_SOLVER_REPAIR", o.use_solver_repair);
        o.solver_time_limit_seconds = j.value("SOLVER_TIME_LIMIT_SECONDS", o.solver_time_limit_seconds);
        o.default_rng_seed = j.value("DEFAULT_RNG_SEED", o.default_rng_seed);
        o.verbose = j.value("VERBOSE", o.verbose);
        if (o.medium_confidence > o.high_confidence)
            throw ConfigurationError("options", "MEDIUM_CONFIDENCE above HIGH_CONFIDENCE");
        return o;
    }

    json options_to_json(const EngineOptions &o)
    {
        return json{{"HIGH_CONFIDENCE", o.high_confidence},
                    {"MEDIUM_CONFIDENCE", o.medium_confidence},
                    {"PREDICTOR_TIMEOUT_MS", o.predictor_timeout_ms},
                    {"MAX_FIXED_POINT_ITERATIONS", o.max_fixed_point_iterations},
                    {"MAX_PIPELINE_PASSES", o.max_pipeline_passes},
                    {"MAX_REPAIR_PASSES", o.max_repair_passes},
                    {"USE_SOLVER_REPAIR", o.use_solver_repair},
                    {"SOLVER_TIME_LIMIT_SECONDS", o.solver_time_limit_seconds},
                    {"DEFAULT_RNG_SEED", o.default_rng_seed},
                    {"VERBOSE", o.verbose}};
    }

    std::vector<Staff> roster_from_json(const json &j)
    {
        if (!j.is_array())
            throw ConfigurationError("roster", "roster must be an array");
        std::vector<Staff> roster;
        roster.reserve(j.size());
        for (const auto &s : j)
        {
            try
            {
                Staff st;
                st.id = s.at("id").get<std::string>();
                st.name = s.value("name", st.id);
                st.category = s.value("category", std::string());
                st.may_work_early = s.value("canEarly", false);
                st.may_work_late = s.value("canLate", true);
                roster.push_back(std::move(st));
            }
            catch (const json::exception &e)
            {
                throw ConfigurationError("roster", e.what());
            }
        }
        return roster;
    }

    Constraint constraint_from_json(const json &j)
    {
        const std::string owner = id_hint(j);
        try
        {
            const std::string type = j.at("type").get<std::string>();
            if (type == "daily_limit")
            {
                DailyLimit l;
                limit_from_json(j, l);
                return l;
            }
            if (type == "weekly_limit")
            {
                WeeklyLimit l;
                limit_from_json(j, l);
                l.window_days = j.value("windowDays", 7);
                return l;
            }
            if (type == "monthly_limit")
            {
                MonthlyLimit l;
                limit_from_json(j, l);
                return l;
            }
            if (type == "staff_group")
                return group_from_json(j);
            if (type == "priority_rule")
                return priority_from_json(j);
            throw ConfigurationError(owner, "unknown constraint type '" + type + "'");
        }
        catch (const json::exception &e)
        {
            throw ConfigurationError(owner, e.what());
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigurationError(owner, e.what());
        }
    }

    ConfigSnapshotPtr snapshot_from_json(const json &j)
    {
        if (!j.is_object())
            throw ConfigurationError("snapshot", "configuration must be a JSON object");

        auto snap = std::make_shared<ConfigSnapshot>();
        try
        {
            if (j.contains("version"))
                snap->version = j["version"].is_string() ? j["version"].get<std::string>() : j["version"].dump();
            if (j.contains("roster"))
                snap->roster = roster_from_json(j["roster"]);
            if (j.contains("constraints") && j["constraints"].is_array())
                for (const auto &c : j["constraints"])
                    snap->constraints.push_back(constraint_from_json(c));
            if (j.contains("calendarMandates"))
                snap->mandates = mandates_from_json(j["calendarMandates"]);
            if (j.contains("restRule") && j["restRule"].is_object())
            {
                const json &r = j["restRule"];
                snap->rest.max_consecutive_work_days = r.value("maxConsecutiveWorkDays", 0);
                snap->rest.tier = r.value("tier", snap->rest.tier);
                snap->rest.hard = r.value("isHardConstraint", snap->rest.hard);
                snap->rest.penalty_weight = r.value("penaltyWeight", snap->rest.penalty_weight);
            }
            if (j.contains("adjacentConflict") && j["adjacentConflict"].is_object())
            {
                const json &a = j["adjacentConflict"];
                snap->adjacent.enabled = a.value("enabled", true);
                snap->adjacent.tier = a.value("tier", snap->adjacent.tier);
                snap->adjacent.penalty_weight = a.value("penaltyWeight", snap->adjacent.penalty_weight);
            }
            snap->off_day_target = j.value("offDayTarget", 0);
            snap->must_off_early_for_eligible = j.value("mustOffEarlyForEligible", true);
        }
        catch (const json::exception &e)
        {
            throw ConfigurationError("snapshot", e.what());
        }

        check_snapshot(*snap);
        return snap;
    }

    GenerationRequest request_from_json(const json &j)
    {
        if (!j.is_object())
            throw ConfigurationError("request", "request must be a JSON object");

        GenerationRequest r;
        try
        {
            if (j.contains("roster"))
                r.roster = roster_from_json(j["roster"]);

            const json &range = j.at("dateRange");
            if (range.is_array() && range.size() == 2)
            {
                r.start_date = range[0].get<std::string>();
                r.end_date = range[1].get<std::string>();
            }
            else
            {
                r.start_date = range.at("start").get<std::string>();
                r.end_date = range.at("end").get<std::string>();
            }

            // Either a nested snapshot or the snapshot fields inline.
            r.config = snapshot_from_json(j.contains("config") ? j["config"] : j);

            // {"staffId": {"YYYY-MM-DD": "off", ...}, ...}; blank entries are not prefilled.
            if (j.contains("prefilledSchedule") && !j["prefilledSchedule"].is_null())
            {
                for (const auto &[staff_id, dates] : j["prefilledSchedule"].items())
                {
                    if (!dates.is_object())
                        throw ConfigurationError("prefilledSchedule", "entries for '" + staff_id + "' must be an object");
                    for (const auto &[date, shift] : dates.items())
                    {
                        const std::string name = shift.get<std::string>();
                        if (name.empty())
                            continue;
                        try
                        {
                            r.prefilled[DateCell{staff_id, date}] = parse_shift(name);
                        }
                        catch (const std::invalid_argument &e)
                        {
                            throw ConfigurationError("prefilledSchedule", staff_id + " on " + date + ": " + e.what());
                        }
                    }
                }
            }

            if (j.contains("predictorFeatures") && j["predictorFeatures"].is_object())
                r.features = features_from_json(j["predictorFeatures"]);
            if (j.contains("rngSeed") && !j["rngSeed"].is_null())
                r.rng_seed = j["rngSeed"].get<std::uint64_t>();
        }
        catch (const json::exception &e)
        {
            throw ConfigurationError("request", e.what());
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigurationError("request", e.what());
        }
        return r;
    }

} // namespace rostra
