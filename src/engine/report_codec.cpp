#include "report_codec.hpp"
#include <core/config.hpp>
#include <yaml-cpp/yaml.h>
#include <limits>
#include <stdexcept>

static void emit_strings(YAML::Emitter& out, const char* key, const std::vector<std::string>& values) {
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& v : values) out << v;
    out << YAML::EndSeq;
}

static void emit_status(YAML::Emitter& out, const ScopedBudgetStatus& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "scope_type" << YAML::Value << scope_type_name(s.scope_type);
    out << YAML::Key << "scope_key" << YAML::Value << s.scope_key;
    out << YAML::Key << "budget" << YAML::Value;
    emit_scoped_budget(out, s.budget);
    out << YAML::Key << "current_spend" << YAML::Value << s.current_spend;
    out << YAML::Key << "percentage" << YAML::Value << s.percentage;
    out << YAML::Key << "forecasted_spend" << YAML::Value << s.forecasted_spend;
    out << YAML::Key << "forecast_percentage" << YAML::Value << s.forecast_percentage;
    out << YAML::Key << "health" << YAML::Value << health_name(s.health);
    out << YAML::Key << "matched_resources" << YAML::Value << s.matched_resources;
    out << YAML::Key << "currency" << YAML::Value << s.currency;
    out << YAML::Key << "alerts" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : s.alerts) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "threshold" << YAML::Value << a.threshold;
        out << YAML::Key << "type" << YAML::Value << alert_type_name(a.type);
        out << YAML::Key << "status" << YAML::Value << threshold_state_name(a.status);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

static void emit_allocation(YAML::Emitter& out, const BudgetAllocation& a) {
    out << YAML::BeginMap;
    out << YAML::Key << "resource_id" << YAML::Value << a.resource_id;
    out << YAML::Key << "resource_type" << YAML::Value << a.resource_type;
    out << YAML::Key << "provider" << YAML::Value << a.provider;
    out << YAML::Key << "cost" << YAML::Value << a.cost;
    emit_strings(out, "allocated_scopes", a.allocated_scopes);
    emit_strings(out, "matched_tags", a.matched_tags);
    out << YAML::Key << "selected_tag_budget" << YAML::Value << a.selected_tag_budget;
    emit_strings(out, "warnings", a.warnings);
    out << YAML::EndMap;
}

std::string encode_report(const BudgetReport& report) {
    const auto& r = report.result;

    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);
    out << YAML::BeginMap;

    out << YAML::Key << "overall_health" << YAML::Value << health_name(r.overall_health);
    emit_strings(out, "critical_scopes", r.critical_scopes);
    emit_strings(out, "warnings", r.warnings);

    if (r.global) {
        out << YAML::Key << "global" << YAML::Value;
        emit_status(out, *r.global);
    }

    out << YAML::Key << "providers" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, s] : r.by_provider) emit_status(out, s);
    out << YAML::EndSeq;

    out << YAML::Key << "tags" << YAML::Value << YAML::BeginSeq;
    for (const auto& s : r.by_tag) emit_status(out, s);
    out << YAML::EndSeq;

    out << YAML::Key << "types" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, s] : r.by_type) emit_status(out, s);
    out << YAML::EndSeq;

    out << YAML::Key << "allocations" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : r.allocations) emit_allocation(out, a);
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str(), out.size());
}

// Decoding throws on malformed input; decode_report converts to a Result.
static std::vector<std::string> read_strings(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node && node.IsSequence()) {
        for (const auto& v : node) values.push_back(v.as<std::string>());
    }
    return values;
}

static BudgetHealth read_health(const YAML::Node& node) {
    std::string name = node.as<std::string>("UNSPECIFIED");
    auto h = parse_health(name);
    if (!h) throw std::runtime_error("unknown health status \"" + name + "\"");
    return *h;
}

static ScopedBudgetStatus read_status(const YAML::Node& node) {
    ScopedBudgetStatus s;

    std::string type = node["scope_type"].as<std::string>("");
    auto scope = parse_scope_type(type);
    if (!scope) throw std::runtime_error("unknown scope type \"" + type + "\"");
    s.scope_type = *scope;
    s.scope_key = node["scope_key"].as<std::string>("");

    if (node["budget"]) {
        auto budget = parse_scoped_budget(node["budget"]);
        if (budget.is_err()) throw std::runtime_error(budget.error);
        s.budget = budget.value;
    }

    s.current_spend = node["current_spend"].as<double>(0.0);
    s.percentage = node["percentage"].as<double>(0.0);
    s.forecasted_spend = node["forecasted_spend"].as<double>(0.0);
    s.forecast_percentage = node["forecast_percentage"].as<double>(0.0);
    s.health = read_health(node["health"]);
    s.matched_resources = node["matched_resources"].as<int>(0);
    s.currency = node["currency"].as<std::string>("");

    if (node["alerts"] && node["alerts"].IsSequence()) {
        for (const auto& a : node["alerts"]) {
            ThresholdStatus t;
            t.threshold = a["threshold"].as<double>(0.0);
            t.type = parse_alert_type(a["type"].as<std::string>("actual")).value_or(AlertType::Actual);
            std::string state = a["status"].as<std::string>("OK");
            auto parsed = parse_threshold_state(state);
            if (!parsed) throw std::runtime_error("unknown alert status \"" + state + "\"");
            t.status = *parsed;
            s.alerts.push_back(t);
        }
    }
    return s;
}

Result<BudgetReport> decode_report(const std::string& data) {
    try {
        YAML::Node root = YAML::Load(data);
        if (!root.IsMap() || !root["overall_health"]) {
            return Result<BudgetReport>::Err("budget report is missing required fields",
                                             ErrorKind::Parse);
        }

        BudgetReport report;
        auto& r = report.result;
        r.overall_health = read_health(root["overall_health"]);
        r.critical_scopes = read_strings(root["critical_scopes"]);
        r.warnings = read_strings(root["warnings"]);

        if (root["global"]) {
            r.global = read_status(root["global"]);
        }
        if (root["providers"] && root["providers"].IsSequence()) {
            for (const auto& n : root["providers"]) {
                auto s = read_status(n);
                r.by_provider[s.scope_key] = s;
            }
        }
        if (root["tags"] && root["tags"].IsSequence()) {
            for (const auto& n : root["tags"]) {
                r.by_tag.push_back(read_status(n));
            }
        }
        if (root["types"] && root["types"].IsSequence()) {
            for (const auto& n : root["types"]) {
                auto s = read_status(n);
                r.by_type[s.scope_key] = s;
            }
        }

        if (root["allocations"] && root["allocations"].IsSequence()) {
            for (const auto& n : root["allocations"]) {
                BudgetAllocation a;
                a.resource_id = n["resource_id"].as<std::string>("");
                a.resource_type = n["resource_type"].as<std::string>("");
                a.provider = n["provider"].as<std::string>("");
                a.cost = n["cost"].as<double>(0.0);
                a.allocated_scopes = read_strings(n["allocated_scopes"]);
                a.matched_tags = read_strings(n["matched_tags"]);
                a.selected_tag_budget = n["selected_tag_budget"].as<std::string>("");
                a.warnings = read_strings(n["warnings"]);
                r.allocations.push_back(a);
            }
        }
        return Result<BudgetReport>::Ok(std::move(report));
    } catch (const std::exception& e) {
        return Result<BudgetReport>::Err(std::string("Failed to decode budget report: ") + e.what(),
                                         ErrorKind::Parse);
    }
}
