#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "budget_config.hpp"

enum class ScopeType { Global, Provider, Tag, Type };

const char* scope_type_name(ScopeType type);
std::optional<ScopeType> parse_scope_type(const std::string& name);

// "global", "provider:<key>", "tag:<selector>", "type:<resource type>".
std::string scope_identifier(ScopeType type, const std::string& key);

// Ordered by severity; Unspecified sorts below Ok and means "no statuses".
enum class BudgetHealth {
    Unspecified,
    Ok,
    Warning,
    Critical,
    Exceeded,
};

const char* health_name(BudgetHealth health);
std::optional<BudgetHealth> parse_health(const std::string& name);

enum class ThresholdState { Ok, Approaching, Exceeded };

const char* threshold_state_name(ThresholdState state);
std::optional<ThresholdState> parse_threshold_state(const std::string& name);

struct ThresholdStatus {
    double threshold = 0.0;
    AlertType type = AlertType::Actual;
    ThresholdState status = ThresholdState::Ok;
};

// Spend against one scope's budget.
struct ScopedBudgetStatus {
    ScopeType scope_type = ScopeType::Global;
    std::string scope_key;                  // empty for global
    ScopedBudget budget;
    double current_spend = 0.0;
    double percentage = 0.0;
    double forecasted_spend = 0.0;
    double forecast_percentage = 0.0;
    BudgetHealth health = BudgetHealth::Unspecified;
    std::vector<ThresholdStatus> alerts;
    int matched_resources = 0;
    std::string currency;

    std::string scope_identifier() const;
    bool is_over_budget() const { return percentage >= 100.0; }
    bool has_exceeded_alerts() const;
    // Largest threshold among EXCEEDED alerts, 0 when none.
    double highest_exceeded_threshold() const;

    // Threshold exits are on for this scope (its own override, else the
    // top-level setting) and at least one alert is EXCEEDED.
    bool should_exit(const BudgetsConfig& config) const;
    // 0 when should_exit() is false. A configured 0 means warning only.
    int exit_code(const BudgetsConfig& config) const;
    // Empty when should_exit() is false.
    std::string exit_reason(const BudgetsConfig& config) const;
};

// Outcome of threshold exits across every scope of a result.
struct ExitDecision {
    bool should_exit = false;
    int exit_code = 0;
    std::string scope;          // scope identifier that decided the code
    std::string reason;
};

// The scopes one resource's cost was attributed to. Non-exclusive: the full
// cost counts toward every listed scope.
struct BudgetAllocation {
    std::string resource_id;
    std::string resource_type;
    std::string provider;
    double cost = 0.0;
    std::vector<std::string> allocated_scopes;
    std::vector<std::string> matched_tags;  // every matching selector
    std::string selected_tag_budget;        // empty when no tag matched
    std::vector<std::string> warnings;
};

// One priced resource, as delivered by the cost layer.
struct CostLineItem {
    std::string resource_id;
    std::string resource_type;
    TagSet tags;
    double monthly_cost = 0.0;
};

struct ScopedBudgetResult {
    std::optional<ScopedBudgetStatus> global;
    std::map<std::string, ScopedBudgetStatus> by_provider;
    std::vector<ScopedBudgetStatus> by_tag;     // priority order
    std::map<std::string, ScopedBudgetStatus> by_type;
    BudgetHealth overall_health = BudgetHealth::Unspecified;
    std::vector<std::string> critical_scopes;
    std::vector<BudgetAllocation> allocations;
    std::vector<std::string> warnings;

    // Global, providers, tags, types; pointers into this result.
    std::vector<const ScopedBudgetStatus*> all_scopes() const;
    bool has_exceeded_budgets() const { return overall_health == BudgetHealth::Exceeded; }
    bool has_critical_budgets() const {
        return overall_health == BudgetHealth::Critical ||
               overall_health == BudgetHealth::Exceeded;
    }

    // Among scopes that should exit, the highest exit code wins; ties go to
    // the first scope in all_scopes() order.
    ExitDecision exit_decision(const BudgetsConfig& config) const;
};
