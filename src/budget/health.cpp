#include "health.hpp"
#include <core/constants.hpp>

BudgetHealth calculate_health_from_percentage(double percentage) {
    if (percentage >= HEALTH_THRESHOLD_EXCEEDED) return BudgetHealth::Exceeded;
    if (percentage >= HEALTH_THRESHOLD_CRITICAL) return BudgetHealth::Critical;
    if (percentage >= HEALTH_THRESHOLD_WARNING) return BudgetHealth::Warning;
    return BudgetHealth::Ok;
}

BudgetHealth aggregate_health_statuses(const std::vector<BudgetHealth>& statuses) {
    BudgetHealth worst = BudgetHealth::Unspecified;
    for (auto h : statuses) {
        if (h > worst) worst = h;
    }
    return worst;
}

BudgetHealth calculate_overall_health(const ScopedBudgetResult& result) {
    std::vector<BudgetHealth> statuses;
    for (const auto* scope : result.all_scopes()) {
        statuses.push_back(scope->health);
    }
    return aggregate_health_statuses(statuses);
}

std::vector<std::string> identify_critical_scopes(const ScopedBudgetResult& result) {
    std::vector<std::string> critical;
    for (const auto* scope : result.all_scopes()) {
        if (scope->health == BudgetHealth::Critical || scope->health == BudgetHealth::Exceeded) {
            critical.push_back(scope->scope_identifier());
        }
    }
    return critical;
}
