#include "threshold.hpp"
#include "health.hpp"
#include <core/constants.hpp>

double spend_percentage(double spend, double amount) {
    if (amount <= 0) return 0.0;
    return spend / amount * 100.0;
}

double forecast_spend(double current_spend, const MonthProgress& progress) {
    if (progress.day <= 0) return current_spend;
    return current_spend / progress.day * progress.days_in_month;
}

ThresholdState evaluate_threshold(double threshold, double percentage) {
    if (percentage >= threshold) {
        return ThresholdState::Exceeded;
    }
    if (threshold > APPROACHING_THRESHOLD_BUFFER &&
        percentage >= threshold - APPROACHING_THRESHOLD_BUFFER) {
        return ThresholdState::Approaching;
    }
    return ThresholdState::Ok;
}

std::vector<AlertConfig> default_alerts() {
    return {
        {DEFAULT_ALERT_INFO, AlertType::Actual},
        {DEFAULT_ALERT_WARNING, AlertType::Actual},
        {DEFAULT_ALERT_CRITICAL, AlertType::Actual},
    };
}

void enrich_budget_status(ScopedBudgetStatus& status, const MonthProgress& progress) {
    if (status.budget.amount <= 0) return;

    status.forecasted_spend = forecast_spend(status.current_spend, progress);
    status.forecast_percentage = spend_percentage(status.forecasted_spend, status.budget.amount);

    const auto alerts = status.budget.alerts.empty() ? default_alerts() : status.budget.alerts;
    status.alerts.clear();
    for (const auto& alert : alerts) {
        double pct = alert.type == AlertType::Forecasted ? status.forecast_percentage
                                                         : status.percentage;
        status.alerts.push_back({alert.threshold, alert.type, evaluate_threshold(alert.threshold, pct)});
    }
}

ScopedBudgetStatus calculate_scope_status(ScopeType type, const std::string& key,
                                          const ScopedBudget& budget, double spend,
                                          int matched_resources,
                                          const std::string& fallback_currency,
                                          const MonthProgress& progress) {
    ScopedBudgetStatus status;
    status.scope_type = type;
    status.scope_key = type == ScopeType::Global ? "" : key;
    status.budget = budget;
    status.current_spend = spend;
    status.percentage = spend_percentage(spend, budget.amount);
    status.health = calculate_health_from_percentage(status.percentage);
    status.matched_resources = matched_resources;
    status.currency = budget.currency.empty() ? fallback_currency : budget.currency;
    enrich_budget_status(status, progress);
    return status;
}
