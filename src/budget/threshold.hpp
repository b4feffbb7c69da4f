#pragma once

#include <string>
#include <vector>
#include <core/time_utils.hpp>
#include "budget_types.hpp"

// 100 * spend / amount, or 0 when the amount is not positive.
double spend_percentage(double spend, double amount);

// Linear month-end projection: spend / day * days_in_month.
double forecast_spend(double current_spend, const MonthProgress& progress);

// EXCEEDED at or above the threshold; APPROACHING within 5 points below it
// (only for thresholds above 5); OK otherwise.
ThresholdState evaluate_threshold(double threshold, double percentage);

// 50 / 80 / 100, all actual.
std::vector<AlertConfig> default_alerts();

// Fills forecast, forecast percentage and alert statuses on `status` from its
// current spend and percentage. Actual alerts compare against the percentage,
// forecasted ones against the forecast percentage. Disabled budgets are left
// untouched.
void enrich_budget_status(ScopedBudgetStatus& status, const MonthProgress& progress);

// Builds a complete status for one scope.
ScopedBudgetStatus calculate_scope_status(ScopeType type, const std::string& key,
                                          const ScopedBudget& budget, double spend,
                                          int matched_resources,
                                          const std::string& fallback_currency,
                                          const MonthProgress& progress);
