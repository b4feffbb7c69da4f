#pragma once

#include <string>
#include <vector>
#include "budget_types.hpp"

// <80 Ok, [80,90) Warning, [90,100) Critical, >=100 Exceeded. Negative is Ok.
BudgetHealth calculate_health_from_percentage(double percentage);

// Most severe status present; Unspecified for an empty list.
BudgetHealth aggregate_health_statuses(const std::vector<BudgetHealth>& statuses);

// Worst health over every scope in the result.
BudgetHealth calculate_overall_health(const ScopedBudgetResult& result);

// Identifiers of every Critical or Exceeded scope, in all_scopes() order.
std::vector<std::string> identify_critical_scopes(const ScopedBudgetResult& result);
