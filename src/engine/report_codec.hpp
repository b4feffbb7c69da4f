#pragma once

#include <string>
#include <core/types.hpp>
#include <budget/budget_types.hpp>

// A budget evaluation as served to callers.
struct BudgetReport {
    ScopedBudgetResult result;
    std::string cache_key;
    bool from_cache = false;
};

// YAML payload stored in the cache. cache_key and from_cache are not stored.
std::string encode_report(const BudgetReport& report);
Result<BudgetReport> decode_report(const std::string& data);
