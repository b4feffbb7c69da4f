#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Resource tags, key -> value.
using TagSet = std::map<std::string, std::string>;

enum class AlertType { Actual, Forecasted };

const char* alert_type_name(AlertType type);
std::optional<AlertType> parse_alert_type(const std::string& name);

struct AlertConfig {
    double threshold = 0.0;     // percent of the budget amount
    AlertType type = AlertType::Actual;
};

// Spending limit for one scope. An amount of 0 disables the budget.
struct ScopedBudget {
    double amount = 0.0;
    std::string currency;                 // ISO 4217; empty inherits global
    std::string period;                   // only "monthly"; empty = monthly
    std::vector<AlertConfig> alerts;      // empty = 50/80/100 actual
    std::optional<bool> exit_on_threshold;
    std::optional<int> exit_code;

    bool is_enabled() const { return amount > 0; }
    std::string effective_period() const;
};

// Budget attached to a tag selector ("key:value" or "key:*"). When a resource
// matches several, the highest priority wins.
struct TagBudget : ScopedBudget {
    std::string selector;
    int priority = 0;
};

// A selector split into its parts once, so matching is a plain comparison.
struct ParsedTagSelector {
    std::string key;
    std::string value;          // "*" when is_wildcard
    bool is_wildcard = false;

    bool matches(const TagSet& tags) const;
};

Result<ParsedTagSelector> parse_tag_selector(const std::string& selector);

// Full budget hierarchy. Provider names match case-insensitively; resource
// type keys match exactly.
struct BudgetsConfig {
    std::optional<ScopedBudget> global;
    std::map<std::string, ScopedBudget> providers;
    std::vector<TagBudget> tags;
    std::map<std::string, ScopedBudget> types;
    bool exit_on_threshold = false;
    std::optional<int> exit_code;

    bool has_scoped_budgets() const;
    bool has_global_budget() const;
    // True if any budget at any scope is enabled.
    bool is_enabled() const;
    std::string global_currency() const;

    bool effective_exit_on_threshold(const std::optional<bool>& scope_override) const;
    int effective_exit_code(const std::optional<int>& scope_override) const;
};

// Returns non-fatal warnings (duplicate tag priorities), or an error
// (ErrorKind::InvalidArgument) describing the first invalid budget.
Result<std::vector<std::string>> validate_budgets(const BudgetsConfig& config);
