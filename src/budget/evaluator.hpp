#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/time_utils.hpp>
#include "budget_config.hpp"
#include "budget_types.hpp"

// "aws:ec2/instance" -> "aws", "unknown" -> "unknown", ":x" and "" -> "".
std::string extract_provider(const std::string& resource_type);

struct TagSelection {
    std::optional<TagBudget> selected;
    std::vector<std::string> warnings;
};

// Attributes resource costs to the budget hierarchy and rolls spend up into a
// ScopedBudgetResult. Indexes are built once at construction; afterwards the
// evaluator is read-only and may be shared between threads.
class ScopedBudgetEvaluator {
public:
    // `config` may be null (nothing is ever allocated). It must outlive the
    // evaluator.
    explicit ScopedBudgetEvaluator(const BudgetsConfig* config);

    // Case-insensitive. Null if no budget is configured for the provider.
    const ScopedBudget* get_provider_budget(const std::string& provider) const;

    // Exact, case-sensitive match on the full resource type.
    const ScopedBudget* get_type_budget(const std::string& resource_type) const;

    // Every tag budget whose selector matches, highest priority first.
    std::vector<TagBudget> match_tag_budgets(const TagSet& tags) const;

    // First of `matches` (already priority ordered). On a tie at the top
    // priority the alphabetically first selector wins and one warning naming
    // the priority is returned.
    TagSelection select_highest_priority_tag_budget(const std::vector<TagBudget>& matches) const;

    BudgetAllocation allocate_cost_to_provider(const std::string& resource_type, double cost) const;
    BudgetAllocation allocate_cost_to_tag(const std::string& resource_type, const TagSet& tags,
                                          double cost) const;
    BudgetAllocation allocate_cost_to_type(const std::string& resource_type, double cost) const;

    // All applicable scopes at once: global, provider, selected tag, type.
    BudgetAllocation allocate_costs(const std::string& resource_type, const TagSet& tags,
                                    double cost) const;
    BudgetAllocation allocate_costs(const CostLineItem& item) const;

    // Allocates every line item and builds per-scope statuses, overall health
    // and critical scopes.
    ScopedBudgetResult evaluate(const std::vector<CostLineItem>& items,
                                const MonthProgress& progress) const;
    ScopedBudgetResult evaluate(const std::vector<CostLineItem>& items) const;

    // Tag budgets that can match, highest priority first.
    const std::vector<TagBudget>& tag_budgets() const { return tag_budgets_; }

private:
    struct ParsedTagEntry {
        TagBudget budget;
        ParsedTagSelector selector;
    };

    const BudgetsConfig* config_ = nullptr;
    std::map<std::string, const ScopedBudget*> provider_index_;   // lowercase keys
    std::map<std::string, const ScopedBudget*> type_index_;
    std::vector<TagBudget> tag_budgets_;
    std::vector<ParsedTagEntry> parsed_tags_;
};
