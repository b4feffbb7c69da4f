#include "evaluator.hpp"
#include "health.hpp"
#include "threshold.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>

std::string extract_provider(const std::string& resource_type) {
    auto idx = resource_type.find(':');
    if (idx == 0) return "";
    if (idx == std::string::npos) return StringUtils::to_lower(resource_type);
    return StringUtils::to_lower(resource_type.substr(0, idx));
}

ScopedBudgetEvaluator::ScopedBudgetEvaluator(const BudgetsConfig* config)
    : config_(config) {
    if (!config_) return;

    for (const auto& [name, budget] : config_->providers) {
        provider_index_[StringUtils::to_lower(name)] = &budget;
    }
    for (const auto& [type, budget] : config_->types) {
        type_index_[type] = &budget;
    }

    std::vector<TagBudget> sorted = config_->tags;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TagBudget& a, const TagBudget& b) { return a.priority > b.priority; });

    for (const auto& tb : sorted) {
        auto parsed = parse_tag_selector(tb.selector);
        if (parsed.is_err()) {
            fincore_log(fmt::format("budget: skipping invalid tag selector \"{}\": {}",
                                    tb.selector, parsed.error));
            continue;
        }
        tag_budgets_.push_back(tb);
        parsed_tags_.push_back({tb, parsed.value});
    }
}

const ScopedBudget* ScopedBudgetEvaluator::get_provider_budget(const std::string& provider) const {
    auto it = provider_index_.find(StringUtils::to_lower(provider));
    return it != provider_index_.end() ? it->second : nullptr;
}

const ScopedBudget* ScopedBudgetEvaluator::get_type_budget(const std::string& resource_type) const {
    auto it = type_index_.find(resource_type);
    return it != type_index_.end() ? it->second : nullptr;
}

std::vector<TagBudget> ScopedBudgetEvaluator::match_tag_budgets(const TagSet& tags) const {
    std::vector<TagBudget> matches;
    if (tags.empty()) return matches;

    for (const auto& entry : parsed_tags_) {
        if (entry.selector.matches(tags)) {
            matches.push_back(entry.budget);
        }
    }
    return matches;
}

TagSelection ScopedBudgetEvaluator::select_highest_priority_tag_budget(
        const std::vector<TagBudget>& matches) const {
    TagSelection selection;
    if (matches.empty()) return selection;

    const int top = matches.front().priority;
    std::vector<std::string> tied;
    for (const auto& m : matches) {
        if (m.priority != top) break;
        tied.push_back(m.selector);
    }

    if (tied.size() == 1) {
        selection.selected = matches.front();
        return selection;
    }

    std::sort(tied.begin(), tied.end());
    for (const auto& m : matches) {
        if (m.selector == tied.front()) {
            selection.selected = m;
            break;
        }
    }

    std::string warning = fmt::format(
        "overlapping tag budgets with same priority {}: [{}] - selected \"{}\"",
        top, StringUtils::join(tied, " "), tied.front());
    fincore_log("budget: " + warning);
    selection.warnings.push_back(std::move(warning));
    return selection;
}

static BudgetAllocation make_allocation(const std::string& resource_type, double cost) {
    BudgetAllocation a;
    a.resource_type = resource_type;
    a.provider = extract_provider(resource_type);
    a.cost = cost;
    return a;
}

BudgetAllocation ScopedBudgetEvaluator::allocate_cost_to_provider(const std::string& resource_type,
                                                                  double cost) const {
    auto a = make_allocation(resource_type, cost);
    if (!a.provider.empty() && get_provider_budget(a.provider)) {
        a.allocated_scopes.push_back(scope_identifier(ScopeType::Provider, a.provider));
    }
    return a;
}

BudgetAllocation ScopedBudgetEvaluator::allocate_cost_to_tag(const std::string& resource_type,
                                                             const TagSet& tags,
                                                             double cost) const {
    auto a = make_allocation(resource_type, cost);

    auto matches = match_tag_budgets(tags);
    if (matches.empty()) return a;

    for (const auto& m : matches) {
        a.matched_tags.push_back(m.selector);
    }

    auto selection = select_highest_priority_tag_budget(matches);
    if (!selection.selected) return a;

    a.selected_tag_budget = selection.selected->selector;
    a.allocated_scopes.push_back(scope_identifier(ScopeType::Tag, a.selected_tag_budget));
    a.warnings = std::move(selection.warnings);
    return a;
}

BudgetAllocation ScopedBudgetEvaluator::allocate_cost_to_type(const std::string& resource_type,
                                                              double cost) const {
    auto a = make_allocation(resource_type, cost);
    if (get_type_budget(resource_type)) {
        a.allocated_scopes.push_back(scope_identifier(ScopeType::Type, resource_type));
    }
    return a;
}

BudgetAllocation ScopedBudgetEvaluator::allocate_costs(const std::string& resource_type,
                                                       const TagSet& tags,
                                                       double cost) const {
    auto a = make_allocation(resource_type, cost);

    if (config_ && config_->has_global_budget()) {
        a.allocated_scopes.push_back(scope_identifier(ScopeType::Global, ""));
    }

    auto provider = allocate_cost_to_provider(resource_type, cost);
    a.allocated_scopes.insert(a.allocated_scopes.end(),
                              provider.allocated_scopes.begin(), provider.allocated_scopes.end());

    if (!tags.empty() && !parsed_tags_.empty()) {
        auto tag = allocate_cost_to_tag(resource_type, tags, cost);
        if (!tag.selected_tag_budget.empty()) {
            a.allocated_scopes.insert(a.allocated_scopes.end(),
                                      tag.allocated_scopes.begin(), tag.allocated_scopes.end());
            a.matched_tags = std::move(tag.matched_tags);
            a.selected_tag_budget = std::move(tag.selected_tag_budget);
            a.warnings = std::move(tag.warnings);
        }
    }

    auto type = allocate_cost_to_type(resource_type, cost);
    a.allocated_scopes.insert(a.allocated_scopes.end(),
                              type.allocated_scopes.begin(), type.allocated_scopes.end());
    return a;
}

BudgetAllocation ScopedBudgetEvaluator::allocate_costs(const CostLineItem& item) const {
    auto a = allocate_costs(item.resource_type, item.tags, item.monthly_cost);
    a.resource_id = item.resource_id;
    return a;
}

namespace {

struct ScopeSpend {
    double spend = 0.0;
    int resources = 0;
};

ScopeSpend spend_for(const std::map<std::string, ScopeSpend>& totals, const std::string& scope) {
    auto it = totals.find(scope);
    return it != totals.end() ? it->second : ScopeSpend{};
}

}  // namespace

ScopedBudgetResult ScopedBudgetEvaluator::evaluate(const std::vector<CostLineItem>& items,
                                                   const MonthProgress& progress) const {
    ScopedBudgetResult result;
    std::map<std::string, ScopeSpend> totals;
    std::set<std::string> seen_warnings;

    for (const auto& item : items) {
        auto allocation = allocate_costs(item);
        for (const auto& scope : allocation.allocated_scopes) {
            auto& t = totals[scope];
            t.spend += item.monthly_cost;
            t.resources++;
        }
        for (const auto& w : allocation.warnings) {
            if (seen_warnings.insert(w).second) {
                result.warnings.push_back(w);
            }
        }
        result.allocations.push_back(std::move(allocation));
    }

    if (!config_) {
        return result;
    }

    const std::string currency = config_->global_currency();

    if (config_->global) {
        auto s = spend_for(totals, scope_identifier(ScopeType::Global, ""));
        result.global = calculate_scope_status(ScopeType::Global, "", *config_->global,
                                               s.spend, s.resources, currency, progress);
    }

    for (const auto& [name, budget] : provider_index_) {
        auto s = spend_for(totals, scope_identifier(ScopeType::Provider, name));
        result.by_provider[name] = calculate_scope_status(ScopeType::Provider, name, *budget,
                                                          s.spend, s.resources, currency, progress);
    }

    for (const auto& tb : tag_budgets_) {
        if (!tb.is_enabled()) continue;
        auto s = spend_for(totals, scope_identifier(ScopeType::Tag, tb.selector));
        result.by_tag.push_back(calculate_scope_status(ScopeType::Tag, tb.selector, tb,
                                                       s.spend, s.resources, currency, progress));
    }

    for (const auto& [type, budget] : type_index_) {
        auto s = spend_for(totals, scope_identifier(ScopeType::Type, type));
        result.by_type[type] = calculate_scope_status(ScopeType::Type, type, *budget,
                                                      s.spend, s.resources, currency, progress);
    }

    result.overall_health = calculate_overall_health(result);
    result.critical_scopes = identify_critical_scopes(result);

    fincore_log(fmt::format("budget: evaluated {} resources, overall health {}, {} critical scope(s)",
                            items.size(), health_name(result.overall_health),
                            result.critical_scopes.size()));
    return result;
}

ScopedBudgetResult ScopedBudgetEvaluator::evaluate(const std::vector<CostLineItem>& items) const {
    return evaluate(items, current_month_progress());
}
