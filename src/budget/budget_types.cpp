#include "budget_types.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

const char* scope_type_name(ScopeType type) {
    switch (type) {
        case ScopeType::Global:   return "global";
        case ScopeType::Provider: return "provider";
        case ScopeType::Tag:      return "tag";
        case ScopeType::Type:     return "type";
    }
    return "global";
}

std::optional<ScopeType> parse_scope_type(const std::string& name) {
    if (name == "global") return ScopeType::Global;
    if (name == "provider") return ScopeType::Provider;
    if (name == "tag") return ScopeType::Tag;
    if (name == "type") return ScopeType::Type;
    return std::nullopt;
}

std::string scope_identifier(ScopeType type, const std::string& key) {
    if (type == ScopeType::Global) return "global";
    return std::string(scope_type_name(type)) + ":" + key;
}

const char* health_name(BudgetHealth health) {
    switch (health) {
        case BudgetHealth::Unspecified: return "UNSPECIFIED";
        case BudgetHealth::Ok:          return "OK";
        case BudgetHealth::Warning:     return "WARNING";
        case BudgetHealth::Critical:    return "CRITICAL";
        case BudgetHealth::Exceeded:    return "EXCEEDED";
    }
    return "UNSPECIFIED";
}

std::optional<BudgetHealth> parse_health(const std::string& name) {
    std::string n = StringUtils::to_lower(name);
    if (n == "unspecified") return BudgetHealth::Unspecified;
    if (n == "ok") return BudgetHealth::Ok;
    if (n == "warning") return BudgetHealth::Warning;
    if (n == "critical") return BudgetHealth::Critical;
    if (n == "exceeded") return BudgetHealth::Exceeded;
    return std::nullopt;
}

const char* threshold_state_name(ThresholdState state) {
    switch (state) {
        case ThresholdState::Ok:          return "OK";
        case ThresholdState::Approaching: return "APPROACHING";
        case ThresholdState::Exceeded:    return "EXCEEDED";
    }
    return "OK";
}

std::optional<ThresholdState> parse_threshold_state(const std::string& name) {
    std::string n = StringUtils::to_lower(name);
    if (n == "ok") return ThresholdState::Ok;
    if (n == "approaching") return ThresholdState::Approaching;
    if (n == "exceeded") return ThresholdState::Exceeded;
    return std::nullopt;
}

std::string ScopedBudgetStatus::scope_identifier() const {
    return ::scope_identifier(scope_type, scope_key);
}

bool ScopedBudgetStatus::has_exceeded_alerts() const {
    for (const auto& a : alerts) {
        if (a.status == ThresholdState::Exceeded) return true;
    }
    return false;
}

double ScopedBudgetStatus::highest_exceeded_threshold() const {
    double highest = 0.0;
    for (const auto& a : alerts) {
        if (a.status == ThresholdState::Exceeded && a.threshold > highest) {
            highest = a.threshold;
        }
    }
    return highest;
}

bool ScopedBudgetStatus::should_exit(const BudgetsConfig& config) const {
    if (!config.effective_exit_on_threshold(budget.exit_on_threshold)) return false;
    return has_exceeded_alerts();
}

int ScopedBudgetStatus::exit_code(const BudgetsConfig& config) const {
    if (!should_exit(config)) return 0;
    return config.effective_exit_code(budget.exit_code);
}

std::string ScopedBudgetStatus::exit_reason(const BudgetsConfig& config) const {
    if (!should_exit(config)) return "";

    int code = exit_code(config);
    if (code == 0) {
        return fmt::format("budget threshold exceeded ({:.0f}%) - warning only, exit code 0",
                           highest_exceeded_threshold());
    }
    return fmt::format("budget threshold exceeded ({:.0f}%) - exiting with code {}",
                       highest_exceeded_threshold(), code);
}

std::vector<const ScopedBudgetStatus*> ScopedBudgetResult::all_scopes() const {
    std::vector<const ScopedBudgetStatus*> scopes;
    if (global) scopes.push_back(&*global);
    for (const auto& [name, s] : by_provider) scopes.push_back(&s);
    for (const auto& s : by_tag) scopes.push_back(&s);
    for (const auto& [name, s] : by_type) scopes.push_back(&s);
    return scopes;
}

ExitDecision ScopedBudgetResult::exit_decision(const BudgetsConfig& config) const {
    ExitDecision decision;
    for (const auto* scope : all_scopes()) {
        if (!scope->should_exit(config)) continue;

        int code = scope->exit_code(config);
        if (!decision.should_exit || code > decision.exit_code) {
            decision.should_exit = true;
            decision.exit_code = code;
            decision.scope = scope->scope_identifier();
            decision.reason = decision.scope + ": " + scope->exit_reason(config);
        }
    }
    return decision;
}
