#include "budget_config.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <regex>

const char* alert_type_name(AlertType type) {
    return type == AlertType::Forecasted ? "forecasted" : "actual";
}

std::optional<AlertType> parse_alert_type(const std::string& name) {
    std::string n = StringUtils::to_lower(name);
    if (n == "actual") return AlertType::Actual;
    if (n == "forecasted") return AlertType::Forecasted;
    return std::nullopt;
}

std::string ScopedBudget::effective_period() const {
    return period.empty() ? DEFAULT_BUDGET_PERIOD : period;
}

// ── Tag selectors ───────────────────────────────────────────

Result<ParsedTagSelector> parse_tag_selector(const std::string& selector) {
    static const std::regex pattern("^[a-zA-Z0-9_-]+:(\\*|[a-zA-Z0-9_-]+)$");
    if (!std::regex_match(selector, pattern)) {
        return Result<ParsedTagSelector>::Err(
            fmt::format("invalid tag selector format: \"{}\" must match pattern 'key:value' or 'key:*'",
                        selector),
            ErrorKind::InvalidArgument);
    }

    auto colon = selector.find(':');
    ParsedTagSelector parsed;
    parsed.key = selector.substr(0, colon);
    parsed.value = selector.substr(colon + 1);
    parsed.is_wildcard = parsed.value == "*";
    return Result<ParsedTagSelector>::Ok(parsed);
}

bool ParsedTagSelector::matches(const TagSet& tags) const {
    auto it = tags.find(key);
    if (it == tags.end()) return false;
    return is_wildcard || it->second == value;
}

// ── BudgetsConfig ───────────────────────────────────────────

bool BudgetsConfig::has_scoped_budgets() const {
    return !providers.empty() || !tags.empty() || !types.empty();
}

bool BudgetsConfig::has_global_budget() const {
    return global.has_value() && global->is_enabled();
}

bool BudgetsConfig::is_enabled() const {
    if (has_global_budget()) return true;
    for (const auto& [name, b] : providers) {
        if (b.is_enabled()) return true;
    }
    for (const auto& t : tags) {
        if (t.is_enabled()) return true;
    }
    for (const auto& [name, b] : types) {
        if (b.is_enabled()) return true;
    }
    return false;
}

std::string BudgetsConfig::global_currency() const {
    return global ? global->currency : "";
}

bool BudgetsConfig::effective_exit_on_threshold(const std::optional<bool>& scope_override) const {
    return scope_override.value_or(exit_on_threshold);
}

int BudgetsConfig::effective_exit_code(const std::optional<int>& scope_override) const {
    if (scope_override) return *scope_override;
    return exit_code.value_or(DEFAULT_BUDGET_EXIT_CODE);
}

// ── Validation ──────────────────────────────────────────────

static Result<void> invalid(const std::string& msg) {
    return Result<void>::Err(msg, ErrorKind::InvalidArgument);
}

static Result<void> validate_currency(const std::string& currency, const std::string& global_currency) {
    if (currency.empty()) return Result<void>::Ok();

    bool upper = currency.size() == 3;
    for (char c : currency) {
        if (c < 'A' || c > 'Z') upper = false;
    }
    if (!upper) {
        return invalid(fmt::format("invalid currency code: must be 3 uppercase letters, got \"{}\"",
                                   currency));
    }
    if (!global_currency.empty() && currency != global_currency) {
        return invalid(fmt::format(
            "scoped budget currency must match global budget currency: scope uses {}, global uses {}",
            currency, global_currency));
    }
    return Result<void>::Ok();
}

// global_currency is empty when validating the global budget itself.
static Result<void> validate_scoped_budget(const ScopedBudget& b, const std::string& global_currency) {
    if (b.amount < 0) {
        return invalid("budget amount cannot be negative");
    }
    if (!b.is_enabled()) {
        return Result<void>::Ok();
    }
    if (!b.period.empty() && b.period != DEFAULT_BUDGET_PERIOD) {
        return invalid(fmt::format("budget period must be 'monthly': got \"{}\"", b.period));
    }

    auto currency = validate_currency(b.currency, global_currency);
    if (currency.is_err()) return currency;

    for (size_t i = 0; i < b.alerts.size(); ++i) {
        double t = b.alerts[i].threshold;
        if (t < MIN_ALERT_THRESHOLD || t > MAX_ALERT_THRESHOLD) {
            return invalid(fmt::format("alert[{}]: alert threshold must be between {} and {}: got {:.2f}",
                                       i, MIN_ALERT_THRESHOLD, MAX_ALERT_THRESHOLD, t));
        }
    }

    // Exit code only matters when threshold exits are on for this scope
    if (b.exit_code && b.exit_on_threshold.value_or(false)) {
        if (*b.exit_code < MIN_EXIT_CODE || *b.exit_code > MAX_EXIT_CODE) {
            return invalid(fmt::format("exit code must be between {} and {}: got {}",
                                       MIN_EXIT_CODE, MAX_EXIT_CODE, *b.exit_code));
        }
    }
    return Result<void>::Ok();
}

using Warnings = std::vector<std::string>;

Result<Warnings> validate_budgets(const BudgetsConfig& config) {
    if (config.has_scoped_budgets() && !config.has_global_budget()) {
        return Result<Warnings>::Err("global budget is required when scoped budgets are defined",
                                     ErrorKind::InvalidArgument);
    }

    const std::string global_currency = config.global_currency();

    if (config.global) {
        auto r = validate_scoped_budget(*config.global, "");
        if (r.is_err()) return Result<Warnings>::Err("global budget: " + r.error, r.kind);
    }

    for (const auto& [name, budget] : config.providers) {
        auto r = validate_scoped_budget(budget, global_currency);
        if (r.is_err()) {
            return Result<Warnings>::Err(fmt::format("provider \"{}\" budget: {}", name, r.error), r.kind);
        }
    }

    std::map<int, std::vector<std::string>> by_priority;
    for (size_t i = 0; i < config.tags.size(); ++i) {
        const auto& tag = config.tags[i];
        auto sel = parse_tag_selector(tag.selector);
        if (sel.is_err()) {
            return Result<Warnings>::Err(fmt::format("tag budget[{}]: {}", i, sel.error), sel.kind);
        }
        auto r = validate_scoped_budget(tag, global_currency);
        if (r.is_err()) {
            return Result<Warnings>::Err(
                fmt::format("tag budget[{}] \"{}\": {}", i, tag.selector, r.error), r.kind);
        }
        by_priority[tag.priority].push_back(tag.selector);
    }

    for (const auto& [name, budget] : config.types) {
        auto r = validate_scoped_budget(budget, global_currency);
        if (r.is_err()) {
            return Result<Warnings>::Err(fmt::format("type \"{}\" budget: {}", name, r.error), r.kind);
        }
    }

    if (config.exit_code && (*config.exit_code < MIN_EXIT_CODE || *config.exit_code > MAX_EXIT_CODE)) {
        return Result<Warnings>::Err(fmt::format("exit code must be between {} and {}: got {}",
                                                 MIN_EXIT_CODE, MAX_EXIT_CODE, *config.exit_code),
                                     ErrorKind::InvalidArgument);
    }

    Warnings warnings;
    for (const auto& [priority, selectors] : by_priority) {
        if (selectors.size() > 1) {
            warnings.push_back(fmt::format(
                "tag budgets with priority {}: [{}] - first alphabetically will be selected",
                priority, StringUtils::join(selectors, ", ")));
        }
    }
    return Result<Warnings>::Ok(warnings);
}
