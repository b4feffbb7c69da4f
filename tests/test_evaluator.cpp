#include <gtest/gtest.h>
#include <budget/evaluator.hpp>
#include <algorithm>

static ScopedBudget budget(double amount) {
    ScopedBudget b;
    b.amount = amount;
    b.currency = "USD";
    return b;
}

static TagBudget tag_budget(const std::string& selector, int priority, double amount) {
    TagBudget t;
    t.selector = selector;
    t.priority = priority;
    t.amount = amount;
    t.currency = "USD";
    return t;
}

static BudgetsConfig full_config() {
    BudgetsConfig c;
    c.global = budget(5000);
    c.providers["aws"] = budget(3000);
    c.tags.push_back(tag_budget("team:platform", 100, 1000));
    c.types["aws:ec2/instance"] = budget(800);
    return c;
}

static MonthProgress mid_month() {
    MonthProgress p;
    p.day = 15;
    p.days_in_month = 30;
    return p;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ── extract_provider ────────────────────────────────────────

TEST(ExtractProvider, EdgeCases) {
    EXPECT_EQ(extract_provider("aws:ec2/instance"), "aws");
    EXPECT_EQ(extract_provider("AWS:ec2/instance"), "aws");
    EXPECT_EQ(extract_provider("unknown"), "unknown");
    EXPECT_EQ(extract_provider("Unknown"), "unknown");
    EXPECT_EQ(extract_provider(""), "");
    EXPECT_EQ(extract_provider(":x"), "");
    EXPECT_EQ(extract_provider("gcp:compute:disk"), "gcp");
}

// ── Lookups ─────────────────────────────────────────────────

TEST(ScopedBudgetEvaluator, ProviderLookupIsCaseInsensitive) {
    BudgetsConfig c = full_config();
    c.providers["GCP"] = budget(100);
    ScopedBudgetEvaluator ev(&c);

    ASSERT_NE(ev.get_provider_budget("aws"), nullptr);
    ASSERT_NE(ev.get_provider_budget("AWS"), nullptr);
    ASSERT_NE(ev.get_provider_budget("gcp"), nullptr);
    EXPECT_DOUBLE_EQ(ev.get_provider_budget("Aws")->amount, 3000);
    EXPECT_EQ(ev.get_provider_budget("azure"), nullptr);
}

TEST(ScopedBudgetEvaluator, TypeLookupIsExact) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    EXPECT_NE(ev.get_type_budget("aws:ec2/instance"), nullptr);
    EXPECT_EQ(ev.get_type_budget("AWS:ec2/instance"), nullptr);
    EXPECT_EQ(ev.get_type_budget("aws:ec2/Instance"), nullptr);
}

TEST(ScopedBudgetEvaluator, NullConfigAllocatesNothing) {
    ScopedBudgetEvaluator ev(nullptr);

    EXPECT_EQ(ev.get_provider_budget("aws"), nullptr);
    EXPECT_EQ(ev.get_type_budget("aws:ec2/instance"), nullptr);
    EXPECT_TRUE(ev.match_tag_budgets({{"team", "platform"}}).empty());

    auto a = ev.allocate_costs("aws:ec2/instance", {{"team", "platform"}}, 10);
    EXPECT_TRUE(a.allocated_scopes.empty());
    EXPECT_EQ(a.provider, "aws");

    auto r = ev.evaluate({{"r1", "aws:ec2/instance", {}, 10}}, mid_month());
    EXPECT_FALSE(r.global.has_value());
    EXPECT_TRUE(r.by_provider.empty());
    EXPECT_EQ(r.overall_health, BudgetHealth::Unspecified);
    EXPECT_EQ(r.allocations.size(), 1u);
}

// ── Tag matching ────────────────────────────────────────────

TEST(ScopedBudgetEvaluator, MatchTagBudgetsByPriority) {
    BudgetsConfig c = full_config();
    c.tags = {tag_budget("env:*", 10, 100), tag_budget("team:platform", 50, 100),
              tag_budget("team:backend", 90, 100)};
    ScopedBudgetEvaluator ev(&c);

    auto matches = ev.match_tag_budgets({{"team", "platform"}, {"env", "prod"}});
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].selector, "team:platform");
    EXPECT_EQ(matches[1].selector, "env:*");

    EXPECT_TRUE(ev.match_tag_budgets({}).empty());
    EXPECT_TRUE(ev.match_tag_budgets({{"owner", "me"}}).empty());
}

TEST(ScopedBudgetEvaluator, InvalidSelectorsAreSkipped) {
    BudgetsConfig c = full_config();
    c.tags = {tag_budget("not a selector", 100, 100), tag_budget("team:platform", 1, 100)};
    ScopedBudgetEvaluator ev(&c);

    ASSERT_EQ(ev.tag_budgets().size(), 1u);
    auto matches = ev.match_tag_budgets({{"team", "platform"}});
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].selector, "team:platform");
}

TEST(ScopedBudgetEvaluator, SelectSingleHighest) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto sel = ev.select_highest_priority_tag_budget(
        {tag_budget("team:platform", 100, 1), tag_budget("env:*", 10, 1)});
    ASSERT_TRUE(sel.selected.has_value());
    EXPECT_EQ(sel.selected->selector, "team:platform");
    EXPECT_TRUE(sel.warnings.empty());

    EXPECT_FALSE(ev.select_highest_priority_tag_budget({}).selected.has_value());
}

TEST(ScopedBudgetEvaluator, PriorityTieBreaksAlphabetically) {
    BudgetsConfig c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto sel = ev.select_highest_priority_tag_budget(
        {tag_budget("team:platform", 100, 1000), tag_budget("team:backend", 100, 1000)});
    ASSERT_TRUE(sel.selected.has_value());
    EXPECT_EQ(sel.selected->selector, "team:backend");
    ASSERT_EQ(sel.warnings.size(), 1u);
    EXPECT_NE(sel.warnings[0].find("100"), std::string::npos);
    EXPECT_NE(sel.warnings[0].find("overlapping"), std::string::npos);
}

TEST(ScopedBudgetEvaluator, TieDuringAllocation) {
    BudgetsConfig c;
    c.global = budget(5000);
    c.tags = {tag_budget("team:*", 100, 1000), tag_budget("env:prod", 100, 1000)};
    ScopedBudgetEvaluator ev(&c);

    auto a = ev.allocate_costs("aws:s3/bucket", {{"team", "x"}, {"env", "prod"}}, 5);
    EXPECT_EQ(a.selected_tag_budget, "env:prod");
    EXPECT_TRUE(contains(a.allocated_scopes, "tag:env:prod"));
    EXPECT_FALSE(contains(a.allocated_scopes, "tag:team:*"));
    EXPECT_EQ(a.matched_tags.size(), 2u);
    ASSERT_EQ(a.warnings.size(), 1u);
    EXPECT_NE(a.warnings[0].find("100"), std::string::npos);
}

// ── Allocation ──────────────────────────────────────────────

TEST(ScopedBudgetEvaluator, MultiScopeFanOut) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto a = ev.allocate_costs("aws:ec2/instance", {{"team", "platform"}}, 42.5);
    std::vector<std::string> expected = {"global", "provider:aws", "tag:team:platform",
                                         "type:aws:ec2/instance"};
    EXPECT_EQ(a.allocated_scopes, expected);
    EXPECT_DOUBLE_EQ(a.cost, 42.5);
    EXPECT_EQ(a.selected_tag_budget, "team:platform");
    EXPECT_TRUE(a.warnings.empty());
}

TEST(ScopedBudgetEvaluator, UnmatchedResourceGoesToGlobalOnly) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto a = ev.allocate_costs("azure:compute/vm", {{"team", "data"}}, 10);
    EXPECT_EQ(a.allocated_scopes, std::vector<std::string>{"global"});
    EXPECT_TRUE(a.selected_tag_budget.empty());
}

TEST(ScopedBudgetEvaluator, DisabledGlobalIsNotAllocated) {
    BudgetsConfig c;
    c.global = budget(0);
    c.providers["aws"] = budget(100);
    ScopedBudgetEvaluator ev(&c);

    auto a = ev.allocate_costs("aws:s3/bucket", {}, 10);
    EXPECT_EQ(a.allocated_scopes, std::vector<std::string>{"provider:aws"});
}

TEST(ScopedBudgetEvaluator, SingleScopeAllocators) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    EXPECT_EQ(ev.allocate_cost_to_provider("AWS:ec2/instance", 1).allocated_scopes,
              std::vector<std::string>{"provider:aws"});
    EXPECT_TRUE(ev.allocate_cost_to_provider(":ec2/instance", 1).allocated_scopes.empty());
    EXPECT_TRUE(ev.allocate_cost_to_provider("gcp:x", 1).allocated_scopes.empty());

    EXPECT_EQ(ev.allocate_cost_to_type("aws:ec2/instance", 1).allocated_scopes,
              std::vector<std::string>{"type:aws:ec2/instance"});
    EXPECT_TRUE(ev.allocate_cost_to_type("aws:s3/bucket", 1).allocated_scopes.empty());

    auto tag = ev.allocate_cost_to_tag("aws:s3/bucket", {{"team", "platform"}}, 1);
    EXPECT_EQ(tag.allocated_scopes, std::vector<std::string>{"tag:team:platform"});
    EXPECT_TRUE(ev.allocate_cost_to_tag("aws:s3/bucket", {}, 1).allocated_scopes.empty());
}

TEST(ScopedBudgetEvaluator, LineItemCarriesResourceId) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    CostLineItem item{"i-123", "aws:ec2/instance", {{"team", "platform"}}, 12};
    auto a = ev.allocate_costs(item);
    EXPECT_EQ(a.resource_id, "i-123");
    EXPECT_EQ(a.allocated_scopes.size(), 4u);
}

// ── evaluate ────────────────────────────────────────────────

TEST(ScopedBudgetEvaluator, EvaluateAccumulatesPerScope) {
    auto c = full_config();
    c.providers["gcp"] = budget(1000);
    c.tags.push_back(tag_budget("env:*", 0, 0));   // disabled, no status
    ScopedBudgetEvaluator ev(&c);

    std::vector<CostLineItem> items = {
        {"i-1", "aws:ec2/instance", {{"team", "platform"}}, 700},
        {"i-2", "aws:ec2/instance", {}, 200},
        {"b-1", "aws:s3/bucket", {{"team", "platform"}}, 100},
        {"g-1", "gcp:compute/instance", {}, 50},
    };
    auto r = ev.evaluate(items, mid_month());

    ASSERT_TRUE(r.global.has_value());
    EXPECT_DOUBLE_EQ(r.global->current_spend, 1050);
    EXPECT_EQ(r.global->matched_resources, 4);
    EXPECT_EQ(r.global->health, BudgetHealth::Ok);

    ASSERT_EQ(r.by_provider.size(), 2u);
    EXPECT_DOUBLE_EQ(r.by_provider.at("aws").current_spend, 1000);
    EXPECT_DOUBLE_EQ(r.by_provider.at("gcp").current_spend, 50);

    ASSERT_EQ(r.by_tag.size(), 1u);
    EXPECT_EQ(r.by_tag[0].scope_key, "team:platform");
    EXPECT_DOUBLE_EQ(r.by_tag[0].current_spend, 800);
    EXPECT_EQ(r.by_tag[0].health, BudgetHealth::Warning);

    ASSERT_EQ(r.by_type.size(), 1u);
    const auto& ec2 = r.by_type.at("aws:ec2/instance");
    EXPECT_DOUBLE_EQ(ec2.current_spend, 900);
    EXPECT_EQ(ec2.health, BudgetHealth::Exceeded);
    EXPECT_EQ(ec2.matched_resources, 2);

    EXPECT_EQ(r.overall_health, BudgetHealth::Exceeded);
    EXPECT_EQ(r.critical_scopes, std::vector<std::string>{"type:aws:ec2/instance"});
    EXPECT_EQ(r.allocations.size(), 4u);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ScopedBudgetEvaluator, EvaluateForecastsAndAlerts) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto r = ev.evaluate({{"i-1", "aws:ec2/instance", {}, 400}}, mid_month());
    const auto& ec2 = r.by_type.at("aws:ec2/instance");
    EXPECT_DOUBLE_EQ(ec2.percentage, 50.0);
    EXPECT_DOUBLE_EQ(ec2.forecasted_spend, 800.0);
    EXPECT_DOUBLE_EQ(ec2.forecast_percentage, 100.0);
    ASSERT_EQ(ec2.alerts.size(), 3u);
    EXPECT_EQ(ec2.alerts[0].status, ThresholdState::Exceeded);
    EXPECT_EQ(ec2.alerts[1].status, ThresholdState::Ok);
}

TEST(ScopedBudgetEvaluator, EvaluateDeduplicatesWarnings) {
    BudgetsConfig c;
    c.global = budget(5000);
    c.tags = {tag_budget("team:platform", 100, 1000), tag_budget("team:*", 100, 1000)};
    ScopedBudgetEvaluator ev(&c);

    std::vector<CostLineItem> items = {
        {"a", "aws:s3/bucket", {{"team", "platform"}}, 1},
        {"b", "aws:s3/bucket", {{"team", "platform"}}, 1},
    };
    auto r = ev.evaluate(items, mid_month());
    EXPECT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.allocations[0].warnings.size(), 1u);
    EXPECT_EQ(r.allocations[1].warnings.size(), 1u);
    ASSERT_EQ(r.by_tag.size(), 2u);
    // "team:*" sorts before "team:platform"
    EXPECT_EQ(r.allocations[0].selected_tag_budget, "team:*");
}

TEST(ScopedBudgetEvaluator, EmptyItemsStillReportConfiguredScopes) {
    auto c = full_config();
    ScopedBudgetEvaluator ev(&c);

    auto r = ev.evaluate({}, mid_month());
    ASSERT_TRUE(r.global.has_value());
    EXPECT_DOUBLE_EQ(r.global->current_spend, 0);
    EXPECT_EQ(r.overall_health, BudgetHealth::Ok);
    EXPECT_TRUE(r.critical_scopes.empty());
}

// ── Threshold exits ─────────────────────────────────────────

static ScopedBudgetStatus exceeded_status() {
    ScopedBudgetStatus s;
    s.budget = budget(100);
    s.alerts = {
        {50, AlertType::Actual, ThresholdState::Exceeded},
        {80, AlertType::Actual, ThresholdState::Exceeded},
        {100, AlertType::Actual, ThresholdState::Approaching},
    };
    return s;
}

TEST(ThresholdExit, RequiresExitEnabledAndExceededAlert) {
    BudgetsConfig c;
    auto s = exceeded_status();
    EXPECT_FALSE(s.should_exit(c));
    EXPECT_EQ(s.exit_code(c), 0);
    EXPECT_EQ(s.exit_reason(c), "");

    c.exit_on_threshold = true;
    EXPECT_TRUE(s.should_exit(c));
    EXPECT_EQ(s.exit_code(c), 1);
    EXPECT_DOUBLE_EQ(s.highest_exceeded_threshold(), 80.0);
    EXPECT_EQ(s.exit_reason(c), "budget threshold exceeded (80%) - exiting with code 1");

    s.alerts[0].status = ThresholdState::Ok;
    s.alerts[1].status = ThresholdState::Approaching;
    EXPECT_FALSE(s.should_exit(c));
    EXPECT_EQ(s.exit_code(c), 0);
    EXPECT_DOUBLE_EQ(s.highest_exceeded_threshold(), 0.0);
}

TEST(ThresholdExit, ZeroExitCodeIsWarningOnly) {
    BudgetsConfig c;
    c.exit_on_threshold = true;
    c.exit_code = 0;
    auto s = exceeded_status();

    EXPECT_TRUE(s.should_exit(c));
    EXPECT_EQ(s.exit_code(c), 0);
    EXPECT_EQ(s.exit_reason(c), "budget threshold exceeded (80%) - warning only, exit code 0");
}

TEST(ThresholdExit, ScopeOverridesTopLevel) {
    BudgetsConfig c;
    c.exit_code = 2;
    auto s = exceeded_status();
    s.budget.exit_on_threshold = true;
    s.budget.exit_code = 3;
    EXPECT_TRUE(s.should_exit(c));
    EXPECT_EQ(s.exit_code(c), 3);

    c.exit_on_threshold = true;
    s.budget.exit_on_threshold = false;
    EXPECT_FALSE(s.should_exit(c));
}

static BudgetsConfig exit_config(std::optional<int> tag_exit_code, bool top_level_exit) {
    BudgetsConfig c;
    c.global = budget(5000);
    c.providers["aws"] = budget(3000);
    auto tag = tag_budget("team:platform", 100, 1000);
    tag.exit_on_threshold = true;
    tag.exit_code = tag_exit_code;
    c.tags.push_back(tag);
    auto type = budget(800);
    type.exit_code = 2;
    c.types["aws:ec2/instance"] = type;
    c.exit_on_threshold = top_level_exit;
    return c;
}

TEST(ThresholdExit, ResultPicksHighestExitCode) {
    std::vector<CostLineItem> items = {
        {"i-1", "aws:ec2/instance", {{"team", "platform"}}, 900},
    };

    // Only the tag has exits on: 90% of its budget
    auto c = exit_config(4, false);
    auto r = ScopedBudgetEvaluator(&c).evaluate(items, mid_month());
    auto d = r.exit_decision(c);
    EXPECT_TRUE(d.should_exit);
    EXPECT_EQ(d.exit_code, 4);
    EXPECT_EQ(d.scope, "tag:team:platform");
    EXPECT_EQ(d.reason, "tag:team:platform: budget threshold exceeded (80%) - exiting with code 4");

    // Exits on everywhere; the tag is warning only, the type (112%) exits with 2
    c = exit_config(0, true);
    r = ScopedBudgetEvaluator(&c).evaluate(items, mid_month());
    d = r.exit_decision(c);
    EXPECT_TRUE(d.should_exit);
    EXPECT_EQ(d.exit_code, 2);
    EXPECT_EQ(d.scope, "type:aws:ec2/instance");
    EXPECT_NE(d.reason.find("(100%)"), std::string::npos);
}

TEST(ThresholdExit, NothingExceededMeansNoExit) {
    auto c = exit_config(4, true);
    auto r = ScopedBudgetEvaluator(&c).evaluate({{"i-1", "aws:ec2/instance", {}, 10}}, mid_month());
    auto d = r.exit_decision(c);
    EXPECT_FALSE(d.should_exit);
    EXPECT_EQ(d.exit_code, 0);
    EXPECT_TRUE(d.scope.empty());
    EXPECT_TRUE(d.reason.empty());
}

TEST(ThresholdExit, WarningOnlyScopeStillReportsExit) {
    auto c = exit_config(0, false);
    auto r = ScopedBudgetEvaluator(&c).evaluate(
        {{"i-1", "aws:ec2/instance", {{"team", "platform"}}, 900}}, mid_month());
    auto d = r.exit_decision(c);
    EXPECT_TRUE(d.should_exit);
    EXPECT_EQ(d.exit_code, 0);
    EXPECT_EQ(d.scope, "tag:team:platform");
}
