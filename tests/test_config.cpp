#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

static const char* kFullConfig = R"(
cost:
  budgets:
    global:
      amount: 5000
      currency: USD
      alerts:
        - { threshold: 80, type: actual }
        - { threshold: 100, type: forecasted }
    providers:
      AWS: { amount: 3000, currency: USD }
    tags:
      - { selector: "team:platform", priority: 100, amount: 1000 }
      - { selector: "env:*", priority: 10, amount: 200, exit_on_threshold: true, exit_code: 4 }
    types:
      "aws:ec2/instance": { amount: 800 }
    exit_on_threshold: true
    exit_code: 2
  cache:
    enabled: false
    directory: /tmp/fincore-config-test
    ttl: 1h30m
    max_size_mb: 50
)";

TEST(Config, ParsesBudgets) {
    auto cfg = Config::parse(kFullConfig);
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;

    const auto& b = cfg.value.budgets();
    ASSERT_TRUE(b.global.has_value());
    EXPECT_DOUBLE_EQ(b.global->amount, 5000);
    EXPECT_EQ(b.global->currency, "USD");
    ASSERT_EQ(b.global->alerts.size(), 2u);
    EXPECT_EQ(b.global->alerts[1].type, AlertType::Forecasted);

    ASSERT_EQ(b.providers.count("AWS"), 1u);
    EXPECT_DOUBLE_EQ(b.providers.at("AWS").amount, 3000);

    ASSERT_EQ(b.tags.size(), 2u);
    EXPECT_EQ(b.tags[0].selector, "team:platform");
    EXPECT_EQ(b.tags[0].priority, 100);
    EXPECT_EQ(b.tags[1].exit_on_threshold, std::optional<bool>(true));
    EXPECT_EQ(b.tags[1].exit_code, std::optional<int>(4));

    ASSERT_EQ(b.types.count("aws:ec2/instance"), 1u);
    EXPECT_TRUE(b.exit_on_threshold);
    EXPECT_EQ(b.effective_exit_code(std::nullopt), 2);
    EXPECT_TRUE(cfg.value.warnings().empty());
}

TEST(Config, ParsesCache) {
    auto cfg = Config::parse(kFullConfig);
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;

    const auto& c = cfg.value.cache();
    EXPECT_FALSE(c.enabled);
    EXPECT_EQ(c.directory, fs::path("/tmp/fincore-config-test"));
    EXPECT_EQ(c.ttl_seconds, 5400);
    EXPECT_EQ(c.max_size_mb, 50);
}

TEST(Config, EmptyDocumentUsesDefaults) {
    auto cfg = Config::parse("");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_FALSE(cfg.value.budgets().is_enabled());
    EXPECT_TRUE(cfg.value.cache().enabled);
    EXPECT_EQ(cfg.value.cache().ttl_seconds, DEFAULT_CACHE_TTL_SECONDS);
}

TEST(Config, TildeDirectoryExpandsToHome) {
    auto cfg = Config::parse("cost:\n  cache:\n    directory: ~/.fincore/alt\n");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_EQ(cfg.value.cache().directory, platform::home_dir() / ".fincore" / "alt");
}

TEST(Config, InvalidBudgetsRejected) {
    auto cfg = Config::parse(R"(
cost:
  budgets:
    providers:
      aws: { amount: 100 }
)");
    EXPECT_TRUE(cfg.is(ErrorKind::InvalidArgument));
    EXPECT_NE(cfg.error.find("global budget is required"), std::string::npos);
}

TEST(Config, UnknownAlertTypeRejected) {
    auto cfg = Config::parse(R"(
cost:
  budgets:
    global:
      amount: 100
      alerts:
        - { threshold: 50, type: predicted }
)");
    EXPECT_TRUE(cfg.is_err());
    EXPECT_NE(cfg.error.find("predicted"), std::string::npos);
}

TEST(Config, DuplicateTagPrioritiesWarn) {
    auto cfg = Config::parse(R"(
cost:
  budgets:
    global: { amount: 100 }
    tags:
      - { selector: "team:a", priority: 5, amount: 10 }
      - { selector: "team:b", priority: 5, amount: 10 }
)");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    ASSERT_EQ(cfg.value.warnings().size(), 1u);
}

TEST(Config, OutOfRangeTtlRejected) {
    auto cfg = Config::parse("cost:\n  cache:\n    ttl_seconds: 5\n");
    EXPECT_TRUE(cfg.is(ErrorKind::InvalidArgument));
}

TEST(Config, MalformedYamlIsParseError) {
    auto cfg = Config::parse("cost: { budgets: [unterminated");
    EXPECT_TRUE(cfg.is(ErrorKind::Parse));
}

TEST(Config, MalformedAmountIsParseError) {
    auto cfg = Config::parse(R"(
cost:
  budgets:
    global: { amount: abc }
)");
    EXPECT_TRUE(cfg.is(ErrorKind::Parse));
    EXPECT_NE(cfg.error.find("global budget"), std::string::npos);
}

TEST(Config, MalformedScalarsAreParseErrors) {
    EXPECT_TRUE(Config::parse(R"(
cost:
  budgets:
    global: { amount: 100 }
    tags:
      - { selector: "team:a", priority: high, amount: 10 }
)").is(ErrorKind::Parse));

    EXPECT_TRUE(Config::parse(R"(
cost:
  budgets:
    global:
      amount: 100
      alerts:
        - { threshold: most, type: actual }
)").is(ErrorKind::Parse));

    EXPECT_TRUE(Config::parse("cost:\n  cache:\n    max_size_mb: lots\n").is(ErrorKind::Parse));
    EXPECT_TRUE(Config::parse("cost:\n  cache:\n    enabled: maybe\n").is(ErrorKind::Parse));
}

TEST(Config, NullValuesTakeDefaults) {
    auto cfg = Config::parse(R"(
cost:
  budgets:
    global: { amount: ~, currency: USD }
  cache:
    max_size_mb:
)");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    ASSERT_TRUE(cfg.value.budgets().global.has_value());
    EXPECT_DOUBLE_EQ(cfg.value.budgets().global->amount, 0.0);
    EXPECT_EQ(cfg.value.cache().max_size_mb, DEFAULT_CACHE_MAX_SIZE_MB);
}

TEST(Config, HugeDurationTtlRejected) {
    auto cfg = Config::parse("cost:\n  cache:\n    ttl: 999999999999999d\n");
    EXPECT_TRUE(cfg.is(ErrorKind::InvalidArgument));
    EXPECT_NE(cfg.error.find("999999999999999d"), std::string::npos);
}

TEST(Config, MissingFileIsNotFound) {
    auto cfg = Config::load("/nonexistent/fincore/config.yaml");
    EXPECT_TRUE(cfg.is(ErrorKind::NotFound));
}

class GlobalConfigTest : public ::testing::Test {
protected:
    fs::path home;
    std::string saved_home;

    void SetUp() override {
        const char* h = std::getenv("HOME");
        saved_home = h ? h : "";
        home = platform::unique_temp_path(fs::temp_directory_path(), "fincore_home_test");
        fs::create_directories(home);
        setenv("HOME", home.c_str(), 1);
    }

    void TearDown() override {
        setenv("HOME", saved_home.c_str(), 1);
        std::error_code ec;
        fs::remove_all(home, ec);
    }
};

TEST_F(GlobalConfigTest, CreateDefaultThenLoad) {
    EXPECT_FALSE(global_config_exists());
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());
    EXPECT_EQ(get_global_config_path(), home / ".fincore" / "config.yaml");

    auto cfg = Config::load_global();
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_FALSE(cfg.value.budgets().has_global_budget());
    EXPECT_TRUE(cfg.value.cache().enabled);
    EXPECT_EQ(cfg.value.cache().directory, home / ".fincore" / "cache");
}

TEST_F(GlobalConfigTest, CreateDefaultNeverOverwrites) {
    fs::create_directories(get_global_config_dir());
    std::ofstream(get_global_config_path()) << "cost:\n  cache:\n    max_size_mb: 7\n";

    ASSERT_TRUE(create_default_global_config().is_ok());
    auto cfg = Config::load_global();
    ASSERT_TRUE(cfg.is_ok()) << cfg.error;
    EXPECT_EQ(cfg.value.cache().max_size_mb, 7);
}
