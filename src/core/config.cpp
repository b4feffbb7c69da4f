#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    std::error_code ec;
    return fs::exists(get_global_config_path(), ec);
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".fincore";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return Result<void>::Ok();
    }

    // Ensure directory exists
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create config directory: " + ec.message());
    }

    // Default config content
    const char* default_config = R"(# fincore configuration

cost:
  # Spending limits. An amount of 0 disables a budget. Provider, tag and
  # type budgets require an enabled global budget.
  budgets:
    global:
      amount: 0
      currency: USD
      # alerts:
      #   - { threshold: 80, type: actual }
      #   - { threshold: 100, type: forecasted }
    # providers:
    #   aws: { amount: 3000, currency: USD }
    # tags:
    #   - { selector: "team:platform", priority: 100, amount: 1000, currency: USD }
    # types:
    #   "aws:ec2/instance": { amount: 800, currency: USD }
    exit_on_threshold: false

  # Query result cache
  cache:
    enabled: true
    directory: ~/.fincore/cache
    ttl_seconds: 3600
    max_size_mb: 100
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (out.fail()) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// Missing or null keys take the fallback; anything else must convert or
// yaml-cpp throws.
template <typename T>
static T scalar_or(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    return value.as<T>();
}

// ── Budgets ─────────────────────────────────────────────────

static Result<ScopedBudget> parse_scoped_budget_fields(const YAML::Node& node) {
    ScopedBudget b;
    b.amount = scalar_or<double>(node, "amount", 0.0);
    b.currency = scalar_or<std::string>(node, "currency", "");
    b.period = scalar_or<std::string>(node, "period", "");

    if (node["alerts"] && node["alerts"].IsSequence()) {
        for (const auto& a : node["alerts"]) {
            AlertConfig alert;
            alert.threshold = scalar_or<double>(a, "threshold", 0.0);
            std::string type = scalar_or<std::string>(a, "type", "actual");
            auto parsed = parse_alert_type(type);
            if (!parsed) {
                return Result<ScopedBudget>::Err(
                    fmt::format("alert type must be 'actual' or 'forecasted': got \"{}\"", type),
                    ErrorKind::InvalidArgument);
            }
            alert.type = *parsed;
            b.alerts.push_back(alert);
        }
    }

    if (node["exit_on_threshold"]) {
        b.exit_on_threshold = node["exit_on_threshold"].as<bool>();
    }
    if (node["exit_code"]) {
        b.exit_code = node["exit_code"].as<int>();
    }
    return Result<ScopedBudget>::Ok(b);
}

Result<ScopedBudget> parse_scoped_budget(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ScopedBudget>::Err("budget must be a map", ErrorKind::Parse);
    }

    try {
        return parse_scoped_budget_fields(node);
    } catch (const YAML::Exception& e) {
        return Result<ScopedBudget>::Err(fmt::format("invalid budget value: {}", e.what()),
                                         ErrorKind::Parse);
    }
}

void emit_scoped_budget(YAML::Emitter& out, const ScopedBudget& budget) {
    out << YAML::BeginMap;
    out << YAML::Key << "amount" << YAML::Value << budget.amount;
    out << YAML::Key << "currency" << YAML::Value << budget.currency;
    out << YAML::Key << "period" << YAML::Value << budget.period;
    out << YAML::Key << "alerts" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : budget.alerts) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "threshold" << YAML::Value << a.threshold;
        out << YAML::Key << "type" << YAML::Value << alert_type_name(a.type);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    if (budget.exit_on_threshold) {
        out << YAML::Key << "exit_on_threshold" << YAML::Value << *budget.exit_on_threshold;
    }
    if (budget.exit_code) {
        out << YAML::Key << "exit_code" << YAML::Value << *budget.exit_code;
    }
    out << YAML::EndMap;
}

static Result<BudgetsConfig> parse_budgets_config(const YAML::Node& node) {
    BudgetsConfig budgets;

    if (node["global"]) {
        auto g = parse_scoped_budget(node["global"]);
        if (g.is_err()) return Result<BudgetsConfig>::Err("global budget: " + g.error, g.kind);
        budgets.global = g.value;
    }

    if (node["providers"] && node["providers"].IsMap()) {
        for (const auto& kv : node["providers"]) {
            std::string name = kv.first.as<std::string>();
            auto b = parse_scoped_budget(kv.second);
            if (b.is_err()) {
                return Result<BudgetsConfig>::Err(
                    fmt::format("provider \"{}\" budget: {}", name, b.error), b.kind);
            }
            budgets.providers[name] = b.value;
        }
    }

    if (node["tags"] && node["tags"].IsSequence()) {
        size_t i = 0;
        for (const auto& t : node["tags"]) {
            auto b = parse_scoped_budget(t);
            if (b.is_err()) {
                return Result<BudgetsConfig>::Err(
                    fmt::format("tag budget[{}]: {}", i, b.error), b.kind);
            }
            TagBudget tag;
            static_cast<ScopedBudget&>(tag) = b.value;
            tag.selector = scalar_or<std::string>(t, "selector", "");
            tag.priority = scalar_or<int>(t, "priority", 0);
            budgets.tags.push_back(tag);
            ++i;
        }
    }

    if (node["types"] && node["types"].IsMap()) {
        for (const auto& kv : node["types"]) {
            std::string type = kv.first.as<std::string>();
            auto b = parse_scoped_budget(kv.second);
            if (b.is_err()) {
                return Result<BudgetsConfig>::Err(
                    fmt::format("type \"{}\" budget: {}", type, b.error), b.kind);
            }
            budgets.types[type] = b.value;
        }
    }

    budgets.exit_on_threshold = scalar_or<bool>(node, "exit_on_threshold", false);
    if (node["exit_code"]) {
        budgets.exit_code = node["exit_code"].as<int>();
    }

    return Result<BudgetsConfig>::Ok(budgets);
}

// ── Cache ───────────────────────────────────────────────────

static fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

static Result<CacheSettings> parse_cache_config(const YAML::Node& node) {
    CacheSettings cache;
    cache.enabled = scalar_or<bool>(node, "enabled", true);

    std::string dir = scalar_or<std::string>(node, "directory", "");
    if (!dir.empty()) {
        cache.directory = expand_home(dir);
    }

    // "ttl" accepts a duration string; "ttl_seconds" a plain integer
    if (node["ttl"]) {
        auto ttl = parse_ttl(node["ttl"].as<std::string>());
        if (ttl.is_err()) return Result<CacheSettings>::Err("cache: " + ttl.error, ttl.kind);
        cache.ttl_seconds = ttl.value;
    } else if (node["ttl_seconds"]) {
        auto ttl = validate_ttl(node["ttl_seconds"].as<int>());
        if (ttl.is_err()) return Result<CacheSettings>::Err("cache: " + ttl.error, ttl.kind);
        cache.ttl_seconds = ttl.value;
    }

    cache.max_size_mb = scalar_or<int>(node, "max_size_mb", DEFAULT_CACHE_MAX_SIZE_MB);
    if (cache.max_size_mb < 0) {
        return Result<CacheSettings>::Err(
            fmt::format("cache: max_size_mb cannot be negative: got {}", cache.max_size_mb),
            ErrorKind::InvalidArgument);
    }
    return Result<CacheSettings>::Ok(cache);
}

// ── Loading ─────────────────────────────────────────────────

Result<Config> Config::from_node(const YAML::Node& root) {
    Config config;

    const YAML::Node cost = root.IsMap() ? root["cost"] : YAML::Node();
    if (cost && cost.IsMap()) {
        if (cost["budgets"]) {
            auto budgets = parse_budgets_config(cost["budgets"]);
            if (budgets.is_err()) {
                return Result<Config>::Err("budgets: " + budgets.error, budgets.kind);
            }
            auto validated = validate_budgets(budgets.value);
            if (validated.is_err()) {
                return Result<Config>::Err("budgets: " + validated.error, validated.kind);
            }
            config.budgets_ = budgets.value;
            config.warnings_ = validated.value;
        }
        if (cost["cache"]) {
            auto cache = parse_cache_config(cost["cache"]);
            if (cache.is_err()) {
                return Result<Config>::Err(cache.error, cache.kind);
            }
            config.cache_ = cache.value;
        }
    }

    config.cache_ = cache_settings_from_env(config.cache_);
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& text) {
    try {
        return from_node(YAML::Load(text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::Parse);
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err("Config not found at " + path.string(), ErrorKind::NotFound);
    }

    try {
        return from_node(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err(
            fmt::format("Failed to parse config {}: {}", path.string(), e.what()),
            ErrorKind::Parse);
    }
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}
