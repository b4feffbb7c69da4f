#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include <budget/budget_config.hpp>
#include <cache/cache_config.hpp>

namespace YAML {
class Node;
class Emitter;
}

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.fincore/config.yaml
    static Result<Config> load_global();

    // Load a config file at an explicit path
    static Result<Config> load(const fs::path& path);

    // Parse config text (same layout as the file)
    static Result<Config> parse(const std::string& text);

    // Accessors
    const BudgetsConfig& budgets() const { return budgets_; }
    const CacheSettings& cache() const { return cache_; }

    // Non-fatal budget validation warnings
    const std::vector<std::string>& warnings() const { return warnings_; }

public:
    Config() = default;

private:
    static Result<Config> from_node(const YAML::Node& root);

    BudgetsConfig budgets_;
    CacheSettings cache_;
    std::vector<std::string> warnings_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites)
Result<void> create_default_global_config();

// One budget block: amount, currency, period, alerts, exit_on_threshold, exit_code.
// Shared with the report codec so stored reports use the config layout.
Result<ScopedBudget> parse_scoped_budget(const YAML::Node& node);
void emit_scoped_budget(YAML::Emitter& out, const ScopedBudget& budget);
