#include "query_engine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

BudgetQueryEngine::BudgetQueryEngine(const FileCacheStore& store, CostSource& source,
                                     const BudgetsConfig* budgets)
    : store_(store), source_(source), evaluator_(budgets) {}

Result<BudgetReport> BudgetQueryEngine::run(const KeyParams& params) {
    auto key = generate_key(params);
    if (key.is_err()) {
        fincore_log("engine: cache key generation failed, bypassing cache: " + key.error);
    }

    if (key.is_ok()) {
        auto cached = store_.get(key.value);
        if (cached.is_ok()) {
            auto report = decode_report(cached.value.data);
            if (report.is_ok()) {
                fincore_log(fmt::format("engine: cache hit {}", key.value));
                report.value.cache_key = key.value;
                report.value.from_cache = true;
                return report;
            }
            fincore_log(fmt::format("engine: discarding undecodable cache entry {}: {}",
                                    key.value, report.error));
        } else if (!cached.is(ErrorKind::Disabled)) {
            fincore_log(fmt::format("engine: cache {} for {}",
                                    error_kind_name(cached.kind), key.value));
        }
    }

    auto items = source_.fetch_costs(params);
    if (items.is_err()) {
        fincore_log("engine: cost source failed: " + items.error);
        return Result<BudgetReport>::Err("Failed to fetch costs: " + items.error, items.kind);
    }

    BudgetReport report;
    report.result = progress_ ? evaluator_.evaluate(items.value, *progress_)
                              : evaluator_.evaluate(items.value);

    if (key.is_ok()) {
        report.cache_key = key.value;
        if (store_.is_enabled()) {
            auto stored = store_.set(key.value, encode_report(report));
            if (stored.is_err()) {
                fincore_log(fmt::format("engine: failed to cache report {}: {}",
                                        key.value, stored.error));
            }
        }
    }
    return Result<BudgetReport>::Ok(std::move(report));
}
