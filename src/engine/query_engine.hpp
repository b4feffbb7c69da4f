#pragma once

#include <optional>
#include <core/types.hpp>
#include <cache/cache_key.hpp>
#include <cache/file_store.hpp>
#include <budget/budget_config.hpp>
#include <budget/evaluator.hpp>
#include "cost_source.hpp"
#include "report_codec.hpp"

// Serves budget reports for a query, memoized in a FileCacheStore.
//
// Every cache condition (miss, expired, disabled, unreadable, undecodable)
// falls through to the CostSource; only a source failure is returned as an
// error. A failed cache write is logged and otherwise ignored.
class BudgetQueryEngine {
public:
    // `store`, `source` and `budgets` must outlive the engine. `budgets` may
    // be null.
    BudgetQueryEngine(const FileCacheStore& store, CostSource& source,
                      const BudgetsConfig* budgets);

    Result<BudgetReport> run(const KeyParams& params);

    // Month position used for forecasts. Defaults to the current month.
    void set_month_progress(const MonthProgress& progress) { progress_ = progress; }

private:
    const FileCacheStore& store_;
    CostSource& source_;
    ScopedBudgetEvaluator evaluator_;
    std::optional<MonthProgress> progress_;
};
