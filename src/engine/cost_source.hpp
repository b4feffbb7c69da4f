#pragma once

#include <vector>
#include <core/types.hpp>
#include <cache/cache_key.hpp>
#include <budget/budget_types.hpp>

// Source of truth for priced resources (a provider plugin, a billing export).
// Called on every cache miss.
class CostSource {
public:
    virtual ~CostSource() = default;
    virtual Result<std::vector<CostLineItem>> fetch_costs(const KeyParams& params) = 0;
};
