#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

struct PaginationKeyParams {
    int limit = 0;
    int offset = 0;
    std::string sort_field;
    std::string sort_order;     // "asc" / "desc", any casing
};

// Description of a cost or recommendation query. Two parameter sets that
// differ only in operation/provider/sort-order casing, or in the order of
// resource_types, produce the same key.
struct KeyParams {
    std::string operation;
    std::string provider;
    std::vector<std::string> resource_types;
    std::map<std::string, std::string> filters;
    std::optional<PaginationKeyParams> pagination;
};

// Deterministic serialized form of `params` after normalization. This is the
// exact byte sequence that generate_key() hashes. Fails with
// ErrorKind::InvalidArgument if any string field is not valid UTF-8.
Result<std::string> canonicalize_key_params(const KeyParams& params);

// SHA-256 of the canonical form, as 64 lowercase hex characters.
Result<std::string> generate_key(const KeyParams& params);

// Hashes operation, provider and the extras joined in call order. Order
// sensitive: callers must pass extras in a stable order.
std::string generate_simple_key(const std::string& operation,
                                const std::string& provider,
                                const std::vector<std::string>& extra = {});

// Hashes the query string verbatim (no whitespace or case normalization).
std::string generate_key_from_query(const std::string& query);

// Lowercase hex SHA-256 digest of arbitrary bytes.
std::string sha256_hex(const std::string& data);

class KeyParamsBuilder {
public:
    KeyParamsBuilder(const std::string& operation, const std::string& provider);

    KeyParamsBuilder& with_resource_types(const std::vector<std::string>& types);
    KeyParamsBuilder& with_filter(const std::string& key, const std::string& value);
    // Merged into any filters already set; later values win on key collision.
    KeyParamsBuilder& with_filters(const std::map<std::string, std::string>& filters);
    KeyParamsBuilder& with_pagination(int limit, int offset,
                                      const std::string& sort_field,
                                      const std::string& sort_order);

    Result<std::string> build() const;
    KeyParams build_params() const { return params_; }

private:
    KeyParams params_;
};
