#include "cache_key.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>
#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <utility>

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        fincore_log("sha256_hex: EVP_Digest failed");
        return "";
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

static Result<void> check_utf8(const char* field, const std::string& value) {
    if (StringUtils::is_valid_utf8(value)) return Result<void>::Ok();
    return Result<void>::Err(fmt::format("cache key {} is not valid UTF-8", field),
                             ErrorKind::InvalidArgument);
}

// The emitter replaces malformed UTF-8 with U+FFFD, which would map distinct
// byte strings to one canonical form.
static Result<void> check_key_params_utf8(const KeyParams& params) {
    std::vector<std::pair<const char*, const std::string*>> fields = {
        {"operation", &params.operation},
        {"provider", &params.provider},
    };
    for (const auto& t : params.resource_types) fields.push_back({"resource type", &t});
    for (const auto& [k, v] : params.filters) {
        fields.push_back({"filter key", &k});
        fields.push_back({"filter value", &v});
    }
    if (params.pagination) {
        fields.push_back({"sort field", &params.pagination->sort_field});
        fields.push_back({"sort order", &params.pagination->sort_order});
    }

    for (const auto& [field, value] : fields) {
        auto r = check_utf8(field, *value);
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

Result<std::string> canonicalize_key_params(const KeyParams& params) {
    auto valid = check_key_params_utf8(params);
    if (valid.is_err()) {
        return Result<std::string>::Err(valid.error, valid.kind);
    }

    std::vector<std::string> types = params.resource_types;
    std::sort(types.begin(), types.end());

    // Every scalar double-quoted and every collection in flow style, so the
    // text depends only on the values.
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);

    out << YAML::BeginMap;
    out << YAML::Key << "operation" << YAML::Value << StringUtils::to_lower(params.operation);
    out << YAML::Key << "provider" << YAML::Value << StringUtils::to_lower(params.provider);

    out << YAML::Key << "resource_types" << YAML::Value << YAML::BeginSeq;
    for (const auto& t : types) out << t;
    out << YAML::EndSeq;

    // std::map iterates in key order
    out << YAML::Key << "filters" << YAML::Value << YAML::BeginMap;
    for (const auto& [k, v] : params.filters) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;

    if (params.pagination) {
        const auto& p = *params.pagination;
        out << YAML::Key << "pagination" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "limit" << YAML::Value << p.limit;
        out << YAML::Key << "offset" << YAML::Value << p.offset;
        out << YAML::Key << "sort_field" << YAML::Value << p.sort_field;
        out << YAML::Key << "sort_order" << YAML::Value << StringUtils::to_lower(p.sort_order);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        return Result<std::string>::Err(
            "Failed to serialize cache key params: " + out.GetLastError(), ErrorKind::Parse);
    }
    return Result<std::string>::Ok(std::string(out.c_str(), out.size()));
}

Result<std::string> generate_key(const KeyParams& params) {
    auto canonical = canonicalize_key_params(params);
    if (canonical.is_err()) {
        return canonical;
    }

    std::string key = sha256_hex(canonical.value);
    if (key.empty()) {
        return Result<std::string>::Err("Failed to hash cache key params", ErrorKind::Io);
    }
    return Result<std::string>::Ok(key);
}

std::string generate_simple_key(const std::string& operation,
                                const std::string& provider,
                                const std::vector<std::string>& extra) {
    std::string joined = operation + ":" + provider;
    for (const auto& e : extra) {
        joined += ":" + e;
    }
    return sha256_hex(joined);
}

std::string generate_key_from_query(const std::string& query) {
    return sha256_hex(query);
}

// ── KeyParamsBuilder ────────────────────────────────────────

KeyParamsBuilder::KeyParamsBuilder(const std::string& operation, const std::string& provider) {
    params_.operation = operation;
    params_.provider = provider;
}

KeyParamsBuilder& KeyParamsBuilder::with_resource_types(const std::vector<std::string>& types) {
    params_.resource_types.insert(params_.resource_types.end(), types.begin(), types.end());
    return *this;
}

KeyParamsBuilder& KeyParamsBuilder::with_filter(const std::string& key, const std::string& value) {
    params_.filters[key] = value;
    return *this;
}

KeyParamsBuilder& KeyParamsBuilder::with_filters(const std::map<std::string, std::string>& filters) {
    for (const auto& [k, v] : filters) {
        params_.filters[k] = v;
    }
    return *this;
}

KeyParamsBuilder& KeyParamsBuilder::with_pagination(int limit, int offset,
                                                    const std::string& sort_field,
                                                    const std::string& sort_order) {
    PaginationKeyParams p;
    p.limit = limit;
    p.offset = offset;
    p.sort_field = sort_field;
    p.sort_order = sort_order;
    params_.pagination = p;
    return *this;
}

Result<std::string> KeyParamsBuilder::build() const {
    return generate_key(params_);
}
