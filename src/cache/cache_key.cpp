/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Key Implementation - XXHash-based query hashing
 */

#include "cache/cache_key.hpp"

#include <xxhash.h>

#include <iomanip>
#include <sstream>

namespace tollgate::cache {

std::string hash_query(std::string_view sql, const std::vector<std::string>& params) {
    // Incremental XXH64 over the query and each parameter
    XXH64_state_t* state = XXH64_createState();
    XXH64_reset(state, 0);

    XXH64_update(state, sql.data(), sql.size());
    for (const auto& param : params) {
        // Unit separator keeps parameter boundaries significant
        XXH64_update(state, "\x1f", 1);
        XXH64_update(state, param.data(), param.size());
    }

    std::uint64_t hash = XXH64_digest(state);
    XXH64_freeState(state);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

std::string make_query_key(std::string_view prefix, std::string_view sql,
                           const std::vector<std::string>& params) {
    std::string key(prefix);
    key += hash_query(sql, params);
    return key;
}

std::string table_prefix(std::string_view table) {
    std::string prefix("table_");
    prefix += table;
    prefix += '_';
    return prefix;
}

std::string artifact_prefix(std::string_view artifact_id) {
    std::string prefix("artifact_");
    prefix += artifact_id;
    prefix += '_';
    return prefix;
}

} // namespace tollgate::cache
