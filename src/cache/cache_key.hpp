/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Key - XXHash-based query hashing for cache keys
 *
 * Cache keys are plain strings so related entries can share a prefix:
 * - table_<name>_<hash>     results read from a table, dropped after ingestion
 * - artifact_<id>_<hash>    results derived from an artifact, dropped on prune
 */

#ifndef TOLLGATE_CACHE_CACHE_KEY_HPP
#define TOLLGATE_CACHE_CACHE_KEY_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::cache {

/**
 * Hash query text and its bound parameters into 16 lowercase hex chars.
 * Parameters are separated so ("a", {"bc"}) and ("ab", {"c"}) differ.
 */
std::string hash_query(std::string_view sql, const std::vector<std::string>& params = {});

/**
 * Build a cache key for a query, optionally scoped by a prefix
 *
 * @param prefix Scope prefix (e.g. table_prefix("sales")), may be empty
 * @param sql Query text
 * @param params Bound query parameters
 * @return prefix + hash
 */
std::string make_query_key(std::string_view prefix, std::string_view sql,
                           const std::vector<std::string>& params = {});

/**
 * Prefix shared by all results read from a table
 */
std::string table_prefix(std::string_view table);

/**
 * Prefix shared by all results keyed to an artifact
 */
std::string artifact_prefix(std::string_view artifact_id);

} // namespace tollgate::cache

#endif // TOLLGATE_CACHE_CACHE_KEY_HPP
