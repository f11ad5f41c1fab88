#include <catch2/catch_test_macros.hpp>
#include "cache/cache_key.hpp"

using namespace tollgate::cache;

// ── hash_query ───────────────────────────────────────────────────

TEST_CASE("hash_query: 16 lowercase hex characters", "[cache_key]") {
    auto hash = hash_query("SELECT * FROM sales");
    REQUIRE(hash.size() == 16);
    for (char c : hash) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        REQUIRE(hex);
    }
}

TEST_CASE("hash_query: deterministic for equal input", "[cache_key]") {
    REQUIRE(hash_query("SELECT 1", {"a", "b"}) == hash_query("SELECT 1", {"a", "b"}));
}

TEST_CASE("hash_query: parameters change the hash", "[cache_key]") {
    REQUIRE(hash_query("SELECT ?", {"1"}) != hash_query("SELECT ?", {"2"}));
    REQUIRE(hash_query("SELECT ?") != hash_query("SELECT ?", {""}));
}

TEST_CASE("hash_query: parameter boundaries are significant", "[cache_key]") {
    REQUIRE(hash_query("a", {"bc"}) != hash_query("ab", {"c"}));
    REQUIRE(hash_query("q", {"ab", "c"}) != hash_query("q", {"a", "bc"}));
}

// ── Prefixes ─────────────────────────────────────────────────────

TEST_CASE("table_prefix and artifact_prefix: scoped, underscore terminated", "[cache_key]") {
    REQUIRE(table_prefix("sales") == "table_sales_");
    REQUIRE(artifact_prefix("acme/job1/out.parquet") == "artifact_acme/job1/out.parquet_");
}

TEST_CASE("make_query_key: prefix followed by hash", "[cache_key]") {
    auto key = make_query_key(table_prefix("sales"), "SELECT * FROM sales", {"2024"});
    REQUIRE(key.starts_with("table_sales_"));
    REQUIRE(key.size() == std::string("table_sales_").size() + 16);
    REQUIRE(key.ends_with(hash_query("SELECT * FROM sales", {"2024"})));
}

TEST_CASE("make_query_key: empty prefix is just the hash", "[cache_key]") {
    REQUIRE(make_query_key("", "SELECT 1") == hash_query("SELECT 1"));
}
