#include <catch2/catch.hpp>

#include "embedding_cache.hpp"

using namespace ragcore;

TEST_CASE("Embedding cache evicts the least recently used entry", "[cache]")
{
    EmbeddingCache cache(2);
    cache.put("m", "a", {1.0f});
    cache.put("m", "b", {2.0f});
    REQUIRE(cache.get("m", "a") == std::vector<float>{1.0f});  // "b" is now least recent

    cache.put("m", "c", {3.0f});
    REQUIRE(cache.size() == 2);
    REQUIRE_FALSE(cache.get("m", "b").has_value());
    REQUIRE(cache.get("m", "a") == std::vector<float>{1.0f});
    REQUIRE(cache.get("m", "c") == std::vector<float>{3.0f});
}

TEST_CASE("Embedding cache keys on model as well as text", "[cache]")
{
    EmbeddingCache cache(4);
    cache.put("all-minilm", "hello", {0.5f, -0.5f});

    REQUIRE_FALSE(cache.get("nomic-embed-text", "hello").has_value());
    auto hit = cache.get("all-minilm", "hello");
    REQUIRE(hit.has_value());
    REQUIRE(*hit == std::vector<float>{0.5f, -0.5f});
    REQUIRE(cache.hits() == 1);
    REQUIRE(cache.misses() == 1);
}

TEST_CASE("Embedding cache overwrites existing keys", "[cache]")
{
    EmbeddingCache cache(2);
    cache.put("m", "a", {1.0f});
    cache.put("m", "a", {10.0f});
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("m", "a") == std::vector<float>{10.0f});
}

TEST_CASE("Embedding cache with zero capacity stores nothing", "[cache]")
{
    EmbeddingCache cache(0);
    cache.put("m", "a", {1.0f});
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get("m", "a").has_value());
}

TEST_CASE("Embedding cache clear empties it", "[cache]")
{
    EmbeddingCache cache(4);
    cache.put("m", "a", {1.0f});
    cache.put("m", "b", {2.0f});
    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get("m", "a").has_value());
}
