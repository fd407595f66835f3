/**
 * @file test_dedup_engine.cpp
 * @brief Unit tests for DedupEngine, BloomFilter and the stateless dedupe helpers
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/dedup_engine.h"
#include "core/bloom_filter.h"
#include <schema/endpoint.h>
#include <atomic>
#include <thread>

TEST_CASE("Exact duplicate detection", "[dedup]") {
    DedupEngine engine;

    REQUIRE(engine.insert_if_new("GET https://shop.test/api/me"));
    REQUIRE_FALSE(engine.insert_if_new("GET https://shop.test/api/me"));
    REQUIRE(engine.insert_if_new("GET https://shop.test/api/orders"));

    auto stats = engine.stats();
    REQUIRE(stats.total_processed == 3);
    REQUIRE(stats.unique_items == 2);
    REQUIRE(stats.duplicates_found == 1);
    REQUIRE(stats.duplicate_ratio() == Approx(1.0 / 3.0));
}

TEST_CASE("is_duplicate does not remember", "[dedup]") {
    DedupEngine engine;
    REQUIRE_FALSE(engine.is_duplicate("k"));
    REQUIRE_FALSE(engine.is_duplicate("k"));
    engine.remember("k");
    REQUIRE(engine.is_duplicate("k"));
}

TEST_CASE("Keys survive recent cache eviction", "[dedup]") {
    DedupEngine::Options opts;
    opts.recent_cache_size = 4;
    DedupEngine engine(opts);

    for (int i = 0; i < 50; i++) {
        engine.remember("key-" + std::to_string(i));
    }
    REQUIRE(engine.recent_size() == 4);
    REQUIRE(engine.exact_size() == 50);
    // key-0 left the recent cache long ago, but the exact layer still knows it
    REQUIRE(engine.is_duplicate("key-0"));
}

TEST_CASE("Bloom filter layer gives no false negatives", "[dedup]") {
    DedupEngine::Options opts;
    opts.use_bloom_filter = true;
    opts.bloom_capacity = 1000;
    opts.bloom_false_positive_rate = 0.01;
    opts.recent_cache_size = 8;
    DedupEngine engine(opts);

    for (int i = 0; i < 500; i++) {
        engine.remember("https://shop.test/item/" + std::to_string(i));
    }
    for (int i = 0; i < 500; i++) {
        REQUIRE(engine.is_duplicate("https://shop.test/item/" + std::to_string(i)));
    }
    // The exact layer is authoritative, so bloom false positives never leak out
    for (int i = 500; i < 1000; i++) {
        REQUIRE_FALSE(engine.is_duplicate("https://shop.test/item/" + std::to_string(i)));
    }
}

TEST_CASE("Memory ceiling evicts oldest entries", "[dedup]") {
    DedupEngine::Options opts;
    opts.recent_cache_size = 10;
    opts.max_memory_bytes = 20000;
    DedupEngine engine(opts);

    for (int i = 0; i < 1000; i++) {
        engine.insert_if_new("GET https://shop.test/p/" + std::to_string(i));
    }
    REQUIRE(engine.memory_usage_bytes() <= opts.max_memory_bytes);
    REQUIRE(engine.exact_size() < 1000);
    REQUIRE(engine.stats().evictions > 0);
    // Most recent key is still known
    REQUIRE(engine.is_duplicate("GET https://shop.test/p/999"));
}

TEST_CASE("Memory ceiling holds once the exact set is exhausted", "[dedup]") {
    SECTION("Tiny ceiling with the default recent cache") {
        DedupEngine::Options opts;
        opts.max_memory_bytes = 4096;
        DedupEngine engine(opts);

        for (int i = 0; i < 2000; i++) {
            engine.remember("GET https://example.com/api/item/" + std::to_string(i));
            REQUIRE(engine.memory_usage_bytes() <= opts.max_memory_bytes);
        }
        REQUIRE(engine.recent_size() < 2000);
        REQUIRE(engine.is_duplicate("GET https://example.com/api/item/1999"));
    }

    SECTION("Bloom filter is sized down to fit") {
        DedupEngine::Options opts;
        opts.use_bloom_filter = true;
        opts.bloom_capacity = 100000;
        opts.max_memory_bytes = 4096;
        DedupEngine engine(opts);

        REQUIRE(engine.options().bloom_capacity < 100000);
        REQUIRE(engine.memory_usage_bytes() <= opts.max_memory_bytes);
        for (int i = 0; i < 500; i++) {
            engine.insert_if_new("GET https://example.com/api/item/" + std::to_string(i));
        }
        REQUIRE(engine.memory_usage_bytes() <= opts.max_memory_bytes);
    }
}

TEST_CASE("Clear resets state and statistics", "[dedup]") {
    DedupEngine engine;
    engine.insert_if_new("a");
    engine.insert_if_new("a");
    engine.clear();

    REQUIRE(engine.exact_size() == 0);
    REQUIRE(engine.recent_size() == 0);
    REQUIRE(engine.stats().total_processed == 0);
    REQUIRE(engine.insert_if_new("a"));
}

TEST_CASE("filter_new keeps first occurrences across calls", "[dedup]") {
    DedupEngine engine;
    std::vector<std::string> first = {"a", "b", "a", "c"};
    REQUIRE(engine.filter_new(first, [](const std::string& s) { return s; }) ==
            std::vector<std::string>{"a", "b", "c"});

    std::vector<std::string> second = {"c", "d", "b"};
    REQUIRE(engine.filter_new(second, [](const std::string& s) { return s; }) ==
            std::vector<std::string>{"d"});
}

TEST_CASE("insert_if_new admits a key once under contention", "[dedup]") {
    DedupEngine engine;
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; i++) {
                if (engine.insert_if_new("GET https://shop.test/api/" + std::to_string(i))) {
                    admitted++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(admitted.load() == 100);
    REQUIRE(engine.stats().duplicates_found == 700);
}

TEST_CASE("Stateless dedupe preserves order", "[dedup]") {
    std::vector<std::string> urls = {"/a", "/b", "/a", "/c", "/b"};
    REQUIRE(dedupe(urls, [](const std::string& s) { return s; }) ==
            std::vector<std::string>{"/a", "/b", "/c"});

    REQUIRE(dedupe_case_insensitive({"/API/me", "/api/ME", "/api/orders"}) ==
            std::vector<std::string>{"/API/me", "/api/orders"});

    REQUIRE(dedupe(std::vector<std::string>{}, [](const std::string& s) { return s; }).empty());
}

TEST_CASE("Stateless dedupe is idempotent", "[dedup]") {
    auto identity = [](const std::string& s) { return s; };
    std::vector<std::string> urls = {"/me", "/orders", "/me", "/cart", "/orders", "/me", "/wallet"};
    auto once = dedupe(urls, identity);
    REQUIRE(dedupe(once, identity) == once);

    auto folded = dedupe_case_insensitive({"/API/me", "/api/ME", "/Cart", "/cart", "/api/orders"});
    REQUIRE(dedupe_case_insensitive(folded) == folded);

    SECTION("Endpoints keyed by method and URL") {
        auto make = [](const std::string& method, const std::string& url, const std::string& source) {
            Endpoint ep;
            ep.method = method;
            ep.url = url;
            ep.source = source;
            return ep;
        };
        std::vector<Endpoint> found = {
            make("GET", "https://shop.test/api/me", "catalog"),
            make("GET", "https://shop.test/api/me", "observed"),
            make("POST", "https://shop.test/api/me", "observed"),
            make("GET", "https://shop.test/api/orders", "catalog"),
            make("GET", "https://shop.test/api/orders", "catalog")
        };
        auto key = [](const Endpoint& ep) { return ep.dedup_key(); };
        auto unique = dedupe(found, key);

        REQUIRE(unique.size() == 3);
        REQUIRE(unique[0].source == "catalog");
        std::unordered_set<std::string> keys;
        for (const auto& ep : unique) {
            REQUIRE(keys.insert(ep.dedup_key()).second);
        }
        auto again = dedupe(unique, key);
        REQUIRE(again.size() == unique.size());
        for (size_t i = 0; i < again.size(); i++) {
            REQUIRE(again[i].dedup_key() == unique[i].dedup_key());
        }
    }
}

TEST_CASE("BloomFilter sizing and membership", "[dedup][bloom]") {
    size_t m = BloomFilter::optimal_bit_count(1000, 0.01);
    REQUIRE(m > 9000);
    REQUIRE(m < 10000);
    size_t k = BloomFilter::optimal_hash_count(m, 1000);
    REQUIRE(k >= 6);
    REQUIRE(k <= 7);

    BloomFilter bloom(1000, 0.01);
    std::string d = DedupEngine::digest("GET https://shop.test/api/me");
    REQUIRE(d.size() == 32);
    REQUIRE_FALSE(bloom.contains(d));
    bloom.add(d);
    REQUIRE(bloom.contains(d));
    REQUIRE(bloom.item_count() == 1);
    REQUIRE(bloom.fill_ratio() > 0.0);

    bloom.clear();
    REQUIRE_FALSE(bloom.contains(d));
    REQUIRE(bloom.item_count() == 0);
}
