#pragma once
#include "bloom_filter.h"
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Duplicate suppression shared by every discovery stage.
// Lookups go through three layers: a bounded most-recently-used cache of raw
// keys, an optional Bloom filter for fast negatives, and an exact set of
// SHA-256 key digests which is authoritative. All public methods lock an
// internal mutex, so probe workers may call them concurrently.

struct DedupStats {
    size_t total_processed = 0;
    size_t unique_items = 0;
    size_t duplicates_found = 0;
    size_t evictions = 0;

    double duplicate_ratio() const {
        return total_processed == 0 ? 0.0
            : static_cast<double>(duplicates_found) / static_cast<double>(total_processed);
    }
};

class DedupEngine {
public:
    struct Options {
        bool use_bloom_filter;
        size_t bloom_capacity;
        double bloom_false_positive_rate;
        size_t recent_cache_size;
        size_t max_memory_bytes;

        Options()
            : use_bloom_filter(false),
              bloom_capacity(100000),
              bloom_false_positive_rate(0.001),
              recent_cache_size(10000),
              max_memory_bytes(64 * 1024 * 1024)
        {}
    };

    explicit DedupEngine(const Options& opts = Options());

    /**
     * @brief Check whether a key has been remembered
     * @param key Dedup key (e.g. "GET https://host/api/me")
     * @return true if the key was seen before
     */
    bool is_duplicate(const std::string& key);

    /**
     * @brief Record a key in all layers, trimming if over the memory ceiling
     */
    void remember(const std::string& key);

    /**
     * @brief Atomically check and remember a key
     * @return true if the key was new (and is now remembered)
     */
    bool insert_if_new(const std::string& key);

    /**
     * @brief Keep only items whose key this engine has not seen, remembering them
     * @param items Input list, order preserved
     * @param key_fn Maps an item to its dedup key
     * @return Items that were new, first occurrence wins
     */
    template <typename T, typename KeyFn>
    std::vector<T> filter_new(const std::vector<T>& items, KeyFn key_fn) {
        std::vector<T> out;
        out.reserve(items.size());
        for (const auto& item : items) {
            if (insert_if_new(key_fn(item))) {
                out.push_back(item);
            }
        }
        return out;
    }

    /**
     * @brief Reset all structures and statistics (start of a discovery run)
     */
    void clear();

    DedupStats stats() const;

    size_t exact_size() const;
    size_t recent_size() const;

    /**
     * @brief Estimated bytes held by all three layers
     */
    size_t memory_usage_bytes() const;

    const Options& options() const { return opts_; }

    /**
     * @brief Raw SHA-256 digest of a key
     */
    static std::string digest(const std::string& key);

private:
    Options opts_;
    mutable std::mutex mu_;

    // MRU cache: front is most recent
    std::list<std::string> recent_order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> recent_index_;

    std::unique_ptr<BloomFilter> bloom_;

    // Exact digests plus their insertion order for oldest-first eviction
    std::unordered_set<std::string> exact_;
    std::deque<std::string> exact_order_;
    size_t recent_key_bytes_ = 0;

    DedupStats stats_;

    bool is_duplicate_locked(const std::string& key, const std::string& digest);
    void remember_locked(const std::string& key, const std::string& digest);
    void touch_recent_locked(const std::string& key);
    void trim_recent_locked(size_t limit);
    void enforce_ceiling_locked();
    size_t memory_usage_locked() const;
};

/**
 * @brief Order-preserving duplicate removal with no retained state
 * @param items Input list
 * @param key_fn Maps an item to its dedup key
 * @return First occurrence of every key, in input order
 */
template <typename T, typename KeyFn>
std::vector<T> dedupe(const std::vector<T>& items, KeyFn key_fn) {
    std::unordered_set<std::string> seen;
    std::vector<T> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        if (seen.insert(key_fn(item)).second) {
            out.push_back(item);
        }
    }
    return out;
}

/**
 * @brief dedupe() comparing keys case-insensitively
 */
std::vector<std::string> dedupe_case_insensitive(const std::vector<std::string>& items);
