#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Probabilistic set membership over 256-bit key digests.
// contains() never reports false for an added digest; it may report true
// for one that was never added.

class BloomFilter {
public:
    /**
     * @brief Size the filter for an expected number of keys
     * @param expected_items Number of keys the filter should hold
     * @param false_positive_rate Target false positive probability (0 < p < 1)
     */
    BloomFilter(size_t expected_items, double false_positive_rate);

    /**
     * @brief Set the bits for a digest
     * @param digest Raw SHA-256 digest of the key (32 bytes)
     */
    void add(const std::string& digest);

    /**
     * @brief Check whether all bits of a digest are set
     * @param digest Raw SHA-256 digest of the key
     * @return false if the key was definitely never added
     */
    bool contains(const std::string& digest) const;

    void clear();

    size_t bit_count() const { return bit_count_; }
    size_t hash_count() const { return hash_count_; }
    size_t item_count() const { return item_count_; }
    size_t memory_bytes() const { return words_.size() * sizeof(uint64_t); }

    /// Fraction of bits currently set.
    double fill_ratio() const;

    static size_t optimal_bit_count(size_t n, double p);
    static size_t optimal_hash_count(size_t m, size_t n);

private:
    size_t bit_count_;
    size_t hash_count_;
    size_t item_count_ = 0;
    std::vector<uint64_t> words_;

    size_t position(const std::string& digest, size_t i) const;
};
