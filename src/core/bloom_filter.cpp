// Bloom filter with double hashing over a SHA-256 digest

#include "bloom_filter.h"
#include <algorithm>
#include <cmath>

size_t BloomFilter::optimal_bit_count(size_t n, double p) {
    if (p <= 0.0 || p >= 1.0) p = 0.001;
    if (n == 0) n = 1;
    const double ln2 = std::log(2.0);
    double m = -(static_cast<double>(n) * std::log(p)) / (ln2 * ln2);
    return std::max<size_t>(64, static_cast<size_t>(m));
}

size_t BloomFilter::optimal_hash_count(size_t m, size_t n) {
    if (n == 0) return 1;
    double k = (static_cast<double>(m) / static_cast<double>(n)) * std::log(2.0);
    return std::max<size_t>(1, static_cast<size_t>(k));
}

BloomFilter::BloomFilter(size_t expected_items, double false_positive_rate)
    : bit_count_(optimal_bit_count(expected_items, false_positive_rate)),
      hash_count_(optimal_hash_count(bit_count_, std::max<size_t>(1, expected_items))),
      words_((bit_count_ + 63) / 64, 0)
{}

/// Read 8 bytes of the digest starting at offset as a little-endian integer.
static uint64_t read_u64(const std::string& digest, size_t offset) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8 && offset + i < digest.size(); i++) {
        v |= static_cast<uint64_t>(static_cast<unsigned char>(digest[offset + i])) << (8 * i);
    }
    return v;
}

size_t BloomFilter::position(const std::string& digest, size_t i) const {
    uint64_t h1 = read_u64(digest, 0);
    uint64_t h2 = read_u64(digest, 8) | 1;  // odd step so probes do not collapse
    return static_cast<size_t>((h1 + i * h2) % bit_count_);
}

void BloomFilter::add(const std::string& digest) {
    for (size_t i = 0; i < hash_count_; i++) {
        size_t pos = position(digest, i);
        words_[pos / 64] |= (uint64_t{1} << (pos % 64));
    }
    item_count_++;
}

bool BloomFilter::contains(const std::string& digest) const {
    for (size_t i = 0; i < hash_count_; i++) {
        size_t pos = position(digest, i);
        if (!(words_[pos / 64] & (uint64_t{1} << (pos % 64)))) {
            return false;
        }
    }
    return true;
}

void BloomFilter::clear() {
    std::fill(words_.begin(), words_.end(), 0);
    item_count_ = 0;
}

double BloomFilter::fill_ratio() const {
    size_t set_bits = 0;
    for (uint64_t w : words_) {
        set_bits += static_cast<size_t>(__builtin_popcountll(w));
    }
    return static_cast<double>(set_bits) / static_cast<double>(bit_count_);
}
