// Three-layer duplicate tracking

#include "dedup_engine.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

// Rough per-entry footprints used for the memory ceiling
static constexpr size_t kExactEntryBytes = 112;   // digest in set + deque, node overhead
static constexpr size_t kRecentEntryOverhead = 96;

DedupEngine::DedupEngine(const Options& opts) : opts_(opts) {
    if (!opts_.use_bloom_filter) return;

    // The filter never shrinks, so it may take at most half of the ceiling
    size_t budget = opts_.max_memory_bytes / 2;
    size_t capacity = std::max<size_t>(1, opts_.bloom_capacity);
    while (capacity > 1 &&
           (BloomFilter::optimal_bit_count(capacity, opts_.bloom_false_positive_rate) + 63) / 64 * 8 > budget) {
        capacity /= 2;
    }
    if ((BloomFilter::optimal_bit_count(capacity, opts_.bloom_false_positive_rate) + 63) / 64 * 8 > budget) {
        opts_.use_bloom_filter = false;
        return;
    }
    opts_.bloom_capacity = capacity;
    bloom_ = std::make_unique<BloomFilter>(capacity, opts_.bloom_false_positive_rate);
}

std::string DedupEngine::digest(const std::string& key) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, key.data(), key.size());
    EVP_DigestFinal_ex(ctx, md, &md_len);
    EVP_MD_CTX_free(ctx);
    return std::string(reinterpret_cast<const char*>(md), md_len);
}

bool DedupEngine::is_duplicate(const std::string& key) {
    std::string d = digest(key);
    std::lock_guard<std::mutex> lock(mu_);
    return is_duplicate_locked(key, d);
}

void DedupEngine::remember(const std::string& key) {
    std::string d = digest(key);
    std::lock_guard<std::mutex> lock(mu_);
    remember_locked(key, d);
}

bool DedupEngine::insert_if_new(const std::string& key) {
    std::string d = digest(key);
    std::lock_guard<std::mutex> lock(mu_);
    stats_.total_processed++;
    if (is_duplicate_locked(key, d)) {
        stats_.duplicates_found++;
        return false;
    }
    remember_locked(key, d);
    stats_.unique_items++;
    return true;
}

bool DedupEngine::is_duplicate_locked(const std::string& key, const std::string& digest) {
    // Hot repeats
    if (recent_index_.count(key)) {
        touch_recent_locked(key);
        return true;
    }

    // Definite negative
    if (bloom_ && !bloom_->contains(digest)) {
        return false;
    }

    return exact_.count(digest) > 0;
}

void DedupEngine::remember_locked(const std::string& key, const std::string& digest) {
    touch_recent_locked(key);
    trim_recent_locked(opts_.recent_cache_size);

    if (bloom_) bloom_->add(digest);

    if (exact_.insert(digest).second) {
        exact_order_.push_back(digest);
    }

    enforce_ceiling_locked();
}

void DedupEngine::touch_recent_locked(const std::string& key) {
    auto it = recent_index_.find(key);
    if (it != recent_index_.end()) {
        recent_order_.splice(recent_order_.begin(), recent_order_, it->second);
        return;
    }
    recent_order_.push_front(key);
    recent_index_[key] = recent_order_.begin();
    recent_key_bytes_ += key.size();
}

void DedupEngine::trim_recent_locked(size_t limit) {
    while (recent_order_.size() > limit) {
        const std::string& oldest = recent_order_.back();
        recent_key_bytes_ -= oldest.size();
        recent_index_.erase(oldest);
        recent_order_.pop_back();
    }
}

size_t DedupEngine::memory_usage_locked() const {
    size_t bytes = exact_.size() * kExactEntryBytes;
    bytes += recent_order_.size() * kRecentEntryOverhead + 2 * recent_key_bytes_;
    if (bloom_) bytes += bloom_->memory_bytes();
    return bytes;
}

void DedupEngine::enforce_ceiling_locked() {
    // Drop the oldest exact digests a tenth at a time, halving the recent cache
    // alongside. Once the exact set is empty the recent cache goes oldest first.
    while (memory_usage_locked() > opts_.max_memory_bytes) {
        if (!exact_order_.empty()) {
            size_t remove_count = std::max<size_t>(1, exact_order_.size() / 10);
            for (size_t i = 0; i < remove_count && !exact_order_.empty(); i++) {
                exact_.erase(exact_order_.front());
                exact_order_.pop_front();
            }
            trim_recent_locked(std::min(recent_order_.size(), opts_.recent_cache_size) / 2);
            stats_.evictions += remove_count;
        } else if (!recent_order_.empty()) {
            size_t keep = recent_order_.size() - std::max<size_t>(1, recent_order_.size() / 10);
            stats_.evictions += recent_order_.size() - keep;
            trim_recent_locked(keep);
        } else {
            break;
        }
    }
}

void DedupEngine::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    recent_order_.clear();
    recent_index_.clear();
    recent_key_bytes_ = 0;
    exact_.clear();
    exact_order_.clear();
    if (bloom_) bloom_->clear();
    stats_ = DedupStats();
}

DedupStats DedupEngine::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
}

size_t DedupEngine::exact_size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return exact_.size();
}

size_t DedupEngine::recent_size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return recent_order_.size();
}

size_t DedupEngine::memory_usage_bytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return memory_usage_locked();
}

std::vector<std::string> dedupe_case_insensitive(const std::vector<std::string>& items) {
    return dedupe(items, [](const std::string& s) {
        std::string lower = s;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
        return lower;
    });
}
