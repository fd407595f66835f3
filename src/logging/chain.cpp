/**
 * @file chain.cpp
 * @brief Hash-chained JSONL audit log
 */

#include "chain.h"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logging {

using json = nlohmann::json;

static const char* kGenesis = "sha256:genesis";

json LogEntry::to_json() const {
    json j;
    j["seq"] = sequence;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    if (!target.empty()) {
        j["target"] = target;
    }
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.sequence = j.value("seq", static_cast<uint64_t>(0));
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.target = j.value("target", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id, const std::string& target)
    : log_path_(log_path), run_id_(run_id), target_(target) {

    // Continue an existing chain
    if (std::ifstream test(log_path); test.good()) {
        auto entries = load(log_path);
        if (!entries.empty()) {
            last_hash_ = entries.back().entry_hash;
            next_sequence_ = entries.back().sequence + 1;
        }
    }

    log_stream_.open(log_path_, std::ios::app);
}

std::string ChainLogger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ChainLogger::compute_hash(const LogEntry& entry) {
    // Object keys dump sorted, so the payload text is canonical
    std::ostringstream canonical;
    canonical << entry.prev_hash << '\n'
              << entry.sequence << '\n'
              << entry.timestamp << '\n'
              << entry.event_type << '\n'
              << entry.run_id << '\n'
              << entry.target << '\n'
              << entry.payload.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string data = canonical.str();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::ostringstream hex;
    hex << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_hash_;
}

bool ChainLogger::append(const std::string& event_type, const json& payload) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!log_stream_.is_open()) {
        return false;
    }

    LogEntry entry;
    entry.sequence = next_sequence_;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.target = target_;
    entry.timestamp = get_timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    log_stream_ << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    log_stream_.flush();
    if (!log_stream_.good()) {
        return false;
    }

    last_hash_ = entry.entry_hash;
    next_sequence_++;
    return true;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path, size_t* malformed) {
    std::vector<LogEntry> entries;
    size_t bad = 0;
    std::ifstream in(log_path);
    if (in.is_open()) {
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            json j = json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                bad++;
                continue;
            }
            entries.push_back(LogEntry::from_json(j));
        }
    }
    if (malformed) *malformed = bad;
    return entries;
}

bool ChainLogger::verify(const std::string& log_path, std::string* error) {
    auto fail = [error](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };

    size_t malformed = 0;
    auto entries = load(log_path, &malformed);
    if (malformed > 0) {
        return fail(std::to_string(malformed) + " malformed line(s)");
    }
    if (entries.empty()) {
        return true;
    }
    if (entries[0].prev_hash != kGenesis) {
        return fail("first entry does not start the chain (prev_hash " + entries[0].prev_hash + ")");
    }

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        if (compute_hash(entry) != entry.entry_hash) {
            return fail("hash mismatch at entry " + std::to_string(i) + " (" + entry.event_type + ")");
        }
        if (i > 0) {
            if (entry.prev_hash != entries[i - 1].entry_hash) {
                return fail("chain break at entry " + std::to_string(i));
            }
            if (entry.sequence != entries[i - 1].sequence + 1) {
                return fail("sequence gap at entry " + std::to_string(i));
            }
        }
    }
    return true;
}

std::string ChainLogger::new_run_id() {
    unsigned char bytes[8];
    std::ostringstream oss;
    oss << "run-";
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // Fall back to the clock; uniqueness only matters within one log
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        oss << std::hex << std::setw(16) << std::setfill('0') << static_cast<uint64_t>(ticks);
        return oss.str();
    }
    for (unsigned char b : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

} // namespace logging
