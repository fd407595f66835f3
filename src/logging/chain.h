#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Audit trail for discovery runs.
// Append-only JSONL where every entry carries the hash of the one before it,
// so edits, reordering or deleted lines show up on verification.

namespace events {
constexpr const char* kRunStart           = "run_start";
constexpr const char* kLoginPageLocated   = "login_page_located";
constexpr const char* kLoginFormClassified = "login_form_classified";
constexpr const char* kLoginCallSelected  = "login_call_selected";
constexpr const char* kLoginCallMissing   = "login_call_missing";
constexpr const char* kEndpointConfirmed  = "endpoint_confirmed";
constexpr const char* kRunCancelled       = "run_cancelled";
constexpr const char* kRunFailed          = "run_failed";
constexpr const char* kRunComplete        = "run_complete";
}

struct LogEntry {
    uint64_t sequence = 0;
    std::string event_type;
    std::string run_id;
    std::string target;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

class ChainLogger {
public:
    /**
     * @brief Open (or continue) a chained log file
     * @param log_path JSONL file, created if missing
     * @param run_id Identifier stamped on every entry of this run
     * @param target Site the run is aimed at
     */
    ChainLogger(const std::string& log_path, const std::string& run_id, const std::string& target = "");

    /**
     * @brief Append one event, chained to the previous entry
     * @param event_type One of logging::events
     * @param payload Event details
     * @return true if the entry reached the file
     *
     * Safe to call from probe worker threads.
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    bool is_open() const { return log_stream_.is_open(); }

    std::string last_hash() const;

    const std::string& run_id() const { return run_id_; }

    /**
     * @brief Check every hash and link in a log file
     * @param log_path File to check
     * @param error Receives a description of the first problem, if non-null
     * @return true if the chain is intact (an empty log is intact)
     */
    static bool verify(const std::string& log_path, std::string* error = nullptr);

    /**
     * @brief Read all entries
     * @param log_path File to read
     * @param malformed Receives the number of lines that were not valid entries
     */
    static std::vector<LogEntry> load(const std::string& log_path, size_t* malformed = nullptr);

    /**
     * @brief Random identifier for a run ("run-" + 16 hex chars)
     */
    static std::string new_run_id();

private:
    std::string log_path_;
    std::string run_id_;
    std::string target_;
    std::string last_hash_;
    uint64_t next_sequence_ = 0;
    std::ofstream log_stream_;
    mutable std::mutex mu_;

    static std::string compute_hash(const LogEntry& entry);
    static std::string get_timestamp();
};

} // namespace logging
