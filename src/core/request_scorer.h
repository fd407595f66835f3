#pragma once
#include "network_capture.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Picks the real authentication call out of the captured traffic.
// Only POST/PUT requests that mention an auth keyword in the URL or carry a
// body are considered. Each candidate is scored by an ordered list of named,
// weighted rules; the highest total wins and ties go to the earlier request.

struct ScoringRule {
    std::string name;
    int weight;
    std::function<bool(const CapturedRequest&)> matches;
};

struct ScoredCandidate {
    CapturedRequest request;
    int score = 0;
    std::vector<std::string> reasons;   // "<rule> +<weight>" in rule order
};

class RequestScorer {
public:
    /**
     * @brief Create a scorer with the baseline rule set
     */
    RequestScorer();

    /**
     * @brief Create a scorer with a custom rule set
     */
    explicit RequestScorer(std::vector<ScoringRule> rules);

    /**
     * @brief Whether a request is eligible for scoring at all
     */
    bool is_candidate(const CapturedRequest& req) const;

    /**
     * @brief Apply every rule to one request
     */
    ScoredCandidate score(const CapturedRequest& req) const;

    /**
     * @brief Score every candidate in a capture
     * @return Candidates ordered best first (score desc, timestamp asc, sequence asc)
     */
    std::vector<ScoredCandidate> rank(const CaptureLog& log) const;

    /**
     * @brief Select the login call
     * @return Best candidate, or nullopt if none scored above zero
     */
    std::optional<ScoredCandidate> select(const CaptureLog& log) const;

    const std::vector<ScoringRule>& rules() const { return rules_; }

    static std::vector<ScoringRule> default_rules();

    /// URL keywords that make a POST/PUT a candidate.
    static const std::vector<std::string>& auth_keywords();

private:
    std::vector<ScoringRule> rules_;
};
