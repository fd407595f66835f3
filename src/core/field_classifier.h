#pragma once
#include <schema/login_capture.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Login form detection and field role classification.
// Every control is run through an ordered list of named rules; the first
// rule that matches decides the role. Rules can be inspected one by one,
// which keeps the heuristics auditable.

using FieldAttributes = std::map<std::string, std::string>;

struct FieldRule {
    std::string name;
    FieldRole role;
    std::function<bool(const FieldAttributes&)> matches;
};

struct LoginForm {
    std::string action;
    std::string method = "POST";
    bool dynamic = false;                 // located by selector probing in the live DOM
    std::vector<CandidateField> fields;   // every classified control, document order
    std::optional<CandidateField> identifier;
    std::optional<CandidateField> password;
    std::optional<CandidateField> submit;
    std::vector<CandidateField> csrf;
    std::map<std::string, std::string> csrf_tokens;   // field/meta name -> value

    bool complete() const { return identifier.has_value() && password.has_value(); }
};

class FieldClassifier {
public:
    /**
     * @brief Create a classifier with the default rule set
     */
    FieldClassifier();

    /**
     * @brief Classify one control by its attributes
     * @param attrs Element attributes; "tag" holds the lower-case tag name
     * @param matched_rule Receives the name of the deciding rule, if non-null
     * @return Role of the first matching rule, OTHER if none matched
     */
    FieldRole classify(const FieldAttributes& attrs, std::string* matched_rule = nullptr) const;

    const std::vector<FieldRule>& rules() const { return rules_; }

    /**
     * @brief Classify every <form> in a document
     * @param html Page markup
     * @param page_url URL the markup came from (resolves form actions)
     * @return One entry per <form>, complete or not, in document order
     */
    std::vector<LoginForm> find_forms(const std::string& html, const std::string& page_url) const;

    /**
     * @brief Find the first form carrying both an identifier and a password field
     * @return The login form, or nullopt when classification fails
     */
    std::optional<LoginForm> classify_page(const std::string& html, const std::string& page_url) const;

    /**
     * @brief Whether the markup contains any <form> element
     */
    static bool has_form_markup(const std::string& html);

    /**
     * @brief CSRF values published in <meta> tags (csrf-token, _token, ...)
     */
    static std::map<std::string, std::string> meta_csrf_tokens(const std::string& html);

    /**
     * @brief Stable CSS selector for an element: #id, tag[name=..], tag[type=..], tag
     */
    static std::string selector_for(const FieldAttributes& attrs);

    static const std::vector<std::string>& email_keywords();
    static const std::vector<std::string>& username_keywords();
    static const std::vector<std::string>& csrf_keywords();

    /// CSS selectors tried in order when no <form> can be classified.
    static const std::vector<std::string>& dynamic_email_selectors();
    static const std::vector<std::string>& dynamic_password_selectors();
    static const std::vector<std::string>& dynamic_submit_selectors();

private:
    std::vector<FieldRule> rules_;
};
