/**
 * @file field_classifier.cpp
 * @brief Login form detection using gumbo
 */

#include "field_classifier.h"
#include "http_client.h"
#include <gumbo.h>
#include <algorithm>
#include <cctype>

/// Convert string copy to lowercase using lambda on each character.
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::string attr_or(const FieldAttributes& attrs, const std::string& key, const std::string& fallback = "") {
    auto it = attrs.find(key);
    return it == attrs.end() ? fallback : it->second;
}

/// Lower-cased name + id + placeholder, the text keyword rules look at.
static std::string identity_text(const FieldAttributes& attrs) {
    return to_lower(attr_or(attrs, "name") + " " + attr_or(attrs, "id") + " " + attr_or(attrs, "placeholder"));
}

static bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

static bool is_textual_input(const FieldAttributes& attrs) {
    if (attr_or(attrs, "tag") != "input") return false;
    std::string type = to_lower(attr_or(attrs, "type", "text"));
    return type == "text" || type == "email";
}

const std::vector<std::string>& FieldClassifier::email_keywords() {
    static const std::vector<std::string> kw = {
        "email", "e-mail", "mail", "correo", "courriel"
    };
    return kw;
}

const std::vector<std::string>& FieldClassifier::username_keywords() {
    static const std::vector<std::string> kw = {
        "user", "username", "login", "account", "userid", "usuario",
        "utente", "benutzer", "identifiant"
    };
    return kw;
}

const std::vector<std::string>& FieldClassifier::csrf_keywords() {
    static const std::vector<std::string> kw = {
        "csrf", "xsrf", "token", "authenticity", "nonce"
    };
    return kw;
}

const std::vector<std::string>& FieldClassifier::dynamic_email_selectors() {
    static const std::vector<std::string> sel = {
        "input[type='email']",
        "input[name*='email' i]",
        "input[id*='email' i]",
        "input[placeholder*='email' i]",
        "input[name*='user' i]",
        "input[id*='user' i]",
        "input[name*='login' i]",
        "input[id*='login' i]"
    };
    return sel;
}

const std::vector<std::string>& FieldClassifier::dynamic_password_selectors() {
    static const std::vector<std::string> sel = {
        "input[type='password']"
    };
    return sel;
}

const std::vector<std::string>& FieldClassifier::dynamic_submit_selectors() {
    static const std::vector<std::string> sel = {
        "button[type='submit']",
        "input[type='submit']",
        "button"
    };
    return sel;
}

FieldClassifier::FieldClassifier() {
    rules_.push_back({"password-type", FieldRole::PASSWORD, [](const FieldAttributes& a) {
        return attr_or(a, "tag") == "input" && to_lower(attr_or(a, "type")) == "password";
    }});
    rules_.push_back({"hidden-csrf-name", FieldRole::CSRF, [](const FieldAttributes& a) {
        return attr_or(a, "tag") == "input" && to_lower(attr_or(a, "type")) == "hidden" &&
               contains_any(to_lower(attr_or(a, "name")), csrf_keywords());
    }});
    rules_.push_back({"email-keyword", FieldRole::EMAIL, [](const FieldAttributes& a) {
        return is_textual_input(a) && contains_any(identity_text(a), email_keywords());
    }});
    rules_.push_back({"username-keyword", FieldRole::USERNAME, [](const FieldAttributes& a) {
        return is_textual_input(a) && contains_any(identity_text(a), username_keywords());
    }});
    rules_.push_back({"explicit-submit", FieldRole::SUBMIT, [](const FieldAttributes& a) {
        std::string tag = attr_or(a, "tag");
        return (tag == "input" || tag == "button") && to_lower(attr_or(a, "type")) == "submit";
    }});
}

FieldRole FieldClassifier::classify(const FieldAttributes& attrs, std::string* matched_rule) const {
    for (const auto& rule : rules_) {
        if (rule.matches(attrs)) {
            if (matched_rule) *matched_rule = rule.name;
            return rule.role;
        }
    }
    if (matched_rule) matched_rule->clear();
    return FieldRole::OTHER;
}

/// Attribute value as a single-quoted CSS string.
static std::string css_string(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\a "; break;
            case '\r': out += "\\d "; break;
            case '\f': out += "\\c "; break;
            default: out += c;
        }
    }
    return out + "'";
}

std::string FieldClassifier::selector_for(const FieldAttributes& attrs) {
    std::string tag = attr_or(attrs, "tag", "input");
    std::string id = attr_or(attrs, "id");
    if (!id.empty()) {
        bool plain = !std::isdigit(static_cast<unsigned char>(id[0])) &&
            std::all_of(id.begin(), id.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '-' || c == '_';
            });
        return plain ? "#" + id : tag + "[id=" + css_string(id) + "]";
    }
    std::string name = attr_or(attrs, "name");
    if (!name.empty()) return tag + "[name=" + css_string(name) + "]";
    std::string type = attr_or(attrs, "type");
    if (!type.empty()) return tag + "[type=" + css_string(type) + "]";
    return tag;
}

/// Copy element attributes into a map, adding the tag name.
static FieldAttributes element_attributes(GumboNode* node) {
    FieldAttributes attrs;
    attrs["tag"] = gumbo_normalized_tagname(node->v.element.tag);
    const GumboVector* list = &node->v.element.attributes;
    for (unsigned int i = 0; i < list->length; i++) {
        auto* a = static_cast<GumboAttribute*>(list->data[i]);
        attrs[to_lower(a->name)] = a->value ? a->value : "";
    }
    if (attrs["tag"] == "input" && attrs.find("type") == attrs.end()) {
        attrs["type"] = "text";
    }
    return attrs;
}

static bool is_visible(const FieldAttributes& attrs) {
    if (attrs.count("hidden")) return false;
    if (to_lower(attr_or(attrs, "aria-hidden")) == "true") return false;
    std::string style = to_lower(attr_or(attrs, "style"));
    style.erase(std::remove(style.begin(), style.end(), ' '), style.end());
    return style.find("display:none") == std::string::npos &&
           style.find("visibility:hidden") == std::string::npos;
}

/// Collect element nodes with the given tags below node, in document order.
static void collect_elements(GumboNode* node, const std::vector<GumboTag>& tags, std::vector<GumboNode*>& out) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) return;
    if (std::find(tags.begin(), tags.end(), node->v.element.tag) != tags.end()) {
        out.push_back(node);
    }
    GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; i++) {
        collect_elements(static_cast<GumboNode*>(children->data[i]), tags, out);
    }
}

std::vector<LoginForm> FieldClassifier::find_forms(const std::string& html, const std::string& page_url) const {
    std::vector<LoginForm> forms;
    GumboOutput* output = gumbo_parse(html.c_str());
    if (!output) return forms;

    std::vector<GumboNode*> form_nodes;
    collect_elements(output->root, {GUMBO_TAG_FORM}, form_nodes);

    for (GumboNode* form_node : form_nodes) {
        LoginForm form;
        FieldAttributes form_attrs = element_attributes(form_node);
        form.action = HttpClient::resolve_url(page_url, attr_or(form_attrs, "action"));
        std::string method = attr_or(form_attrs, "method", "POST");
        std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c){ return std::toupper(c); });
        form.method = method.empty() ? "POST" : method;

        std::vector<GumboNode*> controls;
        collect_elements(form_node,
            {GUMBO_TAG_INPUT, GUMBO_TAG_BUTTON, GUMBO_TAG_TEXTAREA, GUMBO_TAG_SELECT}, controls);

        std::optional<CandidateField> first_button;
        for (GumboNode* n : controls) {
            FieldAttributes attrs = element_attributes(n);
            CandidateField field;
            field.role = classify(attrs);
            field.selector = selector_for(attrs);
            field.attributes = attrs;

            switch (field.role) {
                case FieldRole::EMAIL:
                case FieldRole::USERNAME:
                    if (!form.identifier) form.identifier = field;
                    break;
                case FieldRole::PASSWORD:
                    if (!form.password) form.password = field;
                    break;
                case FieldRole::SUBMIT:
                    if (!form.submit) form.submit = field;
                    break;
                case FieldRole::CSRF:
                    form.csrf.push_back(field);
                    form.csrf_tokens[attr_or(attrs, "name")] = attr_or(attrs, "value");
                    break;
                case FieldRole::OTHER: {
                    std::string tag = attr_or(attrs, "tag");
                    std::string type = to_lower(attr_or(attrs, "type"));
                    bool button_like = tag == "button" || (tag == "input" && type == "button");
                    if (button_like && !first_button && is_visible(attrs)) {
                        first_button = field;
                    }
                    break;
                }
            }
            form.fields.push_back(std::move(field));
        }

        if (!form.submit && first_button) {
            first_button->role = FieldRole::SUBMIT;
            form.submit = first_button;
        }
        forms.push_back(std::move(form));
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);

    if (!forms.empty()) {
        auto meta = meta_csrf_tokens(html);
        for (auto& f : forms) {
            for (const auto& [name, value] : meta) {
                f.csrf_tokens.emplace(name, value);
            }
        }
    }
    return forms;
}

std::optional<LoginForm> FieldClassifier::classify_page(const std::string& html, const std::string& page_url) const {
    for (auto& form : find_forms(html, page_url)) {
        if (form.complete()) return form;
    }
    return std::nullopt;
}

bool FieldClassifier::has_form_markup(const std::string& html) {
    GumboOutput* output = gumbo_parse(html.c_str());
    if (!output) return false;
    std::vector<GumboNode*> form_nodes;
    collect_elements(output->root, {GUMBO_TAG_FORM}, form_nodes);
    bool found = !form_nodes.empty();
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return found;
}

std::map<std::string, std::string> FieldClassifier::meta_csrf_tokens(const std::string& html) {
    std::map<std::string, std::string> tokens;
    GumboOutput* output = gumbo_parse(html.c_str());
    if (!output) return tokens;

    std::vector<GumboNode*> metas;
    collect_elements(output->root, {GUMBO_TAG_META}, metas);
    for (GumboNode* n : metas) {
        FieldAttributes attrs = element_attributes(n);
        std::string name = to_lower(attr_or(attrs, "name"));
        if (name == "csrf-token" || name == "_token" || name == "csrf_token" || name == "xsrf-token") {
            tokens[attr_or(attrs, "name")] = attr_or(attrs, "content");
        }
    }
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return tokens;
}
