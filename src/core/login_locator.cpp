/**
 * @file login_locator.cpp
 * @brief Multi-strategy login page search
 */

#include "login_locator.h"
#include <gumbo.h>
#include <algorithm>
#include <regex>

/// Convert string copy to lowercase using lambda on each character.
static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

const char* locator_strategy_name(LocatorStrategy s) {
    switch (s) {
        case LocatorStrategy::COMMON_PATH:   return "common_path";
        case LocatorStrategy::HOMEPAGE_LINK: return "homepage_link";
        case LocatorStrategy::ONCLICK:       return "onclick";
        case LocatorStrategy::REDIRECT:      return "redirect";
        case LocatorStrategy::FALLBACK:      return "fallback";
    }
    return "fallback";
}

const std::vector<std::string>& LoginLocator::login_keywords() {
    static const std::vector<std::string> kw = {
        "login", "log-in", "log in", "log_in", "signin", "sign-in", "sign in", "sign_in",
        "logon", "authenticate", "/auth/", "/sso", "session/new",
        "accedi", "anmelden", "connexion", "iniciar", "entrar", "acceso"
    };
    return kw;
}

const std::vector<std::string>& LoginLocator::default_login_paths() {
    static const std::vector<std::string> paths = {
        "/login", "/signin", "/auth", "/authenticate", "/log-in", "/sign-in",
        "/user/login", "/account/login", "/member/login", "/customer/login",
        "/auth/login", "/login.php", "/login.html", "/login.aspx",
        "/signin.php", "/signin.html", "/signin.aspx",
        "/sso/login", "/oauth/login", "/connect/login",
        "/portal/login", "/app/login", "/api/login",
        "/v1/login", "/v2/login", "/v3/login",
        "/en/login", "/it/login", "/de/login", "/fr/login", "/es/login",
        "/users/sign_in", "/users/login", "/session/new",
        "/accounts/login", "/accounts/signin", "/accounts/auth",
        "/authorization/login", "/authorization/signin"
    };
    return paths;
}

const std::vector<std::string>& LoginLocator::default_protected_paths() {
    static const std::vector<std::string> paths = {
        "/dashboard", "/profile", "/account", "/user", "/my-account", "/settings"
    };
    return paths;
}

LoginLocator::Options::Options()
    : probe_timeout_seconds(5),
      page_timeout_seconds(10),
      login_paths(default_login_paths()),
      protected_paths(default_protected_paths())
{}

LoginLocator::LoginLocator(const HttpClient& client, const Options& opts, const CancellationToken* cancel)
    : client_(client), opts_(opts), cancel_(cancel) {}

bool LoginLocator::mentions_login(const std::string& text) {
    std::string lower = to_lower(text);
    for (const auto& kw : login_keywords()) {
        if (lower.find(kw) != std::string::npos) return true;
    }
    return false;
}

std::string LoginLocator::strip_trailing_slash(const std::string& url) {
    std::string out = url;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

LocatorResult LoginLocator::locate(const std::string& url) const {
    using Strategy = std::function<std::optional<LocatorResult>(const std::string&)>;
    const std::vector<Strategy> strategies = {
        [this](const std::string& u) { return try_common_paths(u); },
        [this](const std::string& u) { return try_homepage(u); },
        [this](const std::string& u) { return try_redirects(u); }
    };

    for (const auto& strategy : strategies) {
        if (cancelled()) break;
        if (auto hit = strategy(url)) {
            return *hit;
        }
    }

    LocatorResult fallback;
    fallback.url = url;
    fallback.strategy = LocatorStrategy::FALLBACK;
    fallback.found = false;
    return fallback;
}

std::optional<LocatorResult> LoginLocator::try_common_paths(const std::string& url) const {
    const std::string base = strip_trailing_slash(url);

    for (const auto& path : opts_.login_paths) {
        if (cancelled()) return std::nullopt;

        HttpRequest req;
        req.method = "HEAD";
        req.url = base + path;
        req.timeout_seconds = opts_.probe_timeout_seconds;
        req.follow_redirects = true;
        HttpResponse resp;
        bool ok = client_.perform(req, resp);

        // Some servers refuse HEAD outright
        if (ok && (resp.status == 405 || resp.status == 501)) {
            req.method = "GET";
            resp = HttpResponse();
            ok = client_.perform(req, resp);
        }
        if (!ok || resp.status != 200) continue;

        // A path that bounced elsewhere only counts if it landed on a login URL
        std::string landed = resp.effective_url.empty() ? req.url : resp.effective_url;
        if (resp.redirect_count > 0 && !mentions_login(landed)) continue;

        LocatorResult r;
        r.url = resp.redirect_count > 0 ? landed : req.url;
        r.strategy = LocatorStrategy::COMMON_PATH;
        r.found = true;
        r.evidence = path;
        return r;
    }
    return std::nullopt;
}

/// Concatenate all text below a node.
static void node_text(GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT) return;
    GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; i++) {
        node_text(static_cast<GumboNode*>(children->data[i]), out);
    }
}

std::optional<LocatorResult> LoginLocator::try_homepage(const std::string& url) const {
    if (cancelled()) return std::nullopt;

    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.timeout_seconds = opts_.page_timeout_seconds;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    HttpResponse resp;
    if (!client_.perform(req, resp) || resp.status >= 400 || resp.body.empty()) {
        return std::nullopt;
    }
    const std::string page_url = resp.effective_url.empty() ? url : resp.effective_url;

    GumboOutput* output = gumbo_parse(resp.body.c_str());
    if (!output) return std::nullopt;

    std::optional<LocatorResult> link_hit;
    std::optional<LocatorResult> onclick_hit;
    static const std::regex quoted_login_url(
        R"(['"]([^'"]*(?:login|signin|sign-in|log-in|sign_in)[^'"]*)['"])", std::regex::icase);

    // Document-order walk; anchors win over onclick handlers
    std::vector<GumboNode*> stack = {output->root};
    while (!stack.empty() && !link_hit) {
        GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) continue;

        const GumboVector* attrs = &node->v.element.attributes;
        if (node->v.element.tag == GUMBO_TAG_A) {
            GumboAttribute* href = gumbo_get_attribute(attrs, "href");
            if (href && href->value && href->value[0] != '#') {
                std::string text;
                node_text(node, text);
                if (mentions_login(href->value) || mentions_login(text)) {
                    std::string resolved = HttpClient::resolve_url(page_url, href->value);
                    if (!resolved.empty()) {
                        LocatorResult r;
                        r.url = resolved;
                        r.strategy = LocatorStrategy::HOMEPAGE_LINK;
                        r.found = true;
                        r.evidence = href->value;
                        link_hit = r;
                    }
                }
            }
        }

        if (!onclick_hit) {
            GumboAttribute* onclick = gumbo_get_attribute(attrs, "onclick");
            if (onclick && onclick->value && mentions_login(onclick->value)) {
                std::smatch m;
                std::string handler = onclick->value;
                if (std::regex_search(handler, m, quoted_login_url)) {
                    std::string resolved = HttpClient::resolve_url(page_url, m[1].str());
                    if (!resolved.empty()) {
                        LocatorResult r;
                        r.url = resolved;
                        r.strategy = LocatorStrategy::ONCLICK;
                        r.found = true;
                        r.evidence = handler;
                        onclick_hit = r;
                    }
                }
            }
        }

        // Push children reversed so they pop in document order
        GumboVector* children = &node->v.element.children;
        for (unsigned int i = children->length; i > 0; i--) {
            stack.push_back(static_cast<GumboNode*>(children->data[i - 1]));
        }
    }

    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return link_hit ? link_hit : onclick_hit;
}

std::optional<LocatorResult> LoginLocator::try_redirects(const std::string& url) const {
    const std::string base = strip_trailing_slash(url);

    for (const auto& path : opts_.protected_paths) {
        if (cancelled()) return std::nullopt;

        HttpRequest req;
        req.method = "GET";
        req.url = base + path;
        req.timeout_seconds = opts_.probe_timeout_seconds;
        req.follow_redirects = true;
        HttpResponse resp;
        if (!client_.perform(req, resp)) continue;

        if (resp.redirect_count > 0 && !resp.effective_url.empty() &&
            resp.effective_url != req.url && mentions_login(resp.effective_url)) {
            LocatorResult r;
            r.url = resp.effective_url;
            r.strategy = LocatorStrategy::REDIRECT;
            r.found = true;
            r.evidence = req.url + " -> " + resp.effective_url;
            return r;
        }
    }
    return std::nullopt;
}
