/**
 * @file discovery_pipeline.cpp
 * @brief Locator -> browser capture -> scorer -> prober orchestration
 */

#include "discovery_pipeline.h"
#include "token_extractor.h"
#include "logging/chain.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

using nlohmann::json;

// WebDriver key code for Enter
static const char* kEnterKey = "\xEE\x80\x87";

const char* form_source_name(FormSource s) {
    switch (s) {
        case FormSource::NONE:     return "none";
        case FormSource::STATIC:   return "static";
        case FormSource::RENDERED: return "rendered";
        case FormSource::DYNAMIC:  return "dynamic";
    }
    return "none";
}

/// Write an audit event if a log is attached.
static void record(logging::ChainLogger* audit, const char* event, const json& payload) {
    if (audit && !audit->append(event, payload)) {
        std::cerr << "Warning: audit log write failed (" << event << ")\n";
    }
}

static bool is_cancelled(const CancellationToken* cancel) {
    return cancel && cancel->cancelled();
}

DiscoveryPipeline::DiscoveryPipeline(const HttpClient& client, BrowserDriver& browser, const Options& opts)
    : client_(client), browser_(browser), opts_(opts) {}

std::optional<LoginForm> DiscoveryPipeline::classify_static(const std::string& url, bool* has_form) const {
    if (has_form) *has_form = false;

    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.timeout_seconds = opts_.page_timeout_seconds;
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    HttpResponse resp;
    if (!client_.perform(req, resp) || resp.body.empty()) {
        return std::nullopt;
    }

    if (has_form) *has_form = FieldClassifier::has_form_markup(resp.body);
    const std::string page_url = resp.effective_url.empty() ? url : resp.effective_url;
    return classifier_.classify_page(resp.body, page_url);
}

std::optional<LoginForm> DiscoveryPipeline::classify_rendered(BrowserDriver& browser, const std::string& page_url) const {
    json html = browser.execute_script("return document.documentElement.outerHTML;");
    if (!html.is_string()) return std::nullopt;
    return classifier_.classify_page(html.get<std::string>(), page_url);
}

std::optional<LoginForm> DiscoveryPipeline::detect_dynamic(BrowserDriver& browser) const {
    auto first_present = [&browser](const std::vector<std::string>& selectors) -> std::optional<std::string> {
        for (const auto& sel : selectors) {
            // json::dump yields a valid JS string literal
            json present = browser.execute_script(
                "return !!document.querySelector(" + dump_json(json(sel), -1) + ");");
            if (present.is_boolean() && present.get<bool>()) return sel;
        }
        return std::nullopt;
    };

    auto password = first_present(FieldClassifier::dynamic_password_selectors());
    if (!password) return std::nullopt;
    auto identifier = first_present(FieldClassifier::dynamic_email_selectors());
    if (!identifier) return std::nullopt;

    LoginForm form;
    form.dynamic = true;
    form.identifier = CandidateField{FieldRole::EMAIL, *identifier, {}};
    form.password = CandidateField{FieldRole::PASSWORD, *password, {}};
    form.fields = {*form.identifier, *form.password};
    if (auto submit = first_present(FieldClassifier::dynamic_submit_selectors())) {
        form.submit = CandidateField{FieldRole::SUBMIT, *submit, {}};
        form.fields.push_back(*form.submit);
    }
    return form;
}

bool DiscoveryPipeline::submit_form(BrowserDriver& browser, const LoginForm& form) const {
    if (!form.identifier || !form.password) return false;
    if (!browser.fill_field(form.identifier->selector, opts_.email)) return false;
    if (!browser.fill_field(form.password->selector, opts_.password)) return false;

    if (form.submit && browser.click(form.submit->selector)) {
        return true;
    }
    // No usable submit control: press Enter in the password field
    return browser.fill_field(form.password->selector, kEnterKey);
}

void DiscoveryPipeline::settle(const CancellationToken* cancel) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts_.settle_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (is_cancelled(cancel)) return;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
    }
}

std::optional<LoginCapture> DiscoveryPipeline::select_login_call(CaptureLog& log, BrowserDriver* browser) const {
    auto selected = scorer_.select(log);
    if (!selected) return std::nullopt;

    auto resp = log.responses.find(selected->request.id);
    if (browser && resp != log.responses.end() && resp->second.body_sample.empty()) {
        if (auto body = browser->fetch_response_body(selected->request.id)) {
            resp->second.body_sample = body->substr(0, NetworkCapture::kBodySampleLimit);
        }
    }

    LoginCapture capture = TokenExtractor::capture(*selected, log);
    capture.cookies = dedupe(capture.cookies, [](const Cookie& c) {
        return c.name + "\n" + c.domain + "\n" + c.path;
    });
    return capture;
}

DiscoveryResult DiscoveryPipeline::run(const std::string& target,
                                       const CancellationToken* cancel,
                                       logging::ChainLogger* audit) {
    dedup_.clear();
    return run(target, dedup_, cancel, audit);
}

DiscoveryResult DiscoveryPipeline::run(const std::string& target, DedupEngine& dedup,
                                       const CancellationToken* cancel,
                                       logging::ChainLogger* audit) {
    DiscoveryResult result;
    result.target = target;
    record(audit, logging::events::kRunStart, {{"target", target}});

    auto finish_cancelled = [&]() {
        result.cancelled = true;
        record(audit, logging::events::kRunCancelled, {
            {"login_captured", result.login_captured},
            {"endpoints_found", result.endpoints.size()}
        });
        result.endpoints_found = result.endpoints.size();
        return result;
    };

    // Stage 1: login page
    LoginLocator locator(client_, opts_.locator, cancel);
    result.login_page = locator.locate(target);
    record(audit, logging::events::kLoginPageLocated, {
        {"url", result.login_page.url},
        {"strategy", locator_strategy_name(result.login_page.strategy)},
        {"found", result.login_page.found}
    });
    if (is_cancelled(cancel)) return finish_cancelled();

    const std::string& login_url = result.login_page.url;
    bool has_form = false;
    result.form = classify_static(login_url, &has_form);
    if (result.form) result.form_source = FormSource::STATIC;

    std::vector<std::string> observed_urls;

    // Stage 2: scripted login under an exclusive browser lease
    try {
        BrowserLease lease(browser_);

        result.capture_enabled = lease->enable_network_capture();
        lease->navigate(login_url);
        if (is_cancelled(cancel)) return finish_cancelled();

        if (!result.form && !has_form) {
            result.form = classify_rendered(lease.driver(), login_url);
            if (result.form) result.form_source = FormSource::RENDERED;
        }
        if (!result.form) {
            result.form = detect_dynamic(lease.driver());
            if (result.form) result.form_source = FormSource::DYNAMIC;
        }
        if (result.form) {
            record(audit, logging::events::kLoginFormClassified, {
                {"source", form_source_name(result.form_source)},
                {"identifier", result.form->identifier->selector},
                {"password", result.form->password->selector},
                {"submit", result.form->submit ? result.form->submit->selector : ""}
            });
        }
        if (is_cancelled(cancel)) return finish_cancelled();

        if (result.form) {
            result.login_submitted = submit_form(lease.driver(), *result.form);
            settle(cancel);
            if (is_cancelled(cancel)) return finish_cancelled();
        }

        CaptureLog log = NetworkCapture::parse(lease->get_capture_log());
        result.captured_requests = log.requests.size();
        result.capture = select_login_call(log, &lease.driver());
        result.login_captured = result.capture.has_value();

        for (const auto& req : log.requests) {
            observed_urls.push_back(req.url);
        }
        lease.release();
    } catch (const BrowserError& e) {
        record(audit, logging::events::kRunFailed, {{"error", e.what()}});
        throw;
    }

    if (result.capture) {
        const auto& sel = result.capture->selected_request;
        record(audit, logging::events::kLoginCallSelected, {
            {"url", sel.url},
            {"method", sel.method},
            {"score", result.capture->score},
            {"reasons", result.capture->reasons},
            {"token_keys", [&]() {
                json keys = json::array();
                for (const auto& kv : result.capture->tokens) keys.push_back(kv.first);
                return keys;
            }()}
        });

        // The login call itself is an authentication endpoint
        Endpoint auth;
        auth.url = sel.url;
        auth.method = sel.method;
        auth.type = EndpointType::AUTH;
        auth.tested = true;
        auth.source = "login";
        if (result.capture->response) {
            const auto& r = *result.capture->response;
            auth.status_code = r.status;
            auth.accessible = r.status >= 200 && r.status < 300;
            auth.content_type = NetworkCapture::header_value(r.headers, "content-type");
            auth.body_bytes = r.body_sample.size();
            for (const auto& [k, v] : r.headers) auth.headers.emplace_back(k, v);
        }
        if (dedup.insert_if_new(auth.dedup_key())) {
            record(audit, logging::events::kEndpointConfirmed, endpoint_to_json(auth));
            result.endpoints.push_back(auth);
        }
    } else {
        record(audit, logging::events::kLoginCallMissing, {
            {"captured_requests", result.captured_requests},
            {"form_found", result.form.has_value()},
            {"submitted", result.login_submitted}
        });
    }

    if (is_cancelled(cancel)) return finish_cancelled();

    // Stage 3: authenticated probing
    EndpointProber prober(client_, opts_.prober);
    auto candidates = prober.build_candidates(target, dedupe(observed_urls, [](const std::string& u) { return u; }));
    const std::map<std::string, std::string> no_tokens;
    const auto& tokens = result.capture ? result.capture->tokens : no_tokens;

    auto probed = prober.probe(candidates, tokens, dedup, cancel, [audit](const Endpoint& ep) {
        record(audit, logging::events::kEndpointConfirmed, endpoint_to_json(ep));
    });
    result.probes_attempted = probed.attempted;
    for (auto& ep : probed.endpoints) {
        result.endpoints.push_back(std::move(ep));
    }
    if (probed.cancelled || is_cancelled(cancel)) return finish_cancelled();

    result.endpoints_found = result.endpoints.size();
    record(audit, logging::events::kRunComplete, {
        {"login_captured", result.login_captured},
        {"endpoints_found", result.endpoints_found},
        {"probes_attempted", result.probes_attempted}
    });
    return result;
}

std::string dump_json(const json& doc, int indent) {
    return doc.dump(indent, ' ', false, json::error_handler_t::replace);
}

json endpoint_to_json(const Endpoint& ep) {
    json j;
    j["url"] = ep.url;
    j["method"] = ep.method;
    j["type"] = endpoint_type_name(ep.type);
    j["tested"] = ep.tested;
    j["accessible"] = ep.accessible ? json(*ep.accessible) : json();
    j["status_code"] = ep.status_code ? json(*ep.status_code) : json();
    j["content_type"] = ep.content_type;
    j["body_bytes"] = ep.body_bytes;
    j["source"] = ep.source;
    j["headers"] = json::array();
    for (const auto& [name, value] : ep.headers) {
        j["headers"].push_back({name, value});
    }
    return j;
}

json login_capture_to_json(const LoginCapture& capture) {
    const auto& r = capture.selected_request;
    json j;
    j["request"] = {
        {"id", r.id},
        {"url", r.url},
        {"method", r.method},
        {"headers", r.headers},
        {"body", r.body ? json(*r.body) : json()},
        {"timestamp", r.timestamp}
    };
    j["score"] = capture.score;
    j["reasons"] = capture.reasons;
    j["tokens"] = capture.tokens;
    if (capture.response) {
        j["response"] = {
            {"status", capture.response->status},
            {"mime_type", capture.response->mime_type},
            {"set_cookies", capture.response->set_cookies.size()}
        };
    }
    j["cookies"] = json::array();
    for (const auto& c : capture.cookies) {
        j["cookies"].push_back({
            {"name", c.name},
            {"value", c.value},
            {"domain", c.domain},
            {"path", c.path},
            {"secure", c.secure},
            {"http_only", c.http_only}
        });
    }
    return j;
}

json login_form_to_json(const LoginForm& form) {
    auto field = [](const std::optional<CandidateField>& f) {
        return f ? json{{"role", field_role_name(f->role)}, {"selector", f->selector}} : json();
    };
    json j;
    j["action"] = form.action;
    j["method"] = form.method;
    j["dynamic"] = form.dynamic;
    j["identifier"] = field(form.identifier);
    j["password"] = field(form.password);
    j["submit"] = field(form.submit);
    j["csrf_tokens"] = form.csrf_tokens;
    return j;
}

json DiscoveryResult::to_json() const {
    json j;
    j["target"] = target;
    j["login_page"] = {
        {"url", login_page.url},
        {"strategy", locator_strategy_name(login_page.strategy)},
        {"found", login_page.found},
        {"evidence", login_page.evidence}
    };
    j["form_source"] = form_source_name(form_source);
    j["form"] = form ? login_form_to_json(*form) : json();
    j["capture_enabled"] = capture_enabled;
    j["login_submitted"] = login_submitted;
    j["captured_requests"] = captured_requests;
    j["login_captured"] = login_captured;
    j["login_capture"] = capture ? login_capture_to_json(*capture) : json();
    j["endpoints_found"] = endpoints_found;
    j["probes_attempted"] = probes_attempted;
    j["cancelled"] = cancelled;
    j["endpoints"] = json::array();
    for (const auto& ep : endpoints) {
        j["endpoints"].push_back(endpoint_to_json(ep));
    }
    return j;
}
