/**
 * @file test_request_scorer.cpp
 * @brief Unit tests for login call selection
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/request_scorer.h"
#include "helpers/fake_browser.h"

using test_helpers::request_event;

static CapturedRequest make_request(const std::string& method, const std::string& url,
                                    const std::string& body = "", double ts = 0.0, size_t seq = 0) {
    CapturedRequest r;
    r.id = std::to_string(seq);
    r.method = method;
    r.url = url;
    if (!body.empty()) r.body = body;
    r.timestamp = ts;
    r.sequence = seq;
    return r;
}

TEST_CASE("Candidate filter", "[scorer]") {
    RequestScorer scorer;
    REQUIRE(scorer.is_candidate(make_request("POST", "https://shop.test/api/login")));
    REQUIRE(scorer.is_candidate(make_request("PUT", "https://shop.test/api/x", "a=b")));
    REQUIRE(scorer.is_candidate(make_request("POST", "https://shop.test/oauth/token")));
    REQUIRE_FALSE(scorer.is_candidate(make_request("GET", "https://shop.test/login")));
    REQUIRE_FALSE(scorer.is_candidate(make_request("POST", "https://shop.test/api/ping")));
    REQUIRE_FALSE(scorer.is_candidate(make_request("DELETE", "https://shop.test/session", "x")));
}

TEST_CASE("Score breakdown", "[scorer]") {
    RequestScorer scorer;
    CapturedRequest req = make_request("POST", "https://shop.test/api/auth/login",
                                       R"({"email":"test@example.com","password":"password123"})");
    req.headers["Content-Type"] = "application/json;charset=UTF-8";

    auto sc = scorer.score(req);
    REQUIRE(sc.score == 10 + 8 + 3 + 5 + 10);
    REQUIRE(sc.reasons == std::vector<std::string>{
        "auth-segment +10", "login-keyword +8", "json-content-type +3",
        "has-body +5", "credential-field +10"
    });

    SECTION("auth must be a whole path segment") {
        auto other = scorer.score(make_request("POST", "https://shop.test/api/author/42"));
        REQUIRE(other.score == 0);
        REQUIRE(other.reasons.empty());
    }

    SECTION("username fields") {
        auto form = scorer.score(make_request("POST", "https://shop.test/signin", "username=bob&passwd=x"));
        REQUIRE(form.score == 8 + 5 + 10 + 8);
    }
}

TEST_CASE("Login call selected among unrelated traffic", "[scorer]") {
    CaptureLog log = NetworkCapture::parse({
        request_event("1", "GET", "https://shop.test/login", 1.0),
        request_event("2", "GET", "https://shop.test/static/app.js", 1.1),
        request_event("3", "GET", "https://cdn.test/fonts/a.woff2", 1.2),
        request_event("4", "POST", "https://metrics.test/collect", 1.3, "ev=pageview"),
        request_event("5", "GET", "https://shop.test/api/config", 1.4),
        request_event("6", "POST", "https://shop.test/api/cart", 1.5, R"({"item":1})",
                      {{"Content-Type", "application/json"}}),
        request_event("7", "OPTIONS", "https://shop.test/api/auth/login", 2.0),
        request_event("8", "POST", "https://shop.test/api/auth/login", 2.1,
                      R"({"email":"test@example.com","password":"password123"})",
                      {{"Content-Type", "application/json"}}),
        request_event("9", "GET", "https://shop.test/api/me", 2.5),
        request_event("10", "POST", "https://ads.test/beacon", 2.6, "id=9")
    });
    REQUIRE(log.requests.size() == 10);

    RequestScorer scorer;
    auto ranked = scorer.rank(log);
    REQUIRE(ranked.size() == 4);

    auto selected = scorer.select(log);
    REQUIRE(selected.has_value());
    REQUIRE(selected->request.id == "8");
    REQUIRE(selected->request.method == "POST");
    REQUIRE(selected->score == 36);
    REQUIRE(ranked[1].request.id == "6");
}

TEST_CASE("Ties go to the earlier request", "[scorer]") {
    CaptureLog log;
    // Sequence order disagrees with timestamps on purpose
    log.requests.push_back(make_request("POST", "https://shop.test/api/login", "email=a&password=b", 2.0, 0));
    log.requests.push_back(make_request("POST", "https://shop.test/api/login", "email=a&password=b", 1.0, 1));
    log.requests.push_back(make_request("POST", "https://shop.test/api/login", "email=a&password=b", 1.0, 2));

    RequestScorer scorer;
    auto selected = scorer.select(log);
    REQUIRE(selected.has_value());
    REQUIRE(selected->request.sequence == 1);

    auto ranked = scorer.rank(log);
    REQUIRE(ranked[1].request.sequence == 2);
    REQUIRE(ranked[2].request.sequence == 0);
}

TEST_CASE("No login call", "[scorer]") {
    RequestScorer scorer;

    SECTION("No candidates") {
        CaptureLog log = NetworkCapture::parse({
            request_event("1", "GET", "https://shop.test/", 1.0),
            request_event("2", "GET", "https://shop.test/api/me", 1.1)
        });
        REQUIRE_FALSE(scorer.select(log).has_value());
    }

    SECTION("Empty capture") {
        REQUIRE_FALSE(scorer.select(CaptureLog()).has_value());
        REQUIRE(scorer.rank(CaptureLog()).empty());
    }

    SECTION("Candidates that score zero") {
        RequestScorer strict({{"never", 5, [](const CapturedRequest&) { return false; }}});
        CaptureLog log;
        log.requests.push_back(make_request("POST", "https://shop.test/api/login"));
        REQUIRE(strict.rank(log).size() == 1);
        REQUIRE_FALSE(strict.select(log).has_value());
    }
}

TEST_CASE("Rules are named and weighted", "[scorer]") {
    auto rules = RequestScorer::default_rules();
    REQUIRE(rules.size() == 9);
    REQUIRE(rules.front().name == "auth-segment");
    REQUIRE(rules.front().weight == 10);
    REQUIRE(RequestScorer().rules().size() == 9);
}
