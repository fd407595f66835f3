/**
 * @file test_login_locator.cpp
 * @brief Unit tests for LoginLocator strategies against a scripted client
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "core/login_locator.h"
#include "helpers/fake_http_client.h"

using test_helpers::FakeHttpClient;
using test_helpers::FakeRoute;

static const std::string kSite = "https://shop.test";

TEST_CASE("Common path probe", "[locator]") {
    FakeHttpClient client;

    SECTION("First path answering 200 wins") {
        client.on("HEAD", kSite + "/signin", FakeRoute::status_only(200));
        client.on("HEAD", kSite + "/user/login", FakeRoute::status_only(200));

        LoginLocator locator(client);
        auto result = locator.locate(kSite + "/");
        REQUIRE(result.strategy == LocatorStrategy::COMMON_PATH);
        REQUIRE(result.found);
        REQUIRE(result.url == kSite + "/signin");
        REQUIRE(result.evidence == "/signin");
        REQUIRE(client.count(kSite + "/login") == 1);
        REQUIRE(client.count(kSite + "/user/login") == 0);
    }

    SECTION("HEAD refused, GET retried") {
        client.on("HEAD", kSite + "/login", FakeRoute::status_only(405));
        client.on("GET", kSite + "/login", FakeRoute::html("<form></form>"));

        LoginLocator locator(client);
        auto result = locator.try_common_paths(kSite);
        REQUIRE(result.has_value());
        REQUIRE(result->url == kSite + "/login");
        REQUIRE(client.calls_with_method("GET").size() == 1);
    }

    SECTION("Redirect to a non-login page does not count") {
        client.on("*", kSite + "/login", FakeRoute::redirect_to(kSite + "/"));
        client.on("*", kSite + "/auth", FakeRoute::redirect_to(kSite + "/auth/login"));

        LoginLocator locator(client);
        auto result = locator.try_common_paths(kSite);
        REQUIRE(result.has_value());
        REQUIRE(result->evidence == "/auth");
        REQUIRE(result->url == kSite + "/auth/login");
    }

    SECTION("Probes use the configured timeout") {
        LoginLocator::Options opts;
        opts.probe_timeout_seconds = 2;
        opts.login_paths = {"/login"};
        LoginLocator locator(client, opts);
        REQUIRE_FALSE(locator.try_common_paths(kSite).has_value());
        auto calls = client.calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].timeout_seconds == 2);
        REQUIRE(calls[0].follow_redirects.value_or(false));
    }
}

TEST_CASE("Homepage link scan", "[locator]") {
    FakeHttpClient client;

    SECTION("Anchor by link text") {
        client.on("GET", kSite, FakeRoute::html(R"(
            <nav><a href="/help">Help</a><a href="/account/enter">Sign in</a></nav>)"));
        LoginLocator locator(client);
        auto result = locator.locate(kSite);
        REQUIRE(result.strategy == LocatorStrategy::HOMEPAGE_LINK);
        REQUIRE(result.url == kSite + "/account/enter");
        REQUIRE(result.evidence == "/account/enter");
    }

    SECTION("Anchor wins over an earlier onclick handler") {
        client.on("GET", kSite, FakeRoute::html(R"(
            <button onclick="window.location='/signin'">Account</button>
            <a href="/members/login">Log in</a>)"));
        LoginLocator locator(client);
        auto result = locator.try_homepage(kSite);
        REQUIRE(result.has_value());
        REQUIRE(result->strategy == LocatorStrategy::HOMEPAGE_LINK);
        REQUIRE(result->url == kSite + "/members/login");
    }

    SECTION("Onclick handler when no anchor matches") {
        client.on("GET", kSite, FakeRoute::html(R"(
            <a href="#top">Top</a>
            <div onclick="location.href='/auth/login'">Account</div>)"));
        LoginLocator locator(client);
        auto result = locator.try_homepage(kSite);
        REQUIRE(result.has_value());
        REQUIRE(result->strategy == LocatorStrategy::ONCLICK);
        REQUIRE(result->url == kSite + "/auth/login");
    }

    SECTION("Error page is not scanned") {
        FakeRoute r = FakeRoute::html("<a href='/login'>Login</a>");
        r.status = 500;
        client.on("GET", kSite, r);
        LoginLocator locator(client);
        REQUIRE_FALSE(locator.try_homepage(kSite).has_value());
    }
}

TEST_CASE("Protected page redirect", "[locator]") {
    FakeHttpClient client;
    client.on("GET", kSite + "/dashboard", FakeRoute::redirect_to(kSite + "/users/sign_in", 2));

    LoginLocator locator(client);
    auto result = locator.locate(kSite);
    REQUIRE(result.strategy == LocatorStrategy::REDIRECT);
    REQUIRE(result.url == kSite + "/users/sign_in");
    REQUIRE(result.evidence == kSite + "/dashboard -> " + kSite + "/users/sign_in");
}

TEST_CASE("Fallback to the input URL", "[locator]") {
    FakeHttpClient client;

    SECTION("Nothing matches") {
        LoginLocator locator(client);
        auto result = locator.locate(kSite + "/shop");
        REQUIRE(result.strategy == LocatorStrategy::FALLBACK);
        REQUIRE_FALSE(result.found);
        REQUIRE(result.url == kSite + "/shop");
    }

    SECTION("Site unreachable") {
        client.set_fallback(FakeRoute::unreachable());
        LoginLocator locator(client);
        auto result = locator.locate(kSite);
        REQUIRE(result.strategy == LocatorStrategy::FALLBACK);
        REQUIRE(result.url == kSite);
    }

    SECTION("Cancelled before any probe") {
        CancellationToken cancel;
        cancel.cancel();
        LoginLocator locator(client, LoginLocator::Options(), &cancel);
        auto result = locator.locate(kSite);
        REQUIRE(result.strategy == LocatorStrategy::FALLBACK);
        REQUIRE(client.calls().empty());
    }
}

TEST_CASE("Login keyword matching", "[locator]") {
    REQUIRE(LoginLocator::mentions_login("https://x.test/Account/LogIn"));
    REQUIRE(LoginLocator::mentions_login("Sign in"));
    REQUIRE(LoginLocator::mentions_login("/users/sign_in"));
    REQUIRE(LoginLocator::mentions_login("Anmelden"));
    REQUIRE(LoginLocator::mentions_login("/session/new"));
    REQUIRE_FALSE(LoginLocator::mentions_login("/blog/latest-news"));
    REQUIRE_FALSE(LoginLocator::mentions_login("Help"));

    REQUIRE(LoginLocator::default_login_paths().size() == 39);
    REQUIRE(LoginLocator::default_login_paths().front() == "/login");
    REQUIRE(std::string(locator_strategy_name(LocatorStrategy::ONCLICK)) == "onclick");
}
