#include <catch2/catch_test_macros.hpp>

#include "wcpp/client/client_config.hpp"

#include <chrono>
#include <set>

using namespace wcpp;
using namespace std::chrono_literals;

TEST_CASE("ClientConfig defaults", "[config]") {
    ClientConfig config;

    REQUIRE(config.base_url.empty());
    REQUIRE(config.request_timeout == 30s);
    REQUIRE(config.resource_timeout == 60s);
    REQUIRE(get_header(config.default_headers, "Accept") == std::optional<std::string>{"application/json"});
    REQUIRE(config.retry_policy == RetryPolicy{});
    REQUIRE(config.request_id_generator == nullptr);
    REQUIRE(config.stream_failure_body_limit == kDefaultFailureBodyLimit);
}

TEST_CASE("ClientConfig builders chain", "[config]") {
    auto config = ClientConfig{}
        .with_base_url("https://api.example.com")
        .with_bearer_token("secret")
        .with_header("accept", "text/plain")
        .with_request_timeout(5s)
        .with_resource_timeout(10min)
        .with_retry_policy(RetryPolicy::none());

    REQUIRE(config.base_url == "https://api.example.com");
    REQUIRE(get_header(config.default_headers, "Authorization") == std::optional<std::string>{"Bearer secret"});
    REQUIRE(get_header(config.default_headers, "Accept") == std::optional<std::string>{"text/plain"});
    REQUIRE(config.default_headers.size() == 2);
    REQUIRE(config.request_timeout == 5s);
    REQUIRE(config.resource_timeout == 10min);
    REQUIRE(config.retry_policy.max_attempts() == 1);
}

TEST_CASE("uuid_request_id produces distinct v4 identifiers", "[config]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const auto id = uuid_request_id();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[14] == '4');
        REQUIRE(seen.insert(id).second);
    }
}

TEST_CASE("ClientConfig from_json", "[config][json]") {
    SECTION("Every supported key") {
        const auto document = Json::parse(R"({
            "base_url": "https://api.example.com/v1",
            "request_timeout_ms": 1500,
            "resource_timeout_ms": 120000,
            "headers": {"User-Agent": "wcpp-test"},
            "retry": {"max_retries": 5, "base_delay_ms": 200, "max_delay_ms": 4000, "exponential": false},
            "request_id_header": "X-Correlation-ID",
            "stream_failure_body_limit": 2048
        })");

        auto config = ClientConfig::from_json(document);
        REQUIRE(config.has_value());
        REQUIRE(config->base_url == "https://api.example.com/v1");
        REQUIRE(config->request_timeout == 1500ms);
        REQUIRE(config->resource_timeout == 120s);
        REQUIRE(get_header(config->default_headers, "user-agent") == std::optional<std::string>{"wcpp-test"});
        REQUIRE(get_header(config->default_headers, "Accept").has_value());
        REQUIRE(config->retry_policy == RetryPolicy(5, 200ms, 4000ms, false));
        REQUIRE(config->request_id_header == "X-Correlation-ID");
        REQUIRE(config->stream_failure_body_limit == 2048);
    }

    SECTION("Missing keys keep defaults") {
        auto config = ClientConfig::from_json(Json::object());
        REQUIRE(config.has_value());
        REQUIRE(config->request_timeout == 30s);
        REQUIRE(config->retry_policy == RetryPolicy{});
    }

    SECTION("Wrong types are reported by key") {
        auto config = ClientConfig::from_json(Json{{"request_timeout_ms", "fast"}});
        REQUIRE(config.has_value() == false);
        REQUIRE(config.error().find("request_timeout_ms") != std::string::npos);
    }

    SECTION("Non-string header values are rejected") {
        auto config = ClientConfig::from_json(Json{{"headers", {{"X-Count", 3}}}});
        REQUIRE(config.has_value() == false);
        REQUIRE(config.error().find("X-Count") != std::string::npos);
    }

    SECTION("Retry must be an object") {
        auto config = ClientConfig::from_json(Json{{"retry", 3}});
        REQUIRE(config.has_value() == false);
    }

    SECTION("Document must be an object") {
        REQUIRE(ClientConfig::from_json(Json::array()).has_value() == false);
    }
}
