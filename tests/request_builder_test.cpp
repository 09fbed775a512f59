#include <catch2/catch_test_macros.hpp>

#include "wcpp/client/endpoint.hpp"
#include "wcpp/client/request_builder.hpp"

#include <chrono>

using namespace wcpp;
using namespace std::chrono_literals;

namespace {

struct CreateItem : Endpoint<Json> {
    std::string name;

    HttpMethod method() const override { return HttpMethod::Post; }
    std::string path() const override { return build_path({"items"}); }
    std::vector<QueryItem> query() const override { return {{"dry_run", "true"}}; }
    HeaderMap headers() const override { return {{"accept", "application/vnd.items+json"}}; }
    std::optional<Json> body() const override { return Json{{"name", name}}; }
    std::optional<std::chrono::milliseconds> timeout() const override { return 2s; }
};

struct Login : Endpoint<std::monostate> {
    HttpMethod method() const override { return HttpMethod::Post; }
    std::string path() const override { return "/login"; }
    std::optional<Json> body() const override { return Json{{"user", "ada"}}; }
    std::shared_ptr<const IBodyEncoder> encoder() const override {
        return std::make_shared<FormBodyEncoder>();
    }
};

}  // namespace

TEST_CASE("request_parts reads the endpoint", "[client][request]") {
    CreateItem endpoint;
    endpoint.name = "widget";
    const auto parts = request_parts(endpoint);

    REQUIRE(parts.method == HttpMethod::Post);
    REQUIRE(parts.path == "/items");
    REQUIRE(parts.query.size() == 1);
    REQUIRE(parts.body == Json{{"name", "widget"}});
    REQUIRE(parts.timeout == std::optional<std::chrono::milliseconds>{2s});
}

TEST_CASE("build_request resolves against the base URL", "[client][request]") {
    CreateItem endpoint;
    endpoint.name = "widget";
    const auto config = ClientConfig{}.with_base_url("https://api.example.com/v1").with_bearer_token("t");

    auto request = build_request(request_parts(endpoint), config);

    REQUIRE(request.has_value());
    REQUIRE(request->method == HttpMethod::Post);
    REQUIRE(request->url == "https://api.example.com/v1/items?dry_run=true");
    REQUIRE(request->timeout == 2s);
    REQUIRE(request->body == std::optional<std::string>{R"({"name":"widget"})"});
}

TEST_CASE("build_request merges headers with endpoint priority", "[client][request]") {
    CreateItem endpoint;
    const auto config = ClientConfig{}.with_base_url("https://api.example.com").with_bearer_token("t");

    auto request = build_request(request_parts(endpoint), config);

    REQUIRE(request.has_value());
    REQUIRE(request->header("Accept") == std::optional<std::string>{"application/vnd.items+json"});
    REQUIRE(request->header("Authorization") == std::optional<std::string>{"Bearer t"});
    REQUIRE(request->header("Content-Type") == std::optional<std::string>{"application/json"});
}

TEST_CASE("build_request uses the endpoint's encoder", "[client][request]") {
    const auto config = ClientConfig{}.with_base_url("https://auth.example.com");
    auto request = build_request(request_parts(Login{}), config);

    REQUIRE(request.has_value());
    REQUIRE(request->body == std::optional<std::string>{"user=ada"});
    REQUIRE(request->header("Content-Type") == std::optional<std::string>{"application/x-www-form-urlencoded"});
    REQUIRE(request->timeout == config.request_timeout);
}

TEST_CASE("build_request without a base URL needs an absolute path", "[client][request]") {
    RequestParts parts;
    parts.path = "https://files.example.com/report.csv";

    auto request = build_request(parts, ClientConfig{});
    REQUIRE(request.has_value());
    REQUIRE(request->url == "https://files.example.com/report.csv");

    parts.path = "/relative";
    REQUIRE(build_request(parts, ClientConfig{}).has_value() == false);
}

TEST_CASE("build_request reports encoder failures", "[client][request]") {
    RequestParts parts;
    parts.path = "/form";
    parts.body = Json::array({1});
    parts.encoder = std::make_shared<FormBodyEncoder>();

    auto request = build_request(parts, ClientConfig{}.with_base_url("https://api.example.com"));
    REQUIRE(request.has_value() == false);
}
