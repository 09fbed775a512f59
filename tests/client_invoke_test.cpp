#include <catch2/catch_test_macros.hpp>

#include "wcpp/client/client.hpp"

#include "mocks/capturing_logger.hpp"
#include "mocks/mock_transport.hpp"
#include "test_support.hpp"

#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wcpp;
using namespace wcpp::testing;
using namespace std::chrono_literals;

namespace {

struct User {
    int id{0};
    std::string name;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(User, id, name)

struct ApiError {
    std::string error;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ApiError, error)

struct GetUser : Endpoint<User, ApiError> {
    int id{42};
    std::string path() const override { return build_path({"users", id}); }
};

struct Ping : Endpoint<std::monostate> {
    std::string path() const override { return "/ping"; }
};

struct PingNoRetry : Ping {
    std::optional<RetryPolicy> retry_policy() const override { return RetryPolicy::none(); }
};

RetryPolicy fast_retries(int retries) {
    return RetryPolicy{}.with_max_retries(retries).with_base_delay(1ms).with_max_delay(2ms);
}

ClientConfig test_config(int retries = 3) {
    return ClientConfig{}
        .with_base_url("https://api.example.com")
        .with_retry_policy(fast_retries(retries));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Success and failure decoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("invoke decodes a successful response", "[client][invoke]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_json(200, R"({"id":42,"name":"Ada"})");
    Client client(test_config(), transport);

    const GetUser endpoint{};
    auto user = run_sync(io, client.invoke(endpoint));

    REQUIRE(user.has_value());
    REQUIRE(user->id == 42);
    REQUIRE(user->name == "Ada");

    const auto request = transport->last_request();
    REQUIRE(request.has_value());
    REQUIRE(request->method == HttpMethod::Get);
    REQUIRE(request->url == "https://api.example.com/users/42");
    REQUIRE(request->header("Accept") == std::optional<std::string>{"application/json"});
}

TEST_CASE("invoke reports a typed server error without retrying 4xx", "[client][invoke]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_json(404, R"({"error":"no such user"})");
    Client client(test_config(), transport);

    const GetUser endpoint{};
    auto user = run_sync(io, client.invoke(endpoint));

    REQUIRE(user.has_value() == false);
    REQUIRE(user.error().code() == ClientErrorCode::ServerError);
    REQUIRE(user.error().status_code() == 404);
    REQUIRE(user.error().failure().has_value());
    REQUIRE(user.error().failure()->error == "no such user");
    REQUIRE(user.error().raw_body() == std::optional<std::string>{R"({"error":"no such user"})"});
    REQUIRE(transport->request_count() == 1);
}

TEST_CASE("invoke keeps the raw body when the failure body does not decode", "[client][invoke]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(400, "<html>bad request</html>");
    Client client(test_config(), transport);

    const GetUser endpoint{};
    auto user = run_sync(io, client.invoke(endpoint));

    REQUIRE(user.has_value() == false);
    REQUIRE(user.error().failure().has_value() == false);
    REQUIRE(user.error().raw_body() == std::optional<std::string>{"<html>bad request</html>"});
}

TEST_CASE("invoke reports undecodable success bodies", "[client][invoke]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_json(200, R"({"id":"forty-two"})");
    Client client(test_config(), transport);

    const GetUser endpoint{};
    auto user = run_sync(io, client.invoke(endpoint));

    REQUIRE(user.has_value() == false);
    REQUIRE(user.error().code() == ClientErrorCode::DecodingError);
    REQUIRE(user.error().raw_body() == std::optional<std::string>{R"({"id":"forty-two"})"});
    REQUIRE(transport->request_count() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Retries
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("invoke retries 5xx until success", "[client][invoke][retry]") {
    ScopedCapture logs(LogLevel::Info);
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(503, "");
    transport->queue_response(502, "");
    transport->queue_json(200, R"({"id":1,"name":"Grace"})");
    Client client(test_config(3), transport);

    const GetUser endpoint{};
    auto user = run_sync(io, client.invoke(endpoint));

    REQUIRE(user.has_value());
    REQUIRE(user->name == "Grace");
    REQUIRE(transport->request_count() == 3);
    REQUIRE(logs.count(LogLevel::Info, "Retrying GET /users/42") == 2);
}

TEST_CASE("invoke gives up after max_retries", "[client][invoke][retry]") {
    ScopedCapture logs(LogLevel::Warn);
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    HttpResponse failing;
    failing.meta.status_code = 500;
    transport->set_fallback(failing);
    Client client(test_config(2), transport);

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint));

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code() == ClientErrorCode::ServerError);
    REQUIRE(result.error().status_code() == 500);
    REQUIRE(transport->request_count() == 3);
    REQUIRE(logs.count(LogLevel::Warn, "GET /ping failed") == 1);
}

TEST_CASE("invoke retries rate limiting", "[client][invoke][retry]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(429, "");
    transport->queue_response(204, "");
    Client client(test_config(1), transport);

    const Ping endpoint{};
    REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());
    REQUIRE(transport->request_count() == 2);
}

TEST_CASE("invoke transport faults follow the fault table", "[client][invoke][retry]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    Client client(test_config(3), transport);
    const Ping endpoint{};

    SECTION("Timeouts are retried") {
        transport->queue_fault(TransportFault::timed_out());
        transport->queue_response(200, "");
        REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());
        REQUIRE(transport->request_count() == 2);
    }

    SECTION("Unclassified faults are retried as network errors") {
        transport->queue_fault(TransportFault::other("weird"));
        transport->queue_response(200, "");
        REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());
        REQUIRE(transport->request_count() == 2);
    }

    SECTION("Offline is final") {
        transport->queue_fault(TransportFault::no_connection());
        auto result = run_sync(io, client.invoke(endpoint));
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().code() == ClientErrorCode::Offline);
        REQUIRE(result.error().is_offline());
        REQUIRE(transport->request_count() == 1);
    }

    SECTION("Transport cancellation is final") {
        transport->queue_fault(TransportFault::cancelled());
        auto result = run_sync(io, client.invoke(endpoint));
        REQUIRE(result.error().code() == ClientErrorCode::Cancelled);
        REQUIRE(transport->request_count() == 1);
    }
}

TEST_CASE("invoke uses the endpoint's retry policy", "[client][invoke][retry]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    HttpResponse failing;
    failing.meta.status_code = 503;
    transport->set_fallback(failing);
    Client client(test_config(5), transport);

    const PingNoRetry endpoint{};
    auto result = run_sync(io, client.invoke(endpoint));

    REQUIRE(result.has_value() == false);
    REQUIRE(transport->request_count() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Interceptors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Interceptors run in registration order", "[client][interceptor]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, "");

    std::vector<std::string> calls;
    auto config = test_config()
        .with_request_interceptor(make_request_interceptor([&](HttpRequest request, const AttemptContext&) {
            calls.push_back("request-1");
            request.with_header("X-Trace", "one");
            return InterceptResult<HttpRequest>{std::move(request)};
        }))
        .with_request_interceptor(make_request_interceptor([&](HttpRequest request, const AttemptContext&) {
            calls.push_back("request-2");
            request.with_header("X-Trace", *request.header("X-Trace") + ",two");
            return InterceptResult<HttpRequest>{std::move(request)};
        }))
        .with_response_interceptor(make_response_interceptor([&](HttpResponse response, const AttemptContext&) {
            calls.push_back("response-1");
            return InterceptResult<HttpResponse>{std::move(response)};
        }))
        .with_response_interceptor(make_response_interceptor([&](HttpResponse response, const AttemptContext&) {
            calls.push_back("response-2");
            return InterceptResult<HttpResponse>{std::move(response)};
        }));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());

    REQUIRE(calls == std::vector<std::string>{"request-1", "request-2", "response-1", "response-2"});
    REQUIRE(transport->last_request()->header("X-Trace") == std::optional<std::string>{"one,two"});
}

TEST_CASE("A response interceptor that always asks for a retry exhausts the attempts", "[client][interceptor]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    HttpResponse ok;
    ok.meta.status_code = 200;
    transport->set_fallback(ok);

    int interceptor_calls = 0;
    auto config = test_config(3).with_response_interceptor(
        make_response_interceptor([&](HttpResponse, const AttemptContext&) -> InterceptResult<HttpResponse> {
            ++interceptor_calls;
            return tl::unexpected(InterceptorFault::retry_requested());
        }));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint));

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().code() == ClientErrorCode::UnexpectedResponse);
    REQUIRE(transport->request_count() == 4);
    REQUIRE(interceptor_calls == 4);
}

TEST_CASE("Attempt context describes each attempt", "[client][interceptor]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(503, "");
    transport->queue_response(200, "");

    std::vector<AttemptContext> seen;
    auto config = test_config(2)
        .with_request_ids([] { return std::string("req-123"); })
        .with_response_interceptor(make_response_interceptor([&](HttpResponse response, const AttemptContext& context) {
            seen.push_back(context);
            return InterceptResult<HttpResponse>{std::move(response)};
        }));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].attempt_number == 0);
    REQUIRE(seen[1].attempt_number == 1);
    REQUIRE(seen[0].path == "/ping");
    REQUIRE(seen[0].correlation_id == "req-123");
    REQUIRE(seen[1].correlation_id == "req-123");
    REQUIRE(seen[0].elapsed.has_value());

    for (const auto& request : transport->requests()) {
        REQUIRE(request.header("X-Request-ID") == std::optional<std::string>{"req-123"});
    }
}

TEST_CASE("Correlation ids differ between invocations", "[client][interceptor]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    HttpResponse ok;
    ok.meta.status_code = 200;
    transport->set_fallback(ok);

    std::vector<std::string> ids;
    auto config = test_config().with_request_interceptor(
        make_request_interceptor([&](HttpRequest request, const AttemptContext& context) {
            ids.push_back(context.correlation_id);
            return InterceptResult<HttpRequest>{std::move(request)};
        }));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());
    REQUIRE(run_sync(io, client.invoke(endpoint)).has_value());

    REQUIRE(ids.size() == 2);
    REQUIRE(ids[0] != ids[1]);
    REQUIRE(transport->last_request()->header("X-Request-ID").has_value() == false);
}

TEST_CASE("Interceptor faults end the invocation", "[client][interceptor]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->set_fallback(HttpResponse{});

    SECTION("Cancelled by a request interceptor") {
        auto config = test_config().with_request_interceptor(
            make_request_interceptor([](HttpRequest, const AttemptContext&) -> InterceptResult<HttpRequest> {
                return tl::unexpected(InterceptorFault::cancelled());
            }));
        Client client(std::move(config), transport);

        const Ping endpoint{};
        auto result = run_sync(io, client.invoke(endpoint));
        REQUIRE(result.error().code() == ClientErrorCode::Cancelled);
        REQUIRE(transport->request_count() == 0);
    }

    SECTION("Failed request interceptor") {
        auto config = test_config().with_request_interceptor(
            make_request_interceptor([](HttpRequest, const AttemptContext&) -> InterceptResult<HttpRequest> {
                return tl::unexpected(InterceptorFault::failed("token refresh failed"));
            }));
        Client client(std::move(config), transport);

        const Ping endpoint{};
        auto result = run_sync(io, client.invoke(endpoint));
        REQUIRE(result.error().code() == ClientErrorCode::NetworkError);
        REQUIRE(result.error().message() == "token refresh failed");
        REQUIRE(transport->request_count() == 0);
    }

    SECTION("Throwing response interceptor") {
        auto config = test_config().with_response_interceptor(
            make_response_interceptor([](HttpResponse, const AttemptContext&) -> InterceptResult<HttpResponse> {
                throw std::runtime_error("interceptor bug");
            }));
        Client client(std::move(config), transport);

        const Ping endpoint{};
        auto result = run_sync(io, client.invoke(endpoint));
        REQUIRE(result.error().code() == ClientErrorCode::NetworkError);
        REQUIRE(result.error().message() == "interceptor bug");
        REQUIRE(transport->request_count() == 1);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation and invalid requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("invoke with a cancelled token sends nothing", "[client][invoke][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    Client client(test_config(), transport);

    CancellationSource source;
    source.cancel();

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint, source.token()));

    REQUIRE(result.error().code() == ClientErrorCode::Cancelled);
    REQUIRE(transport->request_count() == 0);
}

TEST_CASE("invoke cancelled during backoff stops waiting", "[client][invoke][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    HttpResponse failing;
    failing.meta.status_code = 503;
    transport->set_fallback(failing);

    auto config = ClientConfig{}
        .with_base_url("https://api.example.com")
        .with_retry_policy(RetryPolicy{}.with_max_retries(3).with_base_delay(10s));
    Client client(std::move(config), transport);

    CancellationSource source;
    asio::steady_timer timer(io, 20ms);
    timer.async_wait([&](const asio::error_code&) { source.cancel(); });

    const Ping endpoint{};
    const auto started = std::chrono::steady_clock::now();
    auto result = run_sync(io, client.invoke(endpoint, source.token()));

    REQUIRE(result.error().code() == ClientErrorCode::Cancelled);
    REQUIRE(transport->request_count() == 1);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("invoke cancelled while the response is intercepted", "[client][invoke][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(200, "");

    CancellationSource source;
    auto config = test_config().with_response_interceptor(
        make_response_interceptor([&](HttpResponse response, const AttemptContext&) {
            source.cancel();
            return InterceptResult<HttpResponse>{std::move(response)};
        }));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint, source.token()));
    REQUIRE(result.error().code() == ClientErrorCode::Cancelled);
}

TEST_CASE("invoke rejects requests that cannot be built", "[client][invoke]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    Client client(ClientConfig{}, transport);

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint));

    REQUIRE(result.error().code() == ClientErrorCode::InvalidRequest);
    REQUIRE(result.error().is_retryable() == false);
    REQUIRE(transport->request_count() == 0);
}

TEST_CASE("Client requires a transport", "[client]") {
    REQUIRE_THROWS_AS(Client(ClientConfig{}, nullptr), std::invalid_argument);
}
