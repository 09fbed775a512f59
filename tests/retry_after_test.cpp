#include <catch2/catch_test_macros.hpp>

#include "wcpp/client/client.hpp"
#include "wcpp/interceptors/retry_after.hpp"

#include "mocks/mock_transport.hpp"
#include "test_support.hpp"

#include <chrono>
#include <vector>

using namespace wcpp;
using namespace wcpp::testing;
using namespace std::chrono_literals;

namespace {

// Wed, 21 Oct 2015 07:28:00 GMT
const auto kFixedNow = std::chrono::system_clock::from_time_t(1445412480);

ResponseMetadata with_retry_after(int status, std::string value) {
    ResponseMetadata meta;
    meta.status_code = status;
    meta.headers["retry-after"] = std::move(value);
    return meta;
}

struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    RetryAfterInterceptor::Sleeper sleeper() const {
        auto recorded = delays;
        return [recorded](std::chrono::milliseconds delay) -> asio::awaitable<void> {
            recorded->push_back(delay);
            co_return;
        };
    }
};

struct Ping : Endpoint<std::monostate> {
    std::string path() const override { return "/ping"; }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// parse_retry_after
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_retry_after reads delta-seconds", "[retry_after]") {
    REQUIRE(parse_retry_after("120", kFixedNow) == std::optional<std::chrono::milliseconds>{120s});
    REQUIRE(parse_retry_after(" 0 ", kFixedNow) == std::optional<std::chrono::milliseconds>{0ms});
    REQUIRE(parse_retry_after("-5", kFixedNow).has_value() == false);
    REQUIRE(parse_retry_after("1.5", kFixedNow).has_value() == false);
}

TEST_CASE("parse_retry_after reads HTTP dates", "[retry_after]") {
    REQUIRE(parse_retry_after("Wed, 21 Oct 2015 07:28:30 GMT", kFixedNow) ==
            std::optional<std::chrono::milliseconds>{30s});
    REQUIRE(parse_retry_after("Wed, 21 Oct 2015 07:00:00 GMT", kFixedNow) ==
            std::optional<std::chrono::milliseconds>{0ms});
}

TEST_CASE("parse_retry_after rejects anything else", "[retry_after]") {
    REQUIRE(parse_retry_after("", kFixedNow).has_value() == false);
    REQUIRE(parse_retry_after("soon", kFixedNow).has_value() == false);
    REQUIRE(parse_retry_after("21/10/2015", kFixedNow).has_value() == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// RetryAfterInterceptor
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("delay_for honours the header within bounds", "[retry_after]") {
    RetryAfterOptions options;
    options.default_delay = 2s;
    options.max_delay = 10s;
    RetryAfterInterceptor interceptor(options, [] { return kFixedNow; });

    REQUIRE(interceptor.delay_for(with_retry_after(429, "3")) == 3s);
    REQUIRE(interceptor.delay_for(with_retry_after(429, "600")) == 10s);
    REQUIRE(interceptor.delay_for(with_retry_after(429, "garbage")) == 2s);
    REQUIRE(interceptor.delay_for(with_retry_after(429, "Wed, 21 Oct 2015 07:28:05 GMT")) == 5s);

    ResponseMetadata bare;
    bare.status_code = 429;
    REQUIRE(interceptor.delay_for(bare) == 2s);
}

TEST_CASE("The interceptor only acts on 429", "[retry_after]") {
    asio::io_context io;
    RecordingSleeper sleeper;
    RetryAfterInterceptor interceptor({}, [] { return kFixedNow; }, sleeper.sleeper());

    AttemptContext context;
    context.path = "/ping";

    SECTION("Other statuses pass through") {
        HttpResponse response;
        response.meta = with_retry_after(503, "1");
        response.body = "busy";

        auto result = run_sync(io, interceptor.intercept(response, context));

        REQUIRE(result.has_value());
        REQUIRE(result->body == "busy");
        REQUIRE(sleeper.delays->empty());
    }

    SECTION("429 waits and asks for a retry") {
        HttpResponse response;
        response.meta = with_retry_after(429, "7");

        auto result = run_sync(io, interceptor.intercept(response, context));

        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().kind == InterceptorFault::Kind::RetryRequested);
        REQUIRE(*sleeper.delays == std::vector<std::chrono::milliseconds>{7s});
    }
}

TEST_CASE("A client with the interceptor retries rate-limited requests", "[retry_after][client]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>();
    transport->queue_response(429, "", {{"Retry-After", "4"}});
    transport->queue_response(200, "");

    RecordingSleeper sleeper;
    auto config = ClientConfig{}
        .with_base_url("https://api.example.com")
        .with_retry_policy(RetryPolicy::none().with_max_retries(1))
        .with_response_interceptor(std::make_shared<RetryAfterInterceptor>(
            RetryAfterOptions{}, RetryAfterInterceptor::Clock{}, sleeper.sleeper()));
    Client client(std::move(config), transport);

    const Ping endpoint{};
    auto result = run_sync(io, client.invoke(endpoint));

    REQUIRE(result.has_value());
    REQUIRE(transport->request_count() == 2);
    REQUIRE(*sleeper.delays == std::vector<std::chrono::milliseconds>{4s});
}
