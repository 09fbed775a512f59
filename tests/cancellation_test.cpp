#include <catch2/catch_test_macros.hpp>

#include "wcpp/async/cancellation.hpp"

#include "test_support.hpp"

#include <asio/post.hpp>

#include <chrono>

using namespace wcpp;
using namespace wcpp::testing;
using namespace std::chrono_literals;

TEST_CASE("A default token is never cancelled", "[async][cancel]") {
    CancellationToken token;
    REQUIRE(token.is_cancelled() == false);
    REQUIRE(token.can_be_cancelled() == false);

    bool ran = false;
    auto registration = token.on_cancel([&] { ran = true; });
    REQUIRE(ran == false);
}

TEST_CASE("Cancelling runs callbacks once", "[async][cancel]") {
    CancellationSource source;
    auto token = source.token();

    int calls = 0;
    auto registration = token.on_cancel([&] { ++calls; });

    source.cancel();
    source.cancel();

    REQUIRE(token.is_cancelled());
    REQUIRE(source.is_cancelled());
    REQUIRE(calls == 1);
}

TEST_CASE("Registering after cancellation runs immediately", "[async][cancel]") {
    CancellationSource source;
    source.cancel();

    bool ran = false;
    auto registration = source.token().on_cancel([&] { ran = true; });
    REQUIRE(ran);
}

TEST_CASE("A dropped registration is not called", "[async][cancel]") {
    CancellationSource source;
    bool ran = false;
    {
        auto registration = source.token().on_cancel([&] { ran = true; });
    }
    source.cancel();
    REQUIRE(ran == false);
}

TEST_CASE("sleep_for completes without cancellation", "[async][cancel][sleep]") {
    asio::io_context io;
    REQUIRE(run_sync(io, sleep_for(1ms)) == true);
}

TEST_CASE("sleep_for wakes early when cancelled", "[async][cancel][sleep]") {
    asio::io_context io;
    CancellationSource source;

    asio::post(io, [&] { source.cancel(); });

    const auto started = std::chrono::steady_clock::now();
    const bool slept = run_sync(io, sleep_for(10s, source.token()));

    REQUIRE(slept == false);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("sleep_for on a cancelled token returns at once", "[async][cancel][sleep]") {
    asio::io_context io;
    CancellationSource source;
    source.cancel();

    REQUIRE(run_sync(io, sleep_for(10s, source.token())) == false);
}
