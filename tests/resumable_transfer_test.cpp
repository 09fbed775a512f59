#include <catch2/catch_test_macros.hpp>

#include "wcpp/transfer/resumable_transfer.hpp"

#include "mocks/mock_transport.hpp"
#include "test_support.hpp"

#include <asio/co_spawn.hpp>

#include <optional>
#include <string>

using namespace wcpp;
using namespace wcpp::testing;

namespace {

struct Fixture {
    asio::io_context io;
    ScratchDir scratch;
    std::shared_ptr<MockTransferTask> task = std::make_shared<MockTransferTask>();
    std::shared_ptr<ResumableTransfer<>> transfer;

    Fixture() {
        transfer = std::make_shared<ResumableTransfer<>>(io.get_executor(), scratch.path() / "out" / "file.bin");
        transfer->attach(task);
    }

    ResponseMetadata ok() const {
        ResponseMetadata meta;
        meta.status_code = 200;
        return meta;
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Pause and cancel
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Pausing a download yields its resume token", "[transfer]") {
    Fixture f;
    f.task->token_on_cancel = ResumeToken{"resume-here"};

    f.transfer->on_progress(100, 1000);
    REQUIRE(f.transfer->progress().bytes_transferred == 100);
    REQUIRE(f.transfer->progress().total_bytes == std::optional<std::int64_t>{1000});
    REQUIRE(f.transfer->progress().percentage_string() == std::optional<std::string>{"10%"});

    auto token = run_sync(f.io, f.transfer->pause());

    REQUIRE(token == std::optional<ResumeToken>{"resume-here"});
    REQUIRE(f.transfer->status() == TransferStatus::Paused);
    REQUIRE(f.task->cancel_calls == 1);
    REQUIRE(f.task->last_wanted_token);

    auto state = f.transfer->state();
    REQUIRE(std::get<transfer_state::Paused>(state).resume_token == "resume-here");

    SECTION("cancel() after pausing changes nothing") {
        f.transfer->cancel();
        REQUIRE(f.transfer->status() == TransferStatus::Paused);
        REQUIRE(f.task->cancel_calls == 1);
    }

    SECTION("A second pause yields nothing") {
        REQUIRE(run_sync(f.io, f.transfer->pause()).has_value() == false);
        REQUIRE(f.transfer->status() == TransferStatus::Paused);
    }

    SECTION("result() reports a cancelled error") {
        auto outcome = run_sync(f.io, f.transfer->result());
        REQUIRE(outcome.has_value() == false);
        REQUIRE(outcome.error().code() == ClientErrorCode::Cancelled);
    }
}

TEST_CASE("Pausing without a token ends the download", "[transfer]") {
    Fixture f;

    auto token = run_sync(f.io, f.transfer->pause());

    REQUIRE(token.has_value() == false);
    REQUIRE(f.transfer->status() == TransferStatus::Cancelled);
}

TEST_CASE("Pause settles from the task's late reply", "[transfer]") {
    Fixture f;
    f.task->defer_cancel_reply = true;

    std::optional<std::optional<ResumeToken>> token;
    asio::co_spawn(f.io, f.transfer->pause(), [&](std::exception_ptr, std::optional<ResumeToken> value) {
        token.emplace(std::move(value));
    });
    f.io.poll();
    REQUIRE(token.has_value() == false);
    REQUIRE(f.transfer->status() == TransferStatus::Downloading);

    // The cancelled fault that a stopping task reports is not a failure
    f.transfer->on_failed(TransportFault::cancelled(), std::nullopt);
    REQUIRE(f.transfer->status() == TransferStatus::Downloading);

    f.task->reply(ResumeToken{"late"});
    f.io.run();

    REQUIRE(token == std::optional<std::optional<ResumeToken>>{ResumeToken{"late"}});
    REQUIRE(f.transfer->status() == TransferStatus::Paused);
}

TEST_CASE("Cancelling a download discards it", "[transfer]") {
    Fixture f;
    f.transfer->on_progress(100, 1000);

    f.transfer->cancel();

    REQUIRE(f.transfer->status() == TransferStatus::Cancelled);
    REQUIRE(f.task->cancel_calls == 1);
    REQUIRE(f.task->last_wanted_token == false);

    auto outcome = run_sync(f.io, f.transfer->result());
    REQUIRE(outcome.error().code() == ClientErrorCode::Cancelled);

    SECTION("Terminal states ignore later callbacks") {
        auto file = f.scratch.write("late.bin", "late");
        f.transfer->on_progress(900, 1000);
        f.transfer->on_finished(file, f.ok());
        f.transfer->on_failed(TransportFault::timed_out(), std::nullopt);

        REQUIRE(f.transfer->status() == TransferStatus::Cancelled);
        REQUIRE(f.transfer->progress().bytes_transferred == 100);
        REQUIRE(std::filesystem::exists(f.transfer->destination()) == false);
    }

    SECTION("pause() after cancelling yields nothing") {
        REQUIRE(run_sync(f.io, f.transfer->pause()).has_value() == false);
        REQUIRE(f.task->cancel_calls == 1);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Completion and failure
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A finished download is moved to its destination", "[transfer]") {
    Fixture f;
    auto file = f.scratch.write("partial.tmp", "payload");

    f.transfer->on_finished(file, f.ok());

    REQUIRE(f.transfer->status() == TransferStatus::Completed);
    REQUIRE(std::filesystem::exists(file) == false);
    REQUIRE(read_file(f.transfer->destination()) == "payload");

    auto outcome = run_sync(f.io, f.transfer->result());
    REQUIRE(outcome.has_value());
    REQUIRE(*outcome == f.transfer->destination());

    // Same outcome on every call
    auto again = run_sync(f.io, f.transfer->result());
    REQUIRE(*again == *outcome);
}

TEST_CASE("A non-success status fails the download", "[transfer]") {
    Fixture f;
    auto file = f.scratch.write("partial.tmp", "not found");
    ResponseMetadata meta;
    meta.status_code = 404;

    f.transfer->on_finished(file, meta);

    REQUIRE(f.transfer->status() == TransferStatus::Failed);
    auto outcome = run_sync(f.io, f.transfer->result());
    REQUIRE(outcome.error().code() == ClientErrorCode::ServerError);
    REQUIRE(outcome.error().status_code() == 404);
}

TEST_CASE("A transport failure keeps the resume token", "[transfer]") {
    Fixture f;

    f.transfer->on_failed(TransportFault::connection_lost(), ResumeToken{"continue"});

    REQUIRE(f.transfer->status() == TransferStatus::Failed);
    auto state = f.transfer->state();
    const auto& failed = std::get<transfer_state::Failed<std::monostate>>(state);
    REQUIRE(failed.error.code() == ClientErrorCode::Offline);
    REQUIRE(failed.resume_token == std::optional<ResumeToken>{"continue"});
}

TEST_CASE("Every result() waiter sees the outcome", "[transfer]") {
    Fixture f;

    std::vector<ResumableTransfer<>::Outcome> outcomes;
    for (int i = 0; i < 3; ++i) {
        asio::co_spawn(f.io, f.transfer->result(),
            [&](std::exception_ptr, ResumableTransfer<>::Outcome outcome) {
                outcomes.push_back(std::move(outcome));
            });
    }
    f.io.poll();
    REQUIRE(outcomes.empty());

    f.transfer->on_failed(TransportFault::timed_out(), std::nullopt);
    f.io.run();

    REQUIRE(outcomes.size() == 3);
    for (const auto& outcome : outcomes) {
        REQUIRE(outcome.error().code() == ClientErrorCode::Timeout);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Progress
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Progress updates end with the download", "[transfer][progress]") {
    Fixture f;
    auto updates = f.transfer->progress_updates();

    f.transfer->on_progress(10, 0);
    auto first = run_sync(f.io, updates.next());
    REQUIRE(first.has_value());
    REQUIRE(first->bytes_transferred == 10);
    REQUIRE(first->total_bytes.has_value() == false);
    REQUIRE(first->fraction_completed().has_value() == false);

    f.transfer->on_progress(50, 100);
    auto second = run_sync(f.io, updates.next());
    REQUIRE(second->fraction_completed() == std::optional<double>{0.5});

    f.transfer->cancel();
    auto end = run_sync(f.io, updates.next());
    REQUIRE(end.has_value() == false);
    REQUIRE(updates.ended());
}

TEST_CASE("progress_updates() can be taken once", "[transfer][progress]") {
    Fixture f;
    auto first = f.transfer->progress_updates();
    auto second = f.transfer->progress_updates();

    REQUIRE(first.ended() == false);
    REQUIRE(second.ended());
    REQUIRE(run_sync(f.io, second.next()).has_value() == false);
}

TEST_CASE("A full progress buffer drops updates but keeps the latest", "[transfer][progress]") {
    asio::io_context io;
    ScratchDir scratch;
    auto transfer = std::make_shared<ResumableTransfer<>>(io.get_executor(), scratch.path() / "f", 1);
    auto updates = transfer->progress_updates();

    transfer->on_progress(1, 10);
    transfer->on_progress(2, 10);
    transfer->on_progress(3, 10);

    REQUIRE(transfer->progress().bytes_transferred == 3);
    auto first = run_sync(io, updates.next());
    REQUIRE(first->bytes_transferred == 1);
}
