#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// DecodedStream
// ═══════════════════════════════════════════════════════════════════════════
// Lazy, pull-based sequence of decoded elements over a streaming response.
// Nothing is sent until the first next(); each next() yields one element,
// nullopt at the end of the body, or the error that ended the stream. After
// the end or an error every further next() yields nullopt. A stream cannot be
// restarted.
//
//   auto events = client.event_stream(endpoint, token);
//   while (true) {
//       auto item = co_await events.next();
//       if (!item) { handle(item.error()); break; }
//       if (!*item) break;
//       use(**item);
//   }

#include "wcpp/async/cancellation.hpp"
#include "wcpp/client/client_error.hpp"
#include "wcpp/log/logger.hpp"
#include "wcpp/stream/line_decoder.hpp"
#include "wcpp/transport/transport.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace wcpp {

/// Bytes of an error body that are buffered for decoding before giving up.
inline constexpr std::size_t kDefaultFailureBodyLimit = 1'000'000;

struct DecodedStreamOptions {
    StatusRange success_statuses{StatusRange::success()};
    std::size_t failure_body_limit{kDefaultFailureBodyLimit};
    LineReassemblerOptions lines{};
};

template <typename T, typename Failure = std::monostate>
class DecodedStream {
public:
    using Element = T;
    using Opener = std::function<asio::awaitable<ClientResult<StreamingResponse, Failure>>()>;
    using FailureDecoder = std::function<std::optional<Failure>(std::string_view, const ResponseMetadata&)>;

    DecodedStream(
        Opener open,
        std::unique_ptr<ILineStrategy<T>> strategy,
        FailureDecoder decode_failure,
        DecodedStreamOptions options = {},
        CancellationToken token = {}
    )
        : open_(std::move(open))
        , decoder_(std::move(strategy), options.lines)
        , decode_failure_(std::move(decode_failure))
        , options_(options)
        , token_(std::move(token))
    {}

    /// Decodes a response that is already open.
    [[nodiscard]] static DecodedStream from_response(
        StreamingResponse response,
        std::unique_ptr<ILineStrategy<T>> strategy,
        FailureDecoder decode_failure = {},
        DecodedStreamOptions options = {},
        CancellationToken token = {}
    ) {
        auto held = std::make_shared<StreamingResponse>(std::move(response));
        Opener open = [held]() -> asio::awaitable<ClientResult<StreamingResponse, Failure>> {
            co_return std::move(*held);
        };
        return DecodedStream(std::move(open), std::move(strategy), std::move(decode_failure),
                             options, std::move(token));
    }

    DecodedStream(DecodedStream&&) noexcept = default;
    DecodedStream& operator=(DecodedStream&&) noexcept = default;
    DecodedStream(const DecodedStream&) = delete;
    DecodedStream& operator=(const DecodedStream&) = delete;

    ~DecodedStream() { close_source(); }

    /// The stream object must outlive the returned awaitable.
    [[nodiscard]] asio::awaitable<ClientResult<std::optional<T>, Failure>> next() {
        if (state_ == State::Done) {
            co_return std::optional<T>{};
        }
        if (token_.is_cancelled()) {
            co_return fail(ClientError<Failure>::cancelled());
        }

        if (state_ == State::Idle) {
            auto opened = co_await open_();
            if (!opened) {
                co_return fail(std::move(opened.error()));
            }
            meta_ = std::move(opened->meta);
            source_ = std::move(opened->body);
            state_ = State::Streaming;

            if (options_.success_statuses.contains(meta_->status_code) == false) {
                co_return fail(co_await read_failure());
            }
        }

        while (pending_.empty()) {
            if (source_done_) {
                state_ = State::Done;
                co_return std::optional<T>{};
            }
            if (token_.is_cancelled()) {
                co_return fail(ClientError<Failure>::cancelled());
            }

            auto chunk = co_await source_->next_chunk();
            if (!chunk) {
                co_return fail(ClientError<Failure>::from_transport(chunk.error()));
            }

            const bool exhausted = (chunk->has_value() == false);
            auto batch = exhausted ? decoder_.finish() : decoder_.feed(**chunk);
            source_done_ = exhausted;
            if (!batch) {
                co_return fail(ClientError<Failure>::decoding_error(batch.error().message));
            }
            for (auto& element : *batch) {
                pending_.push_back(std::move(element));
            }
        }

        T element = std::move(pending_.front());
        pending_.pop_front();
        co_return std::optional<T>{std::move(element)};
    }

    /// Stops reading; later next() calls yield nullopt.
    void cancel() noexcept {
        close_source();
        state_ = State::Done;
        pending_.clear();
    }

    [[nodiscard]] bool finished() const noexcept { return state_ == State::Done; }

    /// Status and headers once the response has been opened.
    [[nodiscard]] const std::optional<ResponseMetadata>& response_meta() const noexcept { return meta_; }

private:
    enum class State { Idle, Streaming, Done };

    tl::unexpected<ClientError<Failure>> fail(ClientError<Failure> error) {
        close_source();
        state_ = State::Done;
        pending_.clear();
        return tl::unexpected(std::move(error));
    }

    void close_source() noexcept {
        if (source_) {
            source_->close();
            source_.reset();
        }
    }

    asio::awaitable<ClientError<Failure>> read_failure() {
        std::string body;
        bool truncated = false;
        while (body.size() < options_.failure_body_limit) {
            auto chunk = co_await source_->next_chunk();
            if (!chunk || chunk->has_value() == false) {
                break;
            }
            const auto room = options_.failure_body_limit - body.size();
            if ((*chunk)->size() > room) {
                body.append(**chunk, 0, room);
                truncated = true;
                break;
            }
            body.append(**chunk);
        }
        if (truncated || body.size() >= options_.failure_body_limit) {
            log_for(LogTopic::Stream).debug("Error body of streaming response truncated at {} bytes",
                                   options_.failure_body_limit);
        }

        const int status = meta_->status_code;
        std::optional<Failure> failure;
        if (decode_failure_) {
            failure = decode_failure_(body, *meta_);
        }
        co_return ClientError<Failure>::server_error(status, std::move(failure), std::move(body));
    }

    Opener open_;
    LineDecoder<T> decoder_;
    FailureDecoder decode_failure_;
    DecodedStreamOptions options_;
    CancellationToken token_;

    State state_{State::Idle};
    std::optional<ResponseMetadata> meta_;
    std::unique_ptr<IByteSource> source_;
    std::deque<T> pending_;
    bool source_done_{false};
};

}  // namespace wcpp
