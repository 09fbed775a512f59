#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport abstraction
// ═══════════════════════════════════════════════════════════════════════════
// The client never opens sockets itself. It hands fully built requests to an
// ITransport and receives either a buffered response, a live byte source, or
// a download task that reports back through ITransferObserver callbacks.
//
// Callbacks into ITransferObserver may arrive on any thread.

#include "wcpp/http/http_types.hpp"
#include "wcpp/transport/transport_error.hpp"

#include <asio/awaitable.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace wcpp {

/// Opaque bytes letting a stopped download continue where it left off.
using ResumeToken = std::string;

// ─────────────────────────────────────────────────────────────────────────────
// IByteSource
// ─────────────────────────────────────────────────────────────────────────────

class IByteSource {
public:
    virtual ~IByteSource() = default;

    /// Next chunk of the body, or nullopt once the body is exhausted.
    /// Chunks may split lines, UTF-8 sequences, or CRLF pairs anywhere.
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::optional<std::string>>> next_chunk() = 0;

    /// Stops the underlying transfer. Later next_chunk() calls report Cancelled.
    virtual void close() noexcept = 0;
};

struct StreamingResponse {
    ResponseMetadata meta;
    std::unique_ptr<IByteSource> body;
};

// ─────────────────────────────────────────────────────────────────────────────
// Downloads
// ─────────────────────────────────────────────────────────────────────────────

class ITransferObserver {
public:
    virtual ~ITransferObserver() = default;

    /// `total_expected` <= 0 means the size is unknown.
    virtual void on_progress(std::int64_t bytes_written, std::int64_t total_expected) = 0;

    /// The body is complete and stored at `location`, a file the receiver now owns.
    virtual void on_finished(const std::filesystem::path& location, const ResponseMetadata& meta) = 0;

    virtual void on_failed(const TransportFault& fault, std::optional<ResumeToken> resume_token) = 0;
};

class ITransferTask {
public:
    using CancelCallback = std::function<void(std::optional<ResumeToken>)>;

    virtual ~ITransferTask() = default;

    virtual void start() = 0;

    /// Stops the transfer. With `produce_resume_token` the task tries to build
    /// a token for the bytes written so far. `on_cancelled` runs exactly once,
    /// possibly on another thread, and the task reports nothing afterwards.
    virtual void cancel(bool produce_resume_token, CancelCallback on_cancelled) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ITransport
// ─────────────────────────────────────────────────────────────────────────────

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::awaitable<TransportResult<HttpResponse>> send(HttpRequest request) = 0;

    /// Resolves once the status line and headers are available.
    [[nodiscard]] virtual asio::awaitable<TransportResult<StreamingResponse>> send_streaming(HttpRequest request) = 0;

    /// Creates a download task that has not been started yet.
    [[nodiscard]] virtual TransportResult<std::shared_ptr<ITransferTask>> make_download(
        HttpRequest request,
        std::weak_ptr<ITransferObserver> observer
    ) = 0;

    /// Creates a task that continues from a token produced by an earlier task.
    [[nodiscard]] virtual TransportResult<std::shared_ptr<ITransferTask>> make_resumed_download(
        const ResumeToken& token,
        std::weak_ptr<ITransferObserver> observer
    ) = 0;
};

}  // namespace wcpp
