#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// CprTransport
// ═══════════════════════════════════════════════════════════════════════════
// ITransport over cpr (libcurl). cpr calls block, so they run on a private
// thread pool and hand results back to the awaiting coroutine's executor.
// Streaming bodies and download progress cross back through channels.

#include "wcpp/transport/transport.hpp"

#include <asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace wcpp {

struct TlsConfig {
    bool verify_peer{true};
    bool verify_host{true};
    /// PEM bundle used instead of the system store.
    std::optional<std::string> ca_cert_path;
    std::optional<std::string> client_cert_path;
    std::optional<std::string> client_key_path;
};

struct CprTransportConfig {
    std::chrono::milliseconds connect_timeout{10'000};
    bool follow_redirects{true};
    TlsConfig tls;

    std::size_t worker_threads{4};

    /// Chunks a streaming body may run ahead of its reader.
    std::size_t stream_buffer_chunks{16};

    /// Where in-progress downloads are written.
    std::filesystem::path download_directory{std::filesystem::temp_directory_path()};

    CprTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    CprTransportConfig& with_ca_cert(std::string path) {
        tls.ca_cert_path = std::move(path);
        return *this;
    }

    CprTransportConfig& with_worker_threads(std::size_t threads) {
        worker_threads = threads;
        return *this;
    }

    CprTransportConfig& with_download_directory(std::filesystem::path directory) {
        download_directory = std::move(directory);
        return *this;
    }
};

class CprTransport final : public ITransport {
public:
    explicit CprTransport(CprTransportConfig config = {});
    ~CprTransport() override;

    CprTransport(const CprTransport&) = delete;
    CprTransport& operator=(const CprTransport&) = delete;

    [[nodiscard]] asio::awaitable<TransportResult<HttpResponse>> send(HttpRequest request) override;

    [[nodiscard]] asio::awaitable<TransportResult<StreamingResponse>> send_streaming(HttpRequest request) override;

    [[nodiscard]] TransportResult<std::shared_ptr<ITransferTask>> make_download(
        HttpRequest request,
        std::weak_ptr<ITransferObserver> observer
    ) override;

    [[nodiscard]] TransportResult<std::shared_ptr<ITransferTask>> make_resumed_download(
        const ResumeToken& token,
        std::weak_ptr<ITransferObserver> observer
    ) override;

    [[nodiscard]] const CprTransportConfig& config() const noexcept { return config_; }

private:
    CprTransportConfig config_;
    asio::thread_pool pool_;
};

/// Fault for a curl/cpr failure, classified from its code and message.
[[nodiscard]] TransportFault classify_curl_failure(bool timed_out, const std::string& message);

}  // namespace wcpp
