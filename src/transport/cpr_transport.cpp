#include "wcpp/transport/cpr_transport.hpp"

#include "wcpp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <fstream>
#include <mutex>
#include <random>
#include <system_error>
#include <variant>

namespace wcpp {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Session setup
// ─────────────────────────────────────────────────────────────────────────────

cpr::Header to_cpr_headers(const HeaderMap& headers) {
    cpr::Header cpr_headers;
    for (const auto& [name, value] : headers) {
        cpr_headers[name] = value;
    }
    return cpr_headers;
}

HeaderMap from_cpr_headers(const cpr::Header& headers) {
    HeaderMap result;
    for (const auto& [name, value] : headers) {
        result[name] = value;
    }
    return result;
}

cpr::SslOptions make_ssl_options(const TlsConfig& tls) {
    cpr::SslOptions options;
    options.SetOption(cpr::ssl::VerifyPeer{tls.verify_peer});
    options.SetOption(cpr::ssl::VerifyHost{tls.verify_host});
    if (tls.ca_cert_path.has_value()) {
        options.SetOption(cpr::ssl::CaInfo{std::string{*tls.ca_cert_path}});
    }
    if (tls.client_cert_path.has_value()) {
        options.SetOption(cpr::ssl::CertFile{std::string{*tls.client_cert_path}});
    }
    if (tls.client_key_path.has_value()) {
        options.SetOption(cpr::ssl::KeyFile{std::string{*tls.client_key_path}});
    }
    return options;
}

void configure_session(cpr::Session& session, const HttpRequest& request, const CprTransportConfig& config) {
    session.SetUrl(cpr::Url{request.url});
    session.SetHeader(to_cpr_headers(request.headers));
    if (request.body.has_value()) {
        session.SetBody(cpr::Body{*request.body});
    }
    session.SetConnectTimeout(cpr::ConnectTimeout{config.connect_timeout});
    // Zero disables the overall deadline.
    session.SetTimeout(cpr::Timeout{request.timeout});
    session.SetRedirect(cpr::Redirect{config.follow_redirects});
    session.SetSslOptions(make_ssl_options(config.tls));
}

cpr::Response perform(cpr::Session& session, HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:     return session.Get();
        case HttpMethod::Post:    return session.Post();
        case HttpMethod::Put:     return session.Put();
        case HttpMethod::Patch:   return session.Patch();
        case HttpMethod::Delete:  return session.Delete();
        case HttpMethod::Head:    return session.Head();
        case HttpMethod::Options: return session.Options();
    }
    return session.Get();
}

TransportFault fault_from(const cpr::Error& error) {
    const bool timed_out = (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT);
    return classify_curl_failure(timed_out, error.message);
}

bool has_failed(const cpr::Response& response) {
    return response.error.code != cpr::ErrorCode::OK;
}

// ─────────────────────────────────────────────────────────────────────────────
// HeaderCollector
// ─────────────────────────────────────────────────────────────────────────────
// Fed raw header lines by curl. A new status line (redirect, 100-continue)
// starts the header block over.

struct HeaderCollector {
    int status{0};
    HeaderMap headers;

    void consume(std::string_view line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            return;
        }

        if (line.starts_with("HTTP/")) {
            headers.clear();
            status = 0;
            const auto space = line.find(' ');
            if (space != std::string_view::npos) {
                const auto code = line.substr(space + 1, 3);
                std::from_chars(code.data(), code.data() + code.size(), status);
            }
            return;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return;
        }
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }

        const std::string_view name = line.substr(0, colon);
        const auto existing = std::ranges::find_if(headers, [&name](const auto& entry) {
            return header_name_equals(entry.first, name);
        });
        if (existing != headers.end()) {
            existing->second.append(", ").append(value);
        } else {
            headers.emplace(std::string{name}, std::string{value});
        }
    }

    [[nodiscard]] ResponseMetadata metadata(std::string url) const {
        return ResponseMetadata{status, headers, std::move(url)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Streaming pipe
// ─────────────────────────────────────────────────────────────────────────────
// The worker thread pushes the response head, then body chunks, then an end
// marker or a fault. Pushes block while the reader is behind, so a slow
// consumer slows the transfer instead of growing a buffer.

struct EndOfBody {};

using PipeEvent = std::variant<ResponseMetadata, std::string, EndOfBody, TransportFault>;

struct StreamPipe {
    using Channel = asio::experimental::concurrent_channel<void(asio::error_code, PipeEvent)>;

    StreamPipe(const asio::any_io_executor& executor, std::size_t capacity)
        : channel(executor, capacity) {}

    /// False once the reader has gone away.
    bool push(PipeEvent event) {
        if (closed.load()) {
            return false;
        }
        try {
            channel.async_send(asio::error_code{}, std::move(event), asio::use_future).get();
            return true;
        } catch (const std::system_error&) {
            return false;
        }
    }

    void close() noexcept {
        closed.store(true);
        channel.close();
    }

    Channel channel;
    std::atomic<bool> closed{false};
};

class CprByteSource final : public IByteSource {
public:
    explicit CprByteSource(std::shared_ptr<StreamPipe> pipe)
        : pipe_(std::move(pipe)) {}

    ~CprByteSource() override {
        close();
    }

    asio::awaitable<TransportResult<std::optional<std::string>>> next_chunk() override {
        if (finished_) {
            co_return std::optional<std::string>{};
        }
        if (pipe_->closed.load()) {
            co_return tl::unexpected(TransportFault::cancelled());
        }

        while (true) {
            asio::error_code ec;
            PipeEvent event = co_await pipe_->channel.async_receive(asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                co_return tl::unexpected(TransportFault::cancelled());
            }

            if (auto* chunk = std::get_if<std::string>(&event)) {
                co_return std::optional<std::string>{std::move(*chunk)};
            }
            if (std::holds_alternative<EndOfBody>(event)) {
                finished_ = true;
                co_return std::optional<std::string>{};
            }
            if (auto* fault = std::get_if<TransportFault>(&event)) {
                finished_ = true;
                co_return tl::unexpected(std::move(*fault));
            }
            // A second head cannot be produced; skip it.
        }
    }

    void close() noexcept override {
        pipe_->close();
    }

private:
    std::shared_ptr<StreamPipe> pipe_;
    bool finished_{false};
};

void run_streaming(StreamPipe& pipe, const HttpRequest& request, const CprTransportConfig& config) {
    cpr::Session session;
    configure_session(session, request, config);

    HeaderCollector collector;
    bool head_sent = false;
    const auto publish_head = [&]() {
        if (head_sent) {
            return true;
        }
        head_sent = true;
        return pipe.push(collector.metadata(request.url));
    };

    session.SetHeaderCallback(cpr::HeaderCallback{[&](const auto& line, auto) {
        collector.consume(std::string_view{line});
        return pipe.closed.load() == false;
    }});
    session.SetWriteCallback(cpr::WriteCallback{[&](const auto& data, auto) {
        if (publish_head() == false) {
            return false;
        }
        return pipe.push(std::string{std::string_view{data}});
    }});

    const cpr::Response response = perform(session, request.method);
    if (pipe.closed.load()) {
        return;
    }

    if (has_failed(response)) {
        pipe.push(fault_from(response.error));
        return;
    }

    if (head_sent == false) {
        head_sent = true;
        ResponseMetadata meta{static_cast<int>(response.status_code), from_cpr_headers(response.header),
                              response.url.str()};
        if (pipe.push(std::move(meta)) == false) {
            return;
        }
    }
    pipe.push(EndOfBody{});
}

// ─────────────────────────────────────────────────────────────────────────────
// Downloads
// ─────────────────────────────────────────────────────────────────────────────

constexpr int kResumeTokenVersion = 1;

std::string random_file_stem() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";
    std::string stem = "wcpp-";
    for (int i = 0; i < 16; ++i) {
        stem.push_back(kHex[rng() & 0xF]);
    }
    return stem;
}

struct DownloadPlan {
    HttpRequest request;
    std::filesystem::path partial_path;
    std::int64_t offset{0};
    /// ETag or Last-Modified of the original response, sent as If-Range.
    std::optional<std::string> validator;
};

ResumeToken encode_resume_token(const DownloadPlan& plan, std::int64_t offset,
                                const std::optional<std::string>& validator) {
    nlohmann::json headers = nlohmann::json::object();
    for (const auto& [name, value] : plan.request.headers) {
        headers[name] = value;
    }

    nlohmann::json token = {
        {"version", kResumeTokenVersion},
        {"method", std::string{to_string(plan.request.method)}},
        {"url", plan.request.url},
        {"headers", std::move(headers)},
        {"timeout_ms", plan.request.timeout.count()},
        {"partial_path", plan.partial_path.string()},
        {"offset", offset},
    };
    if (plan.request.body.has_value()) {
        token["body"] = *plan.request.body;
    }
    if (validator.has_value()) {
        token["validator"] = *validator;
    }
    return token.dump();
}

std::optional<HttpMethod> parse_method(std::string_view name) {
    for (const auto method : {HttpMethod::Get, HttpMethod::Post, HttpMethod::Put, HttpMethod::Patch,
                              HttpMethod::Delete, HttpMethod::Head, HttpMethod::Options}) {
        if (to_string(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

TransportResult<DownloadPlan> decode_resume_token(const ResumeToken& token) {
    const auto invalid = [](std::string why) {
        return tl::unexpected(TransportFault::other("Invalid resume token: " + std::move(why)));
    };

    const auto document = nlohmann::json::parse(token, nullptr, false);
    if (document.is_discarded() || document.is_object() == false) {
        return invalid("not a JSON object");
    }
    if (document.value("version", 0) != kResumeTokenVersion) {
        return invalid("unsupported version");
    }

    try {
        DownloadPlan plan;
        const auto method = parse_method(document.at("method").get<std::string>());
        if (method.has_value() == false) {
            return invalid("unknown method");
        }
        plan.request.method = *method;
        plan.request.url = document.at("url").get<std::string>();
        for (const auto& item : document.at("headers").items()) {
            plan.request.headers[item.key()] = item.value().get<std::string>();
        }
        plan.request.timeout = std::chrono::milliseconds{document.at("timeout_ms").get<std::int64_t>()};
        if (document.contains("body")) {
            plan.request.body = document.at("body").get<std::string>();
        }
        plan.partial_path = document.at("partial_path").get<std::string>();
        plan.offset = document.at("offset").get<std::int64_t>();
        if (document.contains("validator")) {
            plan.validator = document.at("validator").get<std::string>();
        }
        if (plan.offset < 0) {
            return invalid("negative offset");
        }
        return plan;
    } catch (const nlohmann::json::exception& e) {
        return invalid(e.what());
    }
}

class CprDownloadTask final : public ITransferTask, public std::enable_shared_from_this<CprDownloadTask> {
public:
    CprDownloadTask(asio::thread_pool& pool, CprTransportConfig config, DownloadPlan plan,
                    std::weak_ptr<ITransferObserver> observer)
        : pool_(pool)
        , config_(std::move(config))
        , plan_(std::move(plan))
        , observer_(std::move(observer)) {}

    void start() override {
        {
            std::lock_guard lock(mutex_);
            if (phase_ != Phase::Idle) {
                return;
            }
            phase_ = Phase::Running;
        }
        asio::post(pool_, [self = shared_from_this()]() { self->run(); });
    }

    void cancel(bool produce_resume_token, CancelCallback on_cancelled) override {
        std::unique_lock lock(mutex_);
        switch (phase_) {
            case Phase::Running:
                stop_requested_.store(true);
                want_token_ = produce_resume_token;
                on_cancelled_ = std::move(on_cancelled);
                return;

            case Phase::Idle: {
                phase_ = Phase::Done;
                lock.unlock();
                std::optional<ResumeToken> token;
                if (produce_resume_token && plan_.offset > 0) {
                    token = encode_resume_token(plan_, plan_.offset, plan_.validator);
                }
                on_cancelled(std::move(token));
                return;
            }

            case Phase::Done:
                lock.unlock();
                on_cancelled(std::nullopt);
                return;
        }
    }

private:
    enum class Phase { Idle, Running, Done };

    void run() {
        std::error_code fs_error;
        std::filesystem::create_directories(plan_.partial_path.parent_path(), fs_error);

        const bool resuming = plan_.offset > 0;
        std::ofstream out(plan_.partial_path,
                          std::ios::binary | (resuming ? std::ios::app : std::ios::trunc));
        if (out.is_open() == false) {
            finish(TransportFault::other("Cannot open " + plan_.partial_path.string() + " for writing"),
                   0, std::nullopt);
            return;
        }

        HttpRequest request = plan_.request;
        if (resuming) {
            set_header(request.headers, "Range", "bytes=" + std::to_string(plan_.offset) + "-");
            if (plan_.validator.has_value()) {
                set_header(request.headers, "If-Range", *plan_.validator);
            }
        }

        cpr::Session session;
        configure_session(session, request, config_);

        HeaderCollector collector;
        std::int64_t written = plan_.offset;
        std::int64_t reported = -1;
        bool body_started = false;
        bool write_failed = false;

        session.SetHeaderCallback(cpr::HeaderCallback{[&](const auto& line, auto) {
            collector.consume(std::string_view{line});
            return stop_requested_.load() == false;
        }});

        session.SetWriteCallback(cpr::WriteCallback{[&](const auto& data, auto) {
            if (stop_requested_.load()) {
                return false;
            }
            if (body_started == false) {
                body_started = true;
                // The server ignored the range and sent the whole body.
                if (resuming && collector.status != 206) {
                    out.close();
                    out.open(plan_.partial_path, std::ios::binary | std::ios::trunc);
                    written = 0;
                }
            }
            const std::string_view bytes{data};
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!out) {
                write_failed = true;
                return false;
            }
            written += static_cast<std::int64_t>(bytes.size());
            return true;
        }});

        session.SetProgressCallback(cpr::ProgressCallback{[&](auto download_total, auto, auto, auto, auto) {
            if (stop_requested_.load()) {
                return false;
            }
            if (written != reported) {
                reported = written;
                const std::int64_t base = (collector.status == 206) ? plan_.offset : 0;
                const std::int64_t total =
                    download_total > 0 ? base + static_cast<std::int64_t>(download_total) : 0;
                if (auto observer = observer_.lock()) {
                    observer->on_progress(written, total);
                }
            }
            return true;
        }});

        const cpr::Response response = perform(session, request.method);
        out.close();

        if (write_failed) {
            finish(TransportFault::other("Failed writing to " + plan_.partial_path.string()), written,
                   validator_of(collector));
            return;
        }
        if (has_failed(response)) {
            finish(fault_from(response.error), written, validator_of(collector));
            return;
        }

        ResponseMetadata meta{static_cast<int>(response.status_code), from_cpr_headers(response.header),
                              response.url.str()};
        finish_success(std::move(meta));
    }

    [[nodiscard]] static std::optional<std::string> validator_of(const HeaderCollector& collector) {
        if (auto etag = get_header(collector.headers, "ETag")) {
            return etag;
        }
        return get_header(collector.headers, "Last-Modified");
    }

    /// Returns the pending cancel callback if cancel() stopped the transfer.
    std::optional<CancelCallback> mark_done(bool& want_token) {
        std::lock_guard lock(mutex_);
        phase_ = Phase::Done;
        want_token = want_token_;
        if (stop_requested_.load() && on_cancelled_) {
            return std::move(on_cancelled_);
        }
        return std::nullopt;
    }

    void finish(TransportFault fault, std::int64_t written, std::optional<std::string> validator) {
        bool want_token = false;
        auto on_cancelled = mark_done(want_token);
        const bool have_bytes = written > 0;

        if (on_cancelled.has_value()) {
            std::optional<ResumeToken> token;
            if (want_token && have_bytes) {
                token = encode_resume_token(plan_, written, validator.has_value() ? validator : plan_.validator);
            } else {
                discard_partial();
            }
            (*on_cancelled)(std::move(token));
            return;
        }

        auto observer = observer_.lock();
        if (!observer) {
            discard_partial();
            return;
        }

        std::optional<ResumeToken> token;
        if (have_bytes && fault.code != TransportFault::Code::Cancelled) {
            token = encode_resume_token(plan_, written, validator.has_value() ? validator : plan_.validator);
        } else {
            discard_partial();
        }
        WCPP_LOG_DEBUG(Transport, "Download of " + plan_.request.url + " failed: " + fault.message);
        observer->on_failed(fault, std::move(token));
    }

    void finish_success(ResponseMetadata meta) {
        bool want_token = false;
        auto on_cancelled = mark_done(want_token);
        if (on_cancelled.has_value()) {
            // Stopped after the last byte arrived. Nothing is left to resume.
            discard_partial();
            (*on_cancelled)(std::nullopt);
            return;
        }

        auto observer = observer_.lock();
        if (!observer) {
            discard_partial();
            return;
        }
        observer->on_finished(plan_.partial_path, meta);
    }

    void discard_partial() noexcept {
        std::error_code ec;
        std::filesystem::remove(plan_.partial_path, ec);
    }

    asio::thread_pool& pool_;
    CprTransportConfig config_;
    DownloadPlan plan_;
    std::weak_ptr<ITransferObserver> observer_;

    std::mutex mutex_;
    Phase phase_{Phase::Idle};
    std::atomic<bool> stop_requested_{false};
    bool want_token_{false};
    CancelCallback on_cancelled_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Failure classification
// ─────────────────────────────────────────────────────────────────────────────
// curl error codes differ between cpr releases, so beyond timeouts the
// message text decides.

TransportFault classify_curl_failure(bool timed_out, const std::string& message) {
    if (timed_out) {
        return TransportFault::timed_out(message);
    }

    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto mentions = [&](std::string_view needle) {
        return lowered.find(needle) != std::string::npos;
    };

    if (mentions("timed out") || mentions("timeout")) {
        return TransportFault::timed_out(message);
    }
    if (mentions("resolve")) {
        return TransportFault::dns_failure(message);
    }
    if (mentions("network is unreachable") || mentions("no route to host")) {
        return TransportFault::no_connection(message);
    }
    if (mentions("connection refused") || mentions("couldn't connect") || mentions("could not connect") ||
        mentions("failed to connect")) {
        return TransportFault::host_unreachable(message);
    }
    if (mentions("reset") || mentions("recv") || mentions("send failure") || mentions("empty reply") ||
        mentions("connection died") || mentions("partial file") || mentions("connection closed")) {
        return TransportFault::connection_lost(message);
    }
    if (mentions("aborted by callback") || mentions("callback aborted")) {
        return TransportFault{TransportFault::Code::Cancelled, message};
    }
    return TransportFault::other(message);
}

// ─────────────────────────────────────────────────────────────────────────────
// CprTransport
// ─────────────────────────────────────────────────────────────────────────────

CprTransport::CprTransport(CprTransportConfig config)
    : config_(std::move(config))
    , pool_(std::max<std::size_t>(config_.worker_threads, 1)) {}

CprTransport::~CprTransport() {
    pool_.join();
}

asio::awaitable<TransportResult<HttpResponse>> CprTransport::send(HttpRequest request) {
    co_return co_await asio::co_spawn(
        pool_.get_executor(),
        [this, request = std::move(request)]() -> asio::awaitable<TransportResult<HttpResponse>> {
            cpr::Session session;
            configure_session(session, request, config_);
            const cpr::Response response = perform(session, request.method);
            if (has_failed(response)) {
                log_for(LogTopic::Transport).debug("{} {} failed: {}",
                    to_string(request.method), request.url, response.error.message);
                co_return tl::unexpected(fault_from(response.error));
            }

            HttpResponse result;
            result.body = response.text;
            result.meta.status_code = static_cast<int>(response.status_code);
            result.meta.headers = from_cpr_headers(response.header);
            result.meta.url = response.url.str();
            co_return result;
        },
        asio::use_awaitable);
}

asio::awaitable<TransportResult<StreamingResponse>> CprTransport::send_streaming(HttpRequest request) {
    auto executor = co_await asio::this_coro::executor;
    auto pipe = std::make_shared<StreamPipe>(executor, std::max<std::size_t>(config_.stream_buffer_chunks, 1));
    log_for(LogTopic::Transport).debug("Opening stream {} {}", to_string(request.method), request.url);

    asio::post(pool_, [pipe, request = std::move(request), config = config_]() {
        run_streaming(*pipe, request, config);
    });

    asio::error_code ec;
    PipeEvent event = co_await pipe->channel.async_receive(asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        pipe->close();
        co_return tl::unexpected(TransportFault::cancelled());
    }

    if (auto* meta = std::get_if<ResponseMetadata>(&event)) {
        co_return StreamingResponse{std::move(*meta), std::make_unique<CprByteSource>(pipe)};
    }
    pipe->close();
    if (auto* fault = std::get_if<TransportFault>(&event)) {
        co_return tl::unexpected(std::move(*fault));
    }
    co_return tl::unexpected(TransportFault::other("Response body arrived before its headers"));
}

TransportResult<std::shared_ptr<ITransferTask>> CprTransport::make_download(
    HttpRequest request,
    std::weak_ptr<ITransferObserver> observer
) {
    DownloadPlan plan;
    plan.request = std::move(request);
    plan.partial_path = config_.download_directory / (random_file_stem() + ".part");
    return std::make_shared<CprDownloadTask>(pool_, config_, std::move(plan), std::move(observer));
}

TransportResult<std::shared_ptr<ITransferTask>> CprTransport::make_resumed_download(
    const ResumeToken& token,
    std::weak_ptr<ITransferObserver> observer
) {
    auto plan = decode_resume_token(token);
    if (!plan) {
        return tl::unexpected(plan.error());
    }

    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(plan->partial_path, ec);
    if (ec) {
        return tl::unexpected(TransportFault::other("Partial download " + plan->partial_path.string() + " is missing"));
    }
    if (static_cast<std::int64_t>(on_disk) < plan->offset) {
        plan->offset = static_cast<std::int64_t>(on_disk);
    } else if (static_cast<std::int64_t>(on_disk) > plan->offset) {
        std::filesystem::resize_file(plan->partial_path, static_cast<std::uintmax_t>(plan->offset), ec);
        if (ec) {
            return tl::unexpected(TransportFault::other("Cannot truncate " + plan->partial_path.string()));
        }
    }

    log_for(LogTopic::Transport).debug("Resuming {} at byte {}", plan->request.url, plan->offset);
    return std::make_shared<CprDownloadTask>(pool_, config_, std::move(*plan), std::move(observer));
}

}  // namespace wcpp
