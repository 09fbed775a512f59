#include "wcpp/client/interceptor.hpp"

namespace wcpp {

namespace {

class HookRequestInterceptor final : public IRequestInterceptor {
public:
    explicit HookRequestInterceptor(RequestHook hook) : hook_(std::move(hook)) {}

    asio::awaitable<InterceptResult<HttpRequest>> intercept(
        HttpRequest request,
        const AttemptContext& context
    ) override {
        co_return hook_(std::move(request), context);
    }

private:
    RequestHook hook_;
};

class HookResponseInterceptor final : public IResponseInterceptor {
public:
    explicit HookResponseInterceptor(ResponseHook hook) : hook_(std::move(hook)) {}

    asio::awaitable<InterceptResult<HttpResponse>> intercept(
        HttpResponse response,
        const AttemptContext& context
    ) override {
        co_return hook_(std::move(response), context);
    }

private:
    ResponseHook hook_;
};

}  // namespace

std::shared_ptr<IRequestInterceptor> make_request_interceptor(RequestHook hook) {
    return std::make_shared<HookRequestInterceptor>(std::move(hook));
}

std::shared_ptr<IResponseInterceptor> make_response_interceptor(ResponseHook hook) {
    return std::make_shared<HookResponseInterceptor>(std::move(hook));
}

asio::awaitable<InterceptResult<HttpRequest>> InterceptorChain::run_request(
    HttpRequest request,
    const AttemptContext& context
) const {
    for (const auto& interceptor : request_) {
        auto next = co_await interceptor->intercept(std::move(request), context);
        if (!next) {
            co_return tl::unexpected(std::move(next.error()));
        }
        request = std::move(*next);
    }
    co_return request;
}

asio::awaitable<InterceptResult<HttpResponse>> InterceptorChain::run_response(
    HttpResponse response,
    const AttemptContext& context
) const {
    for (const auto& interceptor : response_) {
        auto next = co_await interceptor->intercept(std::move(response), context);
        if (!next) {
            co_return tl::unexpected(std::move(next.error()));
        }
        response = std::move(*next);
    }
    co_return response;
}

}  // namespace wcpp
