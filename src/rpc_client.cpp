#include "docwire/rpc/rpc_client.hpp"

#include <algorithm>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <exception>

#include "docwire/backoff.hpp"
#include "docwire/logging.hpp"
#include "docwire/retry.hpp"
#include "docwire/rpc/interceptor.hpp"

namespace docwire {

    namespace {
        constexpr std::array<std::string_view, 2> kBidirectionalMethods{
            "listen", "write"};
    }  // namespace

    RpcClient::RpcClient(boost::asio::any_io_executor ex,
                         RpcClientConfiguration cfg, ChannelFactory factory)
        : m_ex(std::move(ex)),
          m_cfg(std::move(cfg)),
          m_database_path(m_cfg.database_path()) {
        m_pool = std::make_shared<Pool>(
            m_ex, m_cfg.pool_config, std::move(factory),
            [](std::shared_ptr<RpcChannel> channel)
                -> boost::asio::awaitable<Result<void>> {
                co_return co_await channel->close();
            });
    }

    bool RpcClient::is_bidirectional(std::string_view method) {
        return std::find(kBidirectionalMethods.begin(),
                         kBidirectionalMethods.end(),
                         method) != kBidirectionalMethods.end();
    }

    CallOptions RpcClient::create_call_options(
        std::string_view method,
        const std::optional<std::vector<Error::Code>>& retry_codes) const {
        CallOptions options;
        options.headers[kResourcePrefixHeader] = m_database_path;
        for (const auto& [k, v] : m_cfg.default_headers) {
            options.headers[k] = v;
        }
        options.timeout = m_cfg.request_timeout;

        if (retry_codes) {
            RetrySettings retry = retry_params(method);
            retry.codes = *retry_codes;
            options.retry = std::move(retry);
        }

        for (const auto& interceptor : m_cfg.interceptors) {
            if (interceptor) interceptor->prepare(options, method);
        }
        return options;
    }

    boost::asio::awaitable<Result<std::string>> RpcClient::unary_call(
        std::string method, std::string request, std::string tag,
        std::optional<std::vector<Error::Code>> retry_codes) {
        CallOptions options = create_call_options(method, retry_codes);

        co_return co_await m_pool->run(
            tag,
            [&](RpcChannel& channel)
                -> boost::asio::awaitable<Result<std::string>> {
                log_debug("RpcClient.unary_call", tag,
                          "Sending {} request: {}", method, request);
                auto response = co_await channel.unary(method, request, options);
                if (response.has_value()) {
                    log_debug("RpcClient.unary_call", tag,
                              "Received response: {}", response.value());
                } else {
                    log_debug("RpcClient.unary_call", tag,
                              "Received error ({}): {}",
                              to_string(response.error().code),
                              response.error().message);
                }
                co_return response;
            });
    }

    boost::asio::awaitable<void> RpcClient::stream_attempt(
        std::shared_ptr<Pool> pool, std::string method, std::string request,
        bool bidirectional, std::string tag, CallOptions options,
        std::shared_ptr<Deferred<Result<DuplexStreamPtr>>> result) {
        auto ex = co_await boost::asio::this_coro::executor;

        auto outcome = co_await pool->run(
            tag,
            [&](RpcChannel& channel) -> boost::asio::awaitable<Result<void>> {
                log_debug("RpcClient.stream_call", tag,
                          "Sending {} request: {}", method, request);

                std::optional<std::string> open_request;
                std::optional<std::string> first_write;
                if (bidirectional) {
                    first_write = request;
                } else {
                    open_request = request;
                }

                auto raw = co_await channel.open_stream(
                    method, std::move(open_request), options);
                if (raw.has_error()) co_return raw.forward_error<void>();

                auto lifetime = Signal::make(ex);
                auto stream = co_await DuplexStream::open(
                    std::move(raw).value(), lifetime, tag,
                    std::move(first_write));
                if (stream.has_error()) co_return stream.forward_error<void>();

                result->set(Result<DuplexStreamPtr>::ok(std::move(stream).value()));
                co_await lifetime->wait();
                co_return Result<void>::ok();
            });

        if (outcome.has_error()) {
            result->set(Result<DuplexStreamPtr>::err(outcome.error()));
        }
    }

    boost::asio::awaitable<Result<DuplexStreamPtr>> RpcClient::stream_call(
        std::string method, std::string request, std::string tag) {
        CallOptions options = create_call_options(method, std::nullopt);
        const bool bidirectional = is_bidirectional(method);
        const std::size_t max_attempts =
            std::max<std::size_t>(m_cfg.max_stream_attempts, 1);

        ExponentialBackoff backoff(m_cfg.stream_backoff);
        std::optional<Error> last_error;

        for (std::size_t attempt = 0; attempt < max_attempts; ++attempt) {
            if (last_error) {
                log_debug("RpcClient.stream_call", tag,
                          "Retrying request that failed with error ({}): {}",
                          to_string(last_error->code), last_error->message);
            }

            auto waited = co_await backoff.backoff_and_wait();
            if (waited.has_error()) {
                if (!last_error) last_error = waited.error();
                break;
            }

            auto result = Deferred<Result<DuplexStreamPtr>>::make(m_ex);
            auto failure = std::make_shared<std::exception_ptr>();
            boost::asio::co_spawn(
                m_ex,
                stream_attempt(m_pool, method, request, bidirectional, tag,
                               options, result),
                [result, failure, tag](std::exception_ptr e) {
                    if (!e) return;
                    if (result->ready()) {
                        log_warn("RpcClient.stream_call", tag,
                                 "Stream channel failed after the stream was "
                                 "returned");
                        return;
                    }
                    *failure = e;
                    result->set(Result<DuplexStreamPtr>::err(
                        Error{Error::Code::Internal, "Stream attempt threw"}));
                });

            // take() so the stream's only owner is the caller.
            auto stream = co_await result->take();
            if (*failure) std::rethrow_exception(*failure);
            if (stream.has_value()) co_return stream;

            last_error = stream.error();
            if (is_permanent_rpc_error(*last_error, method) ||
                m_pool->terminated()) {
                break;
            }
        }

        log_debug("RpcClient.stream_call", tag,
                  "Request failed with error ({}): {}",
                  to_string(last_error->code), last_error->message);
        co_return Result<DuplexStreamPtr>::err(std::move(*last_error));
    }

    boost::asio::awaitable<Result<void>> RpcClient::terminate() {
        co_return co_await m_pool->terminate();
    }

}  // namespace docwire
