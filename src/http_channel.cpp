#include "docwire/transport/http_channel.hpp"

#include "docwire/logging.hpp"
#include "docwire/retry.hpp"

namespace docwire {

    namespace {
        constexpr std::size_t kMaxIdleConnections = 8;

        /// Body of a streamed response, pulled chunk by chunk.
        class HttpRawStream : public RawStream {
           public:
            HttpRawStream(std::shared_ptr<HttpConnection> conn,
                          std::weak_ptr<HttpChannel> owner)
                : m_conn(std::move(conn)), m_owner(std::move(owner)) {}

            ~HttpRawStream() override { end(); }

            boost::asio::awaitable<StreamEvent> read() override {
                if (!m_conn) co_return StreamEvent::end_event();

                auto chunk = co_await m_conn->next_chunk();
                if (chunk.has_error()) {
                    m_conn.reset();
                    co_return StreamEvent::error_event(chunk.error());
                }
                if (!chunk.value()) {
                    if (auto owner = m_owner.lock()) {
                        owner->check_in(std::move(m_conn));
                    }
                    m_conn.reset();
                    co_return StreamEvent::end_event();
                }
                co_return StreamEvent::data_event(std::move(*chunk.value()));
            }

            boost::asio::awaitable<Result<void>> write(
                std::string /*message*/) override {
                co_return Result<void>::err(
                    Error{Error::Code::Unimplemented,
                          "Client messages require a bidirectional stream"});
            }

            void end() noexcept override {
                // Abandoning a body halfway leaves the connection unusable.
                if (m_conn) m_conn->close();
                m_conn.reset();
            }

           private:
            std::shared_ptr<HttpConnection> m_conn;
            std::weak_ptr<HttpChannel> m_owner;
        };
    }  // namespace

    Error error_from_http_response(int status, const std::string& body) {
        Error err{code_from_http_status(status), body};
        if (err.message.empty()) {
            err.message = "HTTP status " + std::to_string(status);
        }
        return err;
    }

    HttpChannel::HttpChannel(boost::asio::any_io_executor ex,
                             RpcClientConfiguration cfg)
        : m_ex(std::move(ex)),
          m_cfg(std::move(cfg)),
          m_ssl_ctx(std::make_shared<boost::asio::ssl::context>(
              boost::asio::ssl::context::tls_client)),
          m_base(url_utils::parse_base_url(m_cfg.base_url)) {
        init_tls_context(*m_ssl_ctx, m_cfg.verify_tls);
        if (m_base.has_value()) {
            m_endpoint.host = m_base.value().host;
            m_endpoint.port = m_base.value().port;
            m_endpoint.https = m_base.value().https;
            m_endpoint.normalize();
        } else {
            log_warn("HttpChannel", {}, "Invalid base_url '{}': {}",
                     m_cfg.base_url, m_base.error().message);
        }
    }

    RpcClient::ChannelFactory HttpChannel::factory(
        boost::asio::any_io_executor ex, RpcClientConfiguration cfg) {
        return [ex = std::move(ex), cfg = std::move(cfg)]()
                   -> std::shared_ptr<RpcChannel> {
            return HttpChannel::create(ex, cfg);
        };
    }

    std::shared_ptr<HttpConnection> HttpChannel::check_out() {
        while (!m_idle.empty()) {
            auto conn = std::move(m_idle.back());
            m_idle.pop_back();
            if (conn->is_healthy()) return conn;
        }
        return std::make_shared<HttpConnection>(m_ex, m_ssl_ctx, m_endpoint);
    }

    void HttpChannel::check_in(std::shared_ptr<HttpConnection> conn) {
        if (!conn || m_closed || !conn->is_healthy() ||
            m_idle.size() >= kMaxIdleConnections) {
            return;
        }
        m_idle.push_back(std::move(conn));
    }

    Result<HttpRequest> HttpChannel::build_request(
        const std::string& method, std::string body,
        const CallOptions& options) const {
        if (m_base.has_error()) return m_base.forward_error<HttpRequest>();

        UrlComponents url = url_utils::join(
            m_base.value(), m_cfg.database_path() + "/documents:" + method);
        std::string target = url_utils::append_query(url.target, options.query);

        return Result<HttpRequest>::ok(make_post_request(
            m_endpoint, target, m_cfg.user_agent, options.headers,
            std::move(body)));
    }

    boost::asio::awaitable<Result<std::string>> HttpChannel::unary(
        std::string method, std::string request, CallOptions options) {
        if (!options.retry) {
            co_return co_await unary_once(std::move(method), std::move(request),
                                          std::move(options));
        }

        RetrySettings retry = *options.retry;
        co_return co_await with_retries(
            std::move(retry), method, std::string{},
            [&]() { return unary_once(method, request, options); });
    }

    boost::asio::awaitable<Result<std::string>> HttpChannel::unary_once(
        std::string method, std::string request, CallOptions options) {
        if (m_closed) {
            co_return Result<std::string>::err(
                Error{Error::Code::Cancelled, "The channel has been closed"});
        }

        auto req = build_request(method, std::move(request), options);
        if (req.has_error()) co_return req.forward_error<std::string>();

        auto conn = check_out();
        auto res = co_await conn->request(req.value(), options.timeout);
        if (res.has_error()) co_return res.forward_error<std::string>();

        check_in(std::move(conn));

        HttpResponse& response = res.value();
        if (response.status < 200 || response.status >= 300) {
            co_return Result<std::string>::err(
                error_from_http_response(response.status, response.body));
        }
        co_return Result<std::string>::ok(std::move(response.body));
    }

    boost::asio::awaitable<Result<std::unique_ptr<RawStream>>>
    HttpChannel::open_stream(std::string method,
                             std::optional<std::string> request,
                             CallOptions options) {
        using R = Result<std::unique_ptr<RawStream>>;

        if (!request) {
            co_return R::err(Error{
                Error::Code::Unimplemented,
                "Bidirectional streams are not supported over HTTP/1.1"});
        }
        if (m_closed) {
            co_return R::err(
                Error{Error::Code::Cancelled, "The channel has been closed"});
        }

        auto req = build_request(method, std::move(*request), options);
        if (req.has_error()) co_return req.forward_error<std::unique_ptr<RawStream>>();

        auto conn = check_out();
        auto status = co_await conn->start_stream(req.value(), options.timeout);
        if (status.has_error()) {
            co_return status.forward_error<std::unique_ptr<RawStream>>();
        }

        if (status.value() < 200 || status.value() >= 300) {
            std::string body;
            for (;;) {
                auto chunk = co_await conn->next_chunk();
                if (chunk.has_error() || !chunk.value()) break;
                body += *chunk.value();
            }
            check_in(std::move(conn));
            co_return R::err(error_from_http_response(status.value(), body));
        }

        co_return R::ok(
            std::make_unique<HttpRawStream>(std::move(conn), weak_from_this()));
    }

    boost::asio::awaitable<Result<void>> HttpChannel::close() {
        m_closed = true;
        for (auto& conn : m_idle) conn->close();
        m_idle.clear();
        co_return Result<void>::ok();
    }

}  // namespace docwire
