#include "docwire/transport/http_connection.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace docwire {

    namespace {
        template <typename S>
        void arm_timeout(S& stream,
                         std::optional<std::chrono::milliseconds> timeout) {
            if (timeout) {
                beast::get_lowest_layer(stream).expires_after(*timeout);
            } else {
                beast::get_lowest_layer(stream).expires_never();
            }
        }
    }  // namespace

    HttpRequest make_post_request(
        const Endpoint& endpoint, const std::string& target,
        const std::string& user_agent,
        const std::map<std::string, std::string>& headers, std::string body) {
        HttpRequest req;
        req.version(11);
        req.method(http::verb::post);
        req.target(target);
        req.set(http::field::host, endpoint.host);
        req.set(http::field::user_agent, user_agent);
        req.set(http::field::content_type, "application/json");
        req.keep_alive(true);
        for (const auto& [k, v] : headers) req.set(k, v);
        req.body() = std::move(body);
        req.prepare_payload();
        return req;
    }

    Error error_from_ec(const boost::system::error_code& ec) {
        if (ec == beast::error::timeout) {
            return Error{Error::Code::DeadlineExceeded, ec.message()};
        }
        return Error{Error::Code::Unavailable, ec.message()};
    }

    HttpConnection::HttpConnection(
        boost::asio::any_io_executor executor,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx, Endpoint endpoint)
        : m_ex(std::move(executor)),
          m_ssl_ctx(std::move(ssl_ctx)),
          m_endpoint(std::move(endpoint)) {
        m_endpoint.normalize();
    }

    void HttpConnection::close() noexcept {
        boost::system::error_code ec;
        if (auto* plain = std::get_if<HttpStream>(&m_stream)) {
            plain->socket().shutdown(tcp::socket::shutdown_both, ec);
            plain->socket().close(ec);
        } else if (auto* tls = std::get_if<HttpsStream>(&m_stream)) {
            beast::get_lowest_layer(*tls).socket().shutdown(
                tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*tls).socket().close(ec);
        }
        m_stream.emplace<std::monostate>();
        m_parser.reset();
    }

    bool HttpConnection::is_healthy() const noexcept {
        if (m_parser) return false;
        if (auto* plain = std::get_if<HttpStream>(&m_stream)) {
            return plain->socket().is_open();
        }
        if (auto* tls = std::get_if<HttpsStream>(&m_stream)) {
            return beast::get_lowest_layer(*tls).socket().is_open();
        }
        return false;
    }

    boost::asio::awaitable<boost::system::error_code>
    HttpConnection::ensure_connected() {
        boost::system::error_code ec;
        if (is_healthy()) co_return ec;
        close();

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            m_endpoint.host, m_endpoint.port,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return ec;

        if (!m_endpoint.https) {
            auto& s = m_stream.emplace<HttpStream>(m_ex);
            co_await s.async_connect(
                results,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) close();
            co_return ec;
        }

        auto& s = m_stream.emplace<HttpsStream>(m_ex, *m_ssl_ctx);
        co_await beast::get_lowest_layer(s).async_connect(
            results, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !set_sni(s, m_endpoint.host, ec)) {
            close();
            co_return ec;
        }

        co_await s.async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) close();
        co_return ec;
    }

    boost::asio::awaitable<Result<HttpResponse>> HttpConnection::request(
        const HttpRequest& req,
        std::optional<std::chrono::milliseconds> timeout) {
        auto ec = co_await ensure_connected();
        if (ec) co_return Result<HttpResponse>::err(error_from_ec(ec));

        http::response<http::string_body> res;
        ec = co_await with_stream(
            [&](auto& s) -> boost::asio::awaitable<boost::system::error_code> {
                boost::system::error_code e;
                arm_timeout(s, timeout);
                co_await http::async_write(
                    s, req,
                    boost::asio::redirect_error(boost::asio::use_awaitable, e));
                if (!e) {
                    m_buffer.clear();
                    co_await http::async_read(
                        s, m_buffer, res,
                        boost::asio::redirect_error(boost::asio::use_awaitable,
                                                    e));
                }
                beast::get_lowest_layer(s).expires_never();
                co_return e;
            });
        if (ec) {
            close();
            co_return Result<HttpResponse>::err(error_from_ec(ec));
        }

        if (!res.keep_alive()) close();
        co_return Result<HttpResponse>::ok(HttpResponse{
            static_cast<int>(res.result_int()), std::move(res.body())});
    }

    boost::asio::awaitable<Result<int>> HttpConnection::start_stream(
        const HttpRequest& req,
        std::optional<std::chrono::milliseconds> timeout) {
        auto ec = co_await ensure_connected();
        if (ec) co_return Result<int>::err(error_from_ec(ec));

        m_parser.emplace();
        m_parser->body_limit(boost::none);

        ec = co_await with_stream(
            [&](auto& s) -> boost::asio::awaitable<boost::system::error_code> {
                boost::system::error_code e;
                arm_timeout(s, timeout);
                co_await http::async_write(
                    s, req,
                    boost::asio::redirect_error(boost::asio::use_awaitable, e));
                if (!e) {
                    m_buffer.clear();
                    co_await http::async_read_header(
                        s, m_buffer, *m_parser,
                        boost::asio::redirect_error(boost::asio::use_awaitable,
                                                    e));
                }
                // The body may stay open for as long as the stream lives.
                beast::get_lowest_layer(s).expires_never();
                co_return e;
            });
        if (ec) {
            close();
            co_return Result<int>::err(error_from_ec(ec));
        }
        co_return Result<int>::ok(
            static_cast<int>(m_parser->get().result_int()));
    }

    boost::asio::awaitable<Result<std::optional<std::string>>>
    HttpConnection::next_chunk() {
        using R = Result<std::optional<std::string>>;

        while (m_parser) {
            std::string& body = m_parser->get().body();
            if (!body.empty()) {
                std::string chunk = std::move(body);
                body.clear();
                co_return R::ok(std::move(chunk));
            }

            if (m_parser->is_done()) {
                const bool keep_alive = m_parser->keep_alive();
                m_parser.reset();
                if (!keep_alive) close();
                break;
            }

            auto ec = co_await with_stream(
                [&](auto& s)
                    -> boost::asio::awaitable<boost::system::error_code> {
                    boost::system::error_code e;
                    co_await http::async_read_some(
                        s, m_buffer, *m_parser,
                        boost::asio::redirect_error(boost::asio::use_awaitable,
                                                    e));
                    co_return e;
                });
            if (ec) {
                close();
                co_return R::err(error_from_ec(ec));
            }
        }
        co_return R::ok(std::nullopt);
    }

}  // namespace docwire
