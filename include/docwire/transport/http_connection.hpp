#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "docwire/result.hpp"
#include "docwire/transport/endpoint.hpp"

namespace docwire {

    /** @brief Status and body of a completed HTTP exchange. */
    struct HttpResponse {
        int status{0};
        std::string body;
    };

    using HttpRequest =
        boost::beast::http::request<boost::beast::http::string_body>;

    /// @brief Build a keep-alive POST request for `target` on `endpoint`.
    HttpRequest make_post_request(const Endpoint& endpoint,
                                  const std::string& target,
                                  const std::string& user_agent,
                                  const std::map<std::string, std::string>& headers,
                                  std::string body);

    /// @brief Map a transport failure to an RPC error (timeouts become
    /// DeadlineExceeded, everything else Unavailable).
    Error error_from_ec(const boost::system::error_code& ec);

    /**
     * @brief One keep-alive HTTP/1.1 connection, plain or TLS.
     *
     * Connects lazily on first use and reconnects after the peer closed.
     * Besides whole request/response exchanges it can read a response body
     * incrementally (start_stream() then next_chunk()).
     *
     * Not thread-safe; one exchange at a time.
     */
    class HttpConnection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // not connected yet
                                    HttpStream, HttpsStream>;
        using Parser = boost::beast::http::response_parser<
            boost::beast::http::string_body>;

       public:
        /**
         * @brief Constructs an HttpConnection.
         * @param executor The executor to use.
         * @param ssl_ctx TLS context, shared by the channel's connections.
         * @param endpoint The target endpoint.
         */
        HttpConnection(boost::asio::any_io_executor executor,
                       std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                       Endpoint endpoint);

        HttpConnection(const HttpConnection&) = delete;
        HttpConnection& operator=(const HttpConnection&) = delete;

        ~HttpConnection() noexcept { close(); }

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept;

        /// @brief True if the socket is open and no streamed body is
        /// pending.
        bool is_healthy() const noexcept;

        const Endpoint& endpoint() const noexcept { return m_endpoint; }

        /// @brief Send `req` and read the whole response.
        boost::asio::awaitable<Result<HttpResponse>> request(
            const HttpRequest& req,
            std::optional<std::chrono::milliseconds> timeout);

        /// @brief Send `req` and read only the response header.
        /// @return The HTTP status; the body follows through next_chunk().
        boost::asio::awaitable<Result<int>> start_stream(
            const HttpRequest& req,
            std::optional<std::chrono::milliseconds> timeout);

        /// @brief Next piece of a streamed body, or std::nullopt once the
        /// body is complete.
        boost::asio::awaitable<Result<std::optional<std::string>>>
        next_chunk();

       private:
        boost::asio::awaitable<boost::system::error_code> ensure_connected();

        template <typename F>
        auto with_stream(F&& f) {
            if (auto* tls = std::get_if<HttpsStream>(&m_stream)) return f(*tls);
            return f(std::get<HttpStream>(m_stream));
        }

        boost::asio::any_io_executor m_ex;
        std::shared_ptr<boost::asio::ssl::context> m_ssl_ctx;
        Endpoint m_endpoint;
        boost::beast::flat_buffer m_buffer;
        std::optional<Parser> m_parser;
        Stream m_stream;
    };

}  // namespace docwire
