#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docwire/config.hpp"
#include "docwire/result.hpp"
#include "docwire/rpc/channel.hpp"
#include "docwire/rpc/rpc_client.hpp"
#include "docwire/transport/endpoint.hpp"
#include "docwire/transport/http_connection.hpp"
#include "docwire/transport/url.hpp"

namespace docwire {

    /**
     * @brief RpcChannel over the database's REST endpoint (HTTP/1.1).
     *
     * Unary calls are `POST {base}/{database}/documents:{method}`.
     * Unidirectional streams POST the request and deliver the response body
     * as it arrives. Bidirectional streams need HTTP/2 and are reported as
     * Unimplemented.
     *
     * Connections are kept alive and reused between calls; concurrent calls
     * each get their own connection.
     */
    class HttpChannel : public RpcChannel,
                        public std::enable_shared_from_this<HttpChannel> {
       public:
        /// @brief Use create(); the channel must be owned by a shared_ptr.
        HttpChannel(boost::asio::any_io_executor ex,
                    RpcClientConfiguration cfg);

        static std::shared_ptr<HttpChannel> create(
            boost::asio::any_io_executor ex, RpcClientConfiguration cfg) {
            return std::make_shared<HttpChannel>(std::move(ex), std::move(cfg));
        }

        /// @brief Factory suitable for RpcClient.
        static RpcClient::ChannelFactory factory(
            boost::asio::any_io_executor ex, RpcClientConfiguration cfg);

        boost::asio::awaitable<Result<std::string>> unary(
            std::string method, std::string request,
            CallOptions options) override;

        boost::asio::awaitable<Result<std::unique_ptr<RawStream>>> open_stream(
            std::string method, std::optional<std::string> request,
            CallOptions options) override;

        boost::asio::awaitable<Result<void>> close() override;

        /// @brief Keep-alive connections waiting for the next call.
        std::size_t idle_connections() const noexcept { return m_idle.size(); }

        /// @brief Return a connection that finished its exchange.
        void check_in(std::shared_ptr<HttpConnection> conn);

       private:
        std::shared_ptr<HttpConnection> check_out();

        Result<HttpRequest> build_request(const std::string& method,
                                          std::string body,
                                          const CallOptions& options) const;

        boost::asio::awaitable<Result<std::string>> unary_once(
            std::string method, std::string request, CallOptions options);

        boost::asio::any_io_executor m_ex;
        RpcClientConfiguration m_cfg;
        std::shared_ptr<boost::asio::ssl::context> m_ssl_ctx;
        Result<UrlComponents> m_base;
        Endpoint m_endpoint;
        std::vector<std::shared_ptr<HttpConnection>> m_idle;
        bool m_closed{false};
    };

    /// @brief Build the error for a non-2xx HTTP response.
    Error error_from_http_response(int status, const std::string& body);

}  // namespace docwire
