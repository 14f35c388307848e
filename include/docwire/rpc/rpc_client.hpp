#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docwire/config.hpp"
#include "docwire/error.hpp"
#include "docwire/pool/resource_pool.hpp"
#include "docwire/result.hpp"
#include "docwire/rpc/call_options.hpp"
#include "docwire/rpc/channel.hpp"
#include "docwire/rpc/duplex_stream.hpp"

namespace docwire {

    /**
     * @brief Entry point for database calls. Multiplexes unary and
     * streaming calls over a pool of RpcChannel instances.
     *
     * Every call carries the routing header and the configured default
     * headers, then passes through the configured interceptors.
     *
     * Must be driven from the thread running its executor.
     */
    class RpcClient {
       public:
        using ChannelFactory = std::function<std::shared_ptr<RpcChannel>()>;
        using Pool = ResourcePool<RpcChannel>;

        /**
         * @brief Constructs an RpcClient.
         * @param ex The executor driving every call.
         * @param cfg Client configuration.
         * @param factory Creates a new backend channel when the pool needs
         * one. Channels are closed through RpcChannel::close().
         */
        RpcClient(boost::asio::any_io_executor ex, RpcClientConfiguration cfg,
                  ChannelFactory factory);

        RpcClient(const RpcClient&) = delete;
        RpcClient& operator=(const RpcClient&) = delete;

        /**
         * @brief Issue a request/response call on a pooled channel.
         * @param retry_codes When set, the channel retries these codes using
         * retry_params(method).
         * @return The response bytes, or the call's error.
         */
        boost::asio::awaitable<Result<std::string>> unary_call(
            std::string method, std::string request, std::string tag,
            std::optional<std::vector<Error::Code>> retry_codes =
                std::nullopt);

        /**
         * @brief Open a stream and return it once it has proven healthy.
         *
         * Opening is retried with backoff up to `max_stream_attempts` times
         * unless the error is permanent for `method` or the client has been
         * terminated. The pooled channel stays reserved until the returned
         * stream ends.
         * @throws std::logic_error if the channel factory returns a null or
         * already pooled channel.
         */
        boost::asio::awaitable<Result<DuplexStreamPtr>> stream_call(
            std::string method, std::string request, std::string tag);

        /// @brief Wait for outstanding calls, then close every channel.
        boost::asio::awaitable<Result<void>> terminate();

        /// @brief Options used for a call to `method`.
        CallOptions create_call_options(
            std::string_view method,
            const std::optional<std::vector<Error::Code>>& retry_codes) const;

        /// @brief True for methods whose streams carry client messages.
        static bool is_bidirectional(std::string_view method);

        const std::string& database_path() const noexcept {
            return m_database_path;
        }

        const RpcClientConfiguration& config() const noexcept { return m_cfg; }

        const Pool& pool() const noexcept { return *m_pool; }

       private:
        static boost::asio::awaitable<void> stream_attempt(
            std::shared_ptr<Pool> pool, std::string method,
            std::string request, bool bidirectional, std::string tag,
            CallOptions options,
            std::shared_ptr<Deferred<Result<DuplexStreamPtr>>> result);

        boost::asio::any_io_executor m_ex;
        RpcClientConfiguration m_cfg;
        std::string m_database_path;
        std::shared_ptr<Pool> m_pool;
    };

}  // namespace docwire
