#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "docwire/error.hpp"
#include "docwire/result.hpp"
#include "docwire/rpc/call_options.hpp"

namespace docwire {

    /**
     * @brief One event pulled from a stream.
     */
    struct StreamEvent {
        enum class Kind : std::uint8_t {
            Data,  /**< A message; `data` holds its bytes. */
            End,   /**< The backend finished the stream. */
            Error  /**< The stream failed; `error` holds the reason. */
        };

        Kind kind{Kind::End};
        std::string data;
        std::optional<Error> error;

        static StreamEvent data_event(std::string bytes) {
            return StreamEvent{Kind::Data, std::move(bytes), std::nullopt};
        }

        static StreamEvent end_event() { return StreamEvent{}; }

        static StreamEvent error_event(Error err) {
            return StreamEvent{Kind::Error, {}, std::move(err)};
        }

        bool is_data() const noexcept { return kind == Kind::Data; }
        bool is_end() const noexcept { return kind == Kind::End; }
        bool is_error() const noexcept { return kind == Kind::Error; }
    };

    /**
     * @brief A stream as the backend channel opens it, before any health
     * check.
     *
     * read() yields events in order; after End or Error it keeps yielding
     * End. write() is only meaningful on bidirectional streams.
     */
    class RawStream {
       public:
        virtual ~RawStream() = default;

        virtual boost::asio::awaitable<StreamEvent> read() = 0;

        virtual boost::asio::awaitable<Result<void>> write(
            std::string message) = 0;

        /// @brief Half-close the stream and release its transport.
        virtual void end() noexcept = 0;
    };

    /**
     * @brief Backend stub: one logical connection to the database service.
     *
     * Implementations are pooled by RpcClient and may carry many concurrent
     * calls.
     */
    class RpcChannel {
       public:
        virtual ~RpcChannel() = default;

        /// @brief Issue a request/response call. Honours `options.retry`.
        virtual boost::asio::awaitable<Result<std::string>> unary(
            std::string method, std::string request, CallOptions options) = 0;

        /**
         * @brief Open a stream.
         * @param request Sent with the open for unidirectional streams;
         * std::nullopt for bidirectional ones, which receive their first
         * message through RawStream::write().
         */
        virtual boost::asio::awaitable<Result<std::unique_ptr<RawStream>>>
        open_stream(std::string method, std::optional<std::string> request,
                    CallOptions options) = 0;

        /// @brief Release every transport resource held by the channel.
        virtual boost::asio::awaitable<Result<void>> close() = 0;
    };

}  // namespace docwire
